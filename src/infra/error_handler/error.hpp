#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace persevere::infra {

enum class ErrorCode {
    // Local or logical failures: never retried
    InvalidArgument,
    FileNotFound,
    AlreadyExists,
    PermissionDenied,
    IoError,
    StateCorrupt,
    SizeMismatch,
    UnsupportedFeature,

    // Remote failures: transient by default
    RemoteFailure,
    NetworkTimeout,

    Unknown,
};

enum class ErrorKind {
    Retryable,
    Unrecoverable,
};

// Exit statuses of the command line tool.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUnrecoverable = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitResumable = 75; // EX_TEMPFAIL

[[nodiscard]] auto default_kind(ErrorCode code) -> ErrorKind;
[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

struct Error {
    ErrorCode code;
    ErrorKind kind;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , kind(default_kind(c))
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_retryable() const -> bool { return kind == ErrorKind::Retryable; }
    [[nodiscard]] auto is_unrecoverable() const -> bool { return kind == ErrorKind::Unrecoverable; }
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    // Reclassification keeps the code and origin, only the kind changes.
    [[nodiscard]] auto retryable() && -> Error;
    [[nodiscard]] auto unrecoverable() && -> Error;

    // Prefixes the message: "<what>: <message>".
    [[nodiscard]] auto context(std::string_view what) && -> Error;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto make_io_error(
    std::string_view what,
    const std::error_code& ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Logs the error (warn for retryable, error otherwise) and hands it back.
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace persevere::infra

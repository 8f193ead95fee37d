#include "error.hpp"
#include <fmt/core.h>

namespace persevere::infra {

auto default_kind(ErrorCode code) -> ErrorKind {
    switch (code) {
        case ErrorCode::RemoteFailure:
        case ErrorCode::NetworkTimeout:
            return ErrorKind::Retryable;
        default:
            return ErrorKind::Unrecoverable;
    }
}

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidArgument:    return "invalid argument";
        case ErrorCode::FileNotFound:       return "file not found";
        case ErrorCode::AlreadyExists:      return "already exists";
        case ErrorCode::PermissionDenied:   return "permission denied";
        case ErrorCode::IoError:            return "i/o error";
        case ErrorCode::StateCorrupt:       return "corrupt state";
        case ErrorCode::SizeMismatch:       return "size mismatch";
        case ErrorCode::UnsupportedFeature: return "unsupported feature";
        case ErrorCode::RemoteFailure:      return "remote failure";
        case ErrorCode::NetworkTimeout:     return "network timeout";
        case ErrorCode::Unknown:            break;
    }
    return "unknown";
}

auto to_string(ErrorKind kind) -> std::string_view {
    return kind == ErrorKind::Retryable ? "retryable" : "unrecoverable";
}

int Error::to_exit_code() const {
    return is_retryable() ? kExitResumable : kExitUnrecoverable;
}

const char* Error::what() const {
    return message.c_str();
}

Error Error::retryable() && {
    kind = ErrorKind::Retryable;
    return std::move(*this);
}

Error Error::unrecoverable() && {
    kind = ErrorKind::Unrecoverable;
    return std::move(*this);
}

Error Error::context(std::string_view what) && {
    message = fmt::format("{}: {}", what, message);
    return std::move(*this);
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_io_error(std::string_view what, const std::error_code& ec,
                    const std::source_location& loc) {
    auto code = ErrorCode::IoError;
    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::FileNotFound;
    } else if (ec == std::errc::permission_denied) {
        code = ErrorCode::PermissionDenied;
    }
    return Error{code, fmt::format("{}: {}", what, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_retryable() ? spdlog::level::warn : spdlog::level::err;
    spdlog::log(level,
        "[{}:{} in {}] {} ({}): {}",
        err.file, err.line, err.function,
        to_string(err.code), to_string(err.kind), err.message
    );
    return std::move(err);
}

} // namespace persevere::infra

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <filesystem>
#include "../error_handler/error.hpp"
#include "../retry.hpp"

namespace persevere::args_parser {
    struct CLIArgs;
}

namespace persevere::infra {

inline constexpr std::string_view kDefaultStore = "s3";
inline constexpr std::string_view kDefaultLogLevel = "info";

struct Config {
    // Logging
    std::optional<std::string> log_level;
    bool quiet = false;

    // Transfers
    std::optional<std::string> store;                 // object store URI for new transfers
    std::optional<std::uint64_t> download_part_size;  // bytes

    // Retries
    std::optional<int> retry_max_attempts;
    std::optional<std::int64_t> retry_delay_ms;
    std::optional<double> retry_backoff_factor;

    // Values set in `other` win (e.g. CLI over file)
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_log_level() const -> std::string;
    [[nodiscard]] auto effective_store() const -> std::string;
    [[nodiscard]] auto effective_download_part_size() const -> std::uint64_t;
    [[nodiscard]] auto retry_policy() const -> RetryPolicy;
};

/// Parses YAML text; `origin` only names the source in error messages.
[[nodiscard]] auto parse_config(const std::string& yaml, std::string_view origin = "<string>")
    -> Result<Config>;

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Loads the first config file found of
///   1. ./.persevere.yaml
///   2. $XDG_CONFIG_HOME/persevere/config.yaml
///   3. ~/.config/persevere/config.yaml
/// Returns an empty Config if there is none.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Config holding only what was given on the command line.
[[nodiscard]] auto config_from_cli(const persevere::args_parser::CLIArgs& args) -> Config;

} // namespace persevere::infra

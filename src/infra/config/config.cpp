#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"
#include "../../core/transfer_plan/transfer_plan.hpp"

namespace persevere::infra {
    void Config::merge_with(const Config& other) {
        if (other.log_level) log_level = other.log_level;
        if (other.quiet) quiet = true;
        if (other.store) store = other.store;
        if (other.download_part_size) download_part_size = other.download_part_size;
        if (other.retry_max_attempts) retry_max_attempts = other.retry_max_attempts;
        if (other.retry_delay_ms) retry_delay_ms = other.retry_delay_ms;
        if (other.retry_backoff_factor) retry_backoff_factor = other.retry_backoff_factor;
    }

    auto Config::effective_log_level() const -> std::string {
        return log_level.value_or(std::string(kDefaultLogLevel));
    }

    auto Config::effective_store() const -> std::string {
        return store.value_or(std::string(kDefaultStore));
    }

    auto Config::effective_download_part_size() const -> std::uint64_t {
        return download_part_size.value_or(core::kDefaultDownloadPartSize);
    }

    auto Config::retry_policy() const -> RetryPolicy {
        RetryPolicy policy{};
        if (retry_max_attempts) policy.max_attempts = *retry_max_attempts;
        if (retry_delay_ms) policy.initial_delay = std::chrono::milliseconds(*retry_delay_ms);
        if (retry_backoff_factor) policy.backoff_factor = *retry_backoff_factor;
        return policy;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Local file
        paths.push_back(".persevere.yaml");

        // 2. Global file
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && *config_home != '\0') {
            paths.push_back(std::filesystem::path(config_home) / "persevere" / "config.yaml");
        }
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "persevere" / "config.yaml");
        }

        return paths;
    }

    static auto is_log_level(const std::string& level) -> bool {
        return level == "trace" || level == "debug" || level == "info" || level == "warn"
            || level == "warning" || level == "error" || level == "err" || level == "critical"
            || level == "off";
    }

    static auto validate(const Config& cfg, std::string_view origin) -> VoidResult {
        auto invalid = [&](std::string_view what) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                fmt::format("Invalid config in {}: {}", origin, what)));
        };
        if (cfg.log_level && !is_log_level(*cfg.log_level)) {
            return invalid(fmt::format("unknown log_level '{}'", *cfg.log_level));
        }
        if (cfg.store && cfg.store->empty()) {
            return invalid("store must not be empty");
        }
        if (cfg.download_part_size && *cfg.download_part_size == 0) {
            return invalid("download_part_size must be positive");
        }
        if (cfg.retry_max_attempts
            && (*cfg.retry_max_attempts < 1 || *cfg.retry_max_attempts > kMaxRetryAttempts)) {
            return invalid(fmt::format("retry.max_attempts must be between 1 and {}", kMaxRetryAttempts));
        }
        if (cfg.retry_delay_ms
            && (*cfg.retry_delay_ms < 0 || *cfg.retry_delay_ms > kMaxRetryDelay.count())) {
            return invalid(fmt::format("retry.delay_ms must be between 0 and {}", kMaxRetryDelay.count()));
        }
        if (cfg.retry_backoff_factor
            && !(*cfg.retry_backoff_factor >= 1.0 && *cfg.retry_backoff_factor <= kMaxBackoffFactor)) {
            return invalid(fmt::format("retry.backoff_factor must be between 1.0 and {}", kMaxBackoffFactor));
        }
        return {};
    }

    static auto from_node(const YAML::Node& config, std::string_view origin) -> Result<Config> {
        Config cfg{};
        try {
            if (config.IsNull()) {
                return cfg;
            }
            if (!config.IsMap()) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                    fmt::format("Invalid config in {}: expected a mapping", origin)));
            }

            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["store"]) cfg.store = config["store"].as<std::string>();
            if (config["download_part_size"]) cfg.download_part_size = config["download_part_size"].as<std::uint64_t>();

            if (const auto retry = config["retry"]) {
                if (retry["max_attempts"]) cfg.retry_max_attempts = retry["max_attempts"].as<int>();
                if (retry["delay_ms"]) cfg.retry_delay_ms = retry["delay_ms"].as<std::int64_t>();
                if (retry["backoff_factor"]) cfg.retry_backoff_factor = retry["backoff_factor"].as<double>();
            }
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                fmt::format("Failed to parse {}: {}", origin, e.what())));
        }

        if (auto valid = validate(cfg, origin); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
        return cfg;
    }

    auto parse_config(const std::string& yaml, std::string_view origin) -> Result<Config> {
        try {
            return from_node(YAML::Load(yaml), origin);
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                fmt::format("Failed to parse {}: {}", origin, e.what())));
        }
    }

    auto load_config(const std::filesystem::path& path) -> Result<Config> {
        try {
            auto cfg = from_node(YAML::LoadFile(path.string()), path.string());
            if (cfg) {
                spdlog::debug("Loaded config from {}", path.string());
            }
            return cfg;
        } catch (const YAML::BadFile& e) {
            return std::unexpected(make_error(ErrorCode::IoError,
                fmt::format("Cannot read {}: {}", path.string(), e.what())));
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file() -> Result<Config> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config(path);
        }

        // No file is not an error
        return Config{};
    }

    auto config_from_cli(const persevere::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.log_level = args.log_level;
        cfg.quiet = args.quiet;
        cfg.store = args.store;
        if (args.direction == core::Direction::Download) {
            cfg.download_part_size = args.part_size;
        }
        return cfg;
    }

} // namespace persevere::infra

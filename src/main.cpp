#include <cstdio>
#include <exception>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/object_store/object_store.hpp"
#include "core/transfer_engine/transfer_engine.hpp"
#include "core/transfer_engine/upload_flavor.hpp"
#include "core/transfer_engine/download_flavor.hpp"
#include "extensions/state_store/state_store.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = persevere::build_info::GitInfo;
using ARGS = persevere::args_parser::CLIArgs;
using persevere::args_parser::Action;
using persevere::core::Direction;

constexpr auto git = persevere::build_info::get_git_info();

static auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("persevere {}\n", persevere::build_info::version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
setup_logging(const persevere::infra::Config& config)
-> void {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
    auto level = spdlog::level::from_str(config.effective_log_level());
    if (config.quiet && level < spdlog::level::warn) {
        level = spdlog::level::warn;
    }
    spdlog::set_level(level);
}

// Resume and abort go to the store the transfer was started with.
[[nodiscard]]
static auto
store_uri_for(const ARGS& args, const persevere::infra::Config& config)
-> persevere::infra::Result<std::string> {
    if (args.action == Action::Start) {
        return config.effective_store();
    }
    auto state = persevere::extensions::load_state(args.state_file);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }
    return state->store;
}

static auto
report_failure(const ARGS& args, const persevere::infra::Error& err)
-> int {
    const auto direction = persevere::core::to_string(args.direction);
    spdlog::error("{} failed: {}", direction, err.message);
    spdlog::debug("Raised at {}:{} ({}) as {}", err.file, err.line, err.function,
                  persevere::infra::to_string(err.code));

    if (err.is_retryable()) {
        fmt::print(stderr, "{}", persevere::args_parser::retry_hint(args));
        return err.to_exit_code();
    }

    // Nothing was recorded when the transfer never got a state file of its own.
    auto state = persevere::extensions::load_state(args.state_file);
    if (args.action == Action::Abort || err.code == persevere::infra::ErrorCode::AlreadyExists
        || !state || !state->failure) {
        return err.to_exit_code();
    }

    fmt::print(stderr, "The {} failed with an unrecoverable error and cannot be resumed.\n", direction);
    if (args.direction == Direction::Upload) {
        if (state->remote_aborted) {
            fmt::print(stderr, "The multipart upload has been cancelled.\n");
        } else {
            fmt::print(stderr, "Cancelling the multipart upload failed, cancel it with:\n"
                               "  persevere upload abort --state-file '{}'\n", args.state_file);
        }
    }
    return err.to_exit_code();
}

template<typename Flavor>
[[nodiscard]]
static auto
run_command(Flavor& flavor, const ARGS& args, const persevere::infra::Config& config,
            persevere::infra::ProgressMonitor& monitor)
-> int {
    persevere::core::TransferEngine<Flavor> engine(flavor, config.retry_policy(), monitor);

    if (args.action == Action::Abort) {
        auto aborted = engine.abort(args.state_file);
        if (!aborted) {
            return report_failure(args, aborted.error());
        }
        spdlog::info("The {} was aborted", persevere::core::to_string(args.direction));
        return persevere::infra::kExitSuccess;
    }

    auto start_time = std::chrono::steady_clock::now();

    persevere::infra::Result<persevere::core::TransferReport> result;
    if (args.action == Action::Start) {
        persevere::core::TransferRequest request{
            .store = config.effective_store(),
            .bucket = args.bucket,
            .key = args.key,
            .local_path = args.local_path,
            .part_size = args.part_size,
        };
        if (args.direction == Direction::Download) {
            request.part_size = config.effective_download_part_size();
        }
        result = engine.start(request, args.state_file);
    } else {
        result = engine.resume(args.state_file);
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    if (!result) {
        return report_failure(args, result.error());
    }

    const auto& report = *result;
    spdlog::info("Parts transferred: {} of {}", report.parts_transferred, report.parts_total);
    spdlog::info("Bytes transferred: {} ({:.2f} MB)",
                 report.bytes_transferred,
                 report.bytes_transferred / 1024.0 / 1024.0);
    spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
    if (!report.e_tag.empty()) {
        spdlog::info("ETag: {}", report.e_tag);
    }
    return persevere::infra::kExitSuccess;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_res = persevere::args_parser::parse_args(argc, argv);
        if (!args_res) {
            fmt::print(stderr, "{}\n\n{}\n", args_res.error().message, persevere::args_parser::usage());
            return persevere::infra::kExitUsage;
        }
        const auto& args = *args_res;

        if (args.help) {
            fmt::print("{}\n", persevere::args_parser::usage());
            return persevere::infra::kExitSuccess;
        }
        if (args.version) {
            out_git_verse(git);
            return persevere::infra::kExitSuccess;
        }

        // 1. Config file
        auto config_res = persevere::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            return persevere::infra::kExitUsage;
        }
        auto config = std::move(*config_res);

        // 2. CLI wins
        config.merge_with(persevere::infra::config_from_cli(args));
        setup_logging(config);
        spdlog::debug("persevere {} ({})", persevere::build_info::version, git.commit_short);

        auto store_uri = store_uri_for(args, config);
        if (!store_uri) {
            return report_failure(args, store_uri.error());
        }
        auto store = persevere::adapters::make_object_store(*store_uri);
        if (!store) {
            return report_failure(args, store.error());
        }

        persevere::infra::ProgressMonitor monitor(!config.quiet);

        if (args.direction == Direction::Upload) {
            persevere::core::UploadFlavor flavor(**store);
            return run_command(flavor, args, config, monitor);
        }
        persevere::core::DownloadFlavor flavor(**store);
        return run_command(flavor, args, config, monitor);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return persevere::infra::kExitUnrecoverable;
    }
}

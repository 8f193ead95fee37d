#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../types.hpp"
#include "../transfer_plan/transfer_plan.hpp"
#include "../../extensions/state_store/state_store.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../infra/retry.hpp"

namespace persevere::core {

struct TransferRequest {
    std::string store;                       // recorded in the state file
    std::string bucket;
    std::string key;
    std::filesystem::path local_path;        // source of an upload, output of a download
    std::optional<std::uint64_t> part_size;
};

struct TransferReport {
    std::uint64_t parts_total = 0;
    std::uint64_t parts_transferred = 0;     // by this run
    std::uint64_t bytes_transferred = 0;     // by this run
    std::string e_tag;                       // uploads only
};

// What differs between moving an object up and moving it down. The engine
// owns the loop, the retries and the state file; a flavor owns the I/O.
template<typename F>
concept TransferFlavor = requires(F& flavor,
                                  const TransferRequest& request,
                                  extensions::TransferState& state,
                                  const extensions::TransferState& cstate,
                                  const PartDescriptor& part,
                                  typename F::Receipt receipt) {
    { F::direction } -> std::convertible_to<Direction>;
    { flavor.begin(request) } -> std::same_as<infra::Result<extensions::TransferState>>;
    { flavor.validate_resume(cstate) } -> std::same_as<infra::VoidResult>;
    { flavor.transfer_part(cstate, part) } -> std::same_as<infra::Result<typename F::Receipt>>;
    flavor.record(state, std::move(receipt));
    { flavor.verify_complete(cstate) } -> std::same_as<infra::VoidResult>;
    { flavor.finalize(cstate) } -> std::same_as<infra::Result<std::string>>;
    { flavor.cancel(cstate) } -> std::same_as<infra::VoidResult>;
};

template<TransferFlavor Flavor>
class TransferEngine {
public:
    TransferEngine(Flavor& flavor, infra::RetryPolicy policy, infra::ProgressMonitor& monitor)
        : flavor_(flavor), policy_(policy), monitor_(monitor) {}

    // Fresh transfer. Refuses a state file that already exists.
    [[nodiscard]] auto start(const TransferRequest& request,
                             const std::filesystem::path& state_file)
        -> infra::Result<TransferReport>;

    // Continues after the last completed part recorded in `state_file`.
    [[nodiscard]] auto resume(const std::filesystem::path& state_file)
        -> infra::Result<TransferReport>;

    // Cancels the remote side (uploads) and deletes `state_file`.
    [[nodiscard]] auto abort(const std::filesystem::path& state_file)
        -> infra::VoidResult;

    // Transfers every part after handle.state().last_completed_part and completes the transfer.
    [[nodiscard]] auto run(extensions::StateHandle& handle)
        -> infra::Result<TransferReport>;

private:
    [[nodiscard]] auto complete_(extensions::StateHandle& handle, TransferReport report)
        -> infra::Result<TransferReport>;
    [[nodiscard]] auto fail_unrecoverable_(extensions::StateHandle& handle, infra::Error err)
        -> infra::Error;
    [[nodiscard]] auto check_direction_(const extensions::TransferState& state) const
        -> infra::VoidResult;

    Flavor& flavor_;
    infra::RetryPolicy policy_;
    infra::ProgressMonitor& monitor_;
};

// =============== Template implementation ===============

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::start(const TransferRequest& request,
                                   const std::filesystem::path& state_file)
    -> infra::Result<TransferReport>
{
    spdlog::debug("Verifying that the state file {} doesn't exist yet", state_file.string());
    std::error_code ec;
    if (std::filesystem::exists(state_file, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists, fmt::format(
            "The state file {} already exists. To continue that transfer use 'resume', "
            "to start a new one remove the file first or use a different one.",
            state_file.string())));
    }

    // Checked before anything exists remotely that the state file would have to track.
    const std::pair<std::string_view, std::string_view> names[] = {
        {"store", request.store},
        {"bucket", request.bucket},
        {"key", request.key},
        {"local path", request.local_path.native()},
    };
    for (const auto& [field, value] : names) {
        if (auto storable = extensions::check_storable_text(field, value); !storable) {
            return std::unexpected(std::move(storable.error()));
        }
    }

    auto state = flavor_.begin(request);
    if (!state) {
        return std::unexpected(std::move(state.error()).unrecoverable());
    }

    auto handle = extensions::StateHandle::create(state_file, *state);
    if (!handle) {
        if (auto cancelled = flavor_.cancel(*state); !cancelled) {
            spdlog::error("Failed to cancel the {} after the state file could not be written: {}",
                          to_string(Flavor::direction), cancelled.error().message);
        }
        return std::unexpected(std::move(handle.error()).unrecoverable());
    }

    return run(*handle);
}

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::resume(const std::filesystem::path& state_file)
    -> infra::Result<TransferReport>
{
    auto handle = extensions::StateHandle::open(state_file);
    if (!handle) {
        return std::unexpected(std::move(handle.error()).unrecoverable());
    }

    const auto& state = handle->state();
    if (auto checked = check_direction_(state); !checked) {
        return std::unexpected(std::move(checked.error()));
    }
    if (state.failure) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, fmt::format(
            "This {} already failed with an unrecoverable error and can't be resumed: {}",
            to_string(Flavor::direction), *state.failure)));
    }

    spdlog::info("Resuming {} of {}/{} after part {} of {}",
                 to_string(Flavor::direction), state.bucket, state.key,
                 state.last_completed_part, state.part_count);

    if (auto validated = flavor_.validate_resume(state); !validated) {
        return std::unexpected(std::move(validated.error()));
    }

    return run(*handle);
}

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::abort(const std::filesystem::path& state_file)
    -> infra::VoidResult
{
    auto handle = extensions::StateHandle::open(state_file);
    if (!handle) {
        return std::unexpected(std::move(handle.error()).unrecoverable());
    }

    const auto& state = handle->state();
    if (auto checked = check_direction_(state); !checked) {
        return std::unexpected(std::move(checked.error()));
    }

    if (state.remote_aborted) {
        spdlog::debug("The remote side was already cleaned up");
    } else if (auto cancelled = flavor_.cancel(state); !cancelled) {
        // Keep the state file, it holds the only handle to what is left remotely.
        return std::unexpected(std::move(cancelled.error()).retryable()
            .context(fmt::format("Failed to abort the {}", to_string(Flavor::direction))));
    }

    return std::move(*handle).release();
}

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::run(extensions::StateHandle& handle)
    -> infra::Result<TransferReport>
{
    auto& state = handle.state();
    TransferReport report{.parts_total = state.part_count};

    spdlog::info("Transferring {}/{} ({} bytes) in {} parts of {} bytes each",
                 state.bucket, state.key, state.object_size, state.part_count, state.part_size);

    const auto done_bytes = std::min(state.object_size, state.last_completed_part * state.part_size);
    monitor_.set_total(state.part_count, state.object_size, state.last_completed_part, done_bytes);

    for (auto number = state.last_completed_part + 1; number <= state.part_count; ++number) {
        auto part = part_descriptor(state.object_size, state.part_size, state.part_count, number);
        if (!part) {
            return std::unexpected(fail_unrecoverable_(handle, std::move(part.error())));
        }

        auto receipt = infra::with_retry(
            [&]() { return flavor_.transfer_part(std::as_const(state), *part); },
            policy_,
            fmt::format("{} of part {} of {}", to_string(Flavor::direction), number, state.part_count));

        if (!receipt) {
            if (receipt.error().is_unrecoverable()) {
                return std::unexpected(fail_unrecoverable_(handle, std::move(receipt.error())));
            }

            // Progress up to the last completed part is kept.
            if (auto persisted = handle.persist(); !persisted) {
                spdlog::error("Failed to write the state file: {}", persisted.error().message);
            }
            spdlog::error("Failed to {} part {} after {} attempts. The {} is not aborted, so it can be resumed.",
                          to_string(Flavor::direction), number, policy_.max_attempts,
                          to_string(Flavor::direction));
            return std::unexpected(std::move(receipt.error()));
        }

        flavor_.record(state, std::move(*receipt));
        state.last_completed_part = number;
        if (auto persisted = handle.persist(); !persisted) {
            return std::unexpected(fail_unrecoverable_(handle, std::move(persisted.error())));
        }

        report.parts_transferred += 1;
        report.bytes_transferred += part->length;
        monitor_.update(1, part->length);
    }

    return complete_(handle, std::move(report));
}

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::complete_(extensions::StateHandle& handle, TransferReport report)
    -> infra::Result<TransferReport>
{
    const auto& state = handle.state();

    std::uint64_t total = 0;
    for (std::uint64_t number = 1; number <= state.part_count; ++number) {
        auto part = part_descriptor(state.object_size, state.part_size, state.part_count, number);
        if (!part) {
            return std::unexpected(fail_unrecoverable_(handle, std::move(part.error())));
        }
        total += part->length;
    }
    if (total != state.object_size) {
        return std::unexpected(fail_unrecoverable_(handle, infra::make_error(
            infra::ErrorCode::SizeMismatch, fmt::format(
                "In theory all parts are done, but they add up to {} bytes instead of {}",
                total, state.object_size))));
    }

    if (auto verified = flavor_.verify_complete(state); !verified) {
        return std::unexpected(fail_unrecoverable_(handle, std::move(verified.error())));
    }

    auto finalized = flavor_.finalize(state);
    if (!finalized) {
        if (finalized.error().is_unrecoverable()) {
            return std::unexpected(fail_unrecoverable_(handle, std::move(finalized.error())));
        }
        spdlog::error("All parts were transferred, but finishing the {} failed. "
                      "Resuming will only retry the last step.", to_string(Flavor::direction));
        return std::unexpected(std::move(finalized.error()));
    }
    report.e_tag = std::move(*finalized);

    if (auto released = std::move(handle).release(); !released) {
        spdlog::warn("The {} succeeded, but its state file {} could not be removed: {}",
                     to_string(Flavor::direction), handle.path().string(), released.error().message);
    }
    return report;
}

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::fail_unrecoverable_(extensions::StateHandle& handle, infra::Error err)
    -> infra::Error
{
    err = infra::log_and_return(std::move(err).unrecoverable());
    auto& state = handle.state();
    state.failure = err.message;

    spdlog::error("Cancelling the {} after an unrecoverable error", to_string(Flavor::direction));
    if (auto cancelled = flavor_.cancel(state); cancelled) {
        state.remote_aborted = true;
    } else {
        spdlog::error("Failed to cancel the {}: {}", to_string(Flavor::direction), cancelled.error().message);
    }

    // Kept for diagnosis, resume refuses it from now on.
    if (auto persisted = handle.persist(); !persisted) {
        spdlog::error("Failed to record the failure in the state file: {}", persisted.error().message);
    }
    return err;
}

template<TransferFlavor Flavor>
auto TransferEngine<Flavor>::check_direction_(const extensions::TransferState& state) const
    -> infra::VoidResult
{
    if (state.direction != Flavor::direction) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, fmt::format(
            "The state file belongs to a {}, not to a {}",
            to_string(state.direction), to_string(Flavor::direction))));
    }
    return {};
}

} // namespace persevere::core

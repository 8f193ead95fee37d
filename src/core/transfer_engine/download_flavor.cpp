#include "download_flavor.hpp"
#include <filesystem>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../part_driver/part_driver.hpp"
#include "../../adapters/fs.hpp"

namespace persevere::core {

auto DownloadFlavor::begin(const TransferRequest& request)
    -> infra::Result<extensions::TransferState>
{
    std::error_code ec;
    if (std::filesystem::exists(request.local_path, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists, fmt::format(
            "{} already exists, refusing to overwrite it", request.local_path.string())));
    }

    spdlog::info("Looking up the size of {}/{}", request.bucket, request.key);
    auto size = store_.object_size({request.bucket, request.key});
    if (!size) {
        return std::unexpected(std::move(size.error()).unrecoverable()
            .context("Failed to look up the object"));
    }

    auto plan = compute_plan(*size, request.part_size.value_or(kDefaultDownloadPartSize), limits_);
    if (!plan) {
        return std::unexpected(std::move(plan.error())
            .context(fmt::format("Cannot download {}/{}", request.bucket, request.key)));
    }

    spdlog::debug("Pre-allocating {} bytes for {}", *size, request.local_path.string());
    if (auto allocated = adapters::fs::preallocate(request.local_path, *size); !allocated) {
        return std::unexpected(std::move(allocated.error()));
    }

    extensions::TransferState state;
    state.direction = direction;
    state.store = request.store;
    state.bucket = request.bucket;
    state.key = request.key;
    state.local_path = request.local_path;
    state.object_size = plan->object_size;
    state.part_size = plan->part_size;
    state.part_count = plan->part_count;
    return state;
}

auto DownloadFlavor::validate_resume(const extensions::TransferState& state)
    -> infra::VoidResult
{
    auto size = store_.object_size(state.object());
    if (!size) {
        return std::unexpected(std::move(size.error()).retryable()
            .context("Failed to look up the object"));
    }
    if (*size != state.object_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch, fmt::format(
            "{}/{} is {} bytes now, but the download was planned for {} bytes",
            state.bucket, state.key, *size, state.object_size)));
    }
    return verify_complete(state);
}

auto DownloadFlavor::transfer_part(const extensions::TransferState& state,
                                   const PartDescriptor& part)
    -> infra::Result<std::uint64_t>
{
    return download_part(store_, state, part);
}

auto DownloadFlavor::verify_complete(const extensions::TransferState& state)
    -> infra::VoidResult
{
    auto size = adapters::fs::file_size(state.local_path);
    if (!size) {
        return std::unexpected(std::move(size.error()).unrecoverable());
    }
    if (*size != state.object_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch, fmt::format(
            "{} is {} bytes, expected {}", state.local_path.string(), *size, state.object_size)));
    }
    return {};
}

auto DownloadFlavor::finalize(const extensions::TransferState& state)
    -> infra::Result<std::string>
{
    spdlog::info("Successfully downloaded {}/{} to {}",
                 state.bucket, state.key, state.local_path.string());
    return std::string{};
}

auto DownloadFlavor::cancel(const extensions::TransferState& state)
    -> infra::VoidResult
{
    spdlog::debug("Nothing to cancel remotely, {} is left as it is", state.local_path.string());
    return {};
}

} // namespace persevere::core

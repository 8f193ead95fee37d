#include "upload_flavor.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../part_driver/part_driver.hpp"
#include "../../adapters/fs.hpp"

namespace persevere::core {

namespace {

auto check_source_size(const extensions::TransferState& state) -> infra::VoidResult {
    auto size = adapters::fs::file_size(state.local_path);
    if (!size) {
        return std::unexpected(std::move(size.error()).unrecoverable());
    }
    if (*size != state.object_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch, fmt::format(
            "{} is {} bytes now, but the upload was planned for {} bytes",
            state.local_path.string(), *size, state.object_size)));
    }
    return {};
}

} // namespace

auto UploadFlavor::begin(const TransferRequest& request)
    -> infra::Result<extensions::TransferState>
{
    auto size = adapters::fs::file_size(request.local_path);
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }

    auto plan = compute_plan(*size, request.part_size, limits_);
    if (!plan) {
        return std::unexpected(std::move(plan.error())
            .context(fmt::format("Cannot upload {}", request.local_path.string())));
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

    spdlog::info("Creating multipart upload for {}/{}", state.bucket, state.key);
    auto upload_id = store_.create_multipart_upload(state.object());
    if (!upload_id) {
        return std::unexpected(std::move(upload_id.error()).unrecoverable()
            .context("Failed to create multipart upload"));
    }
    spdlog::debug("Multipart upload id: {}", *upload_id);
    state.upload_id = std::move(*upload_id);
    return state;
}

auto UploadFlavor::validate_resume(const extensions::TransferState& state)
    -> infra::VoidResult
{
    return check_source_size(state);
}

auto UploadFlavor::transfer_part(const extensions::TransferState& state,
                                 const PartDescriptor& part)
    -> infra::Result<CompletedPart>
{
    return upload_part(store_, state, part);
}

void UploadFlavor::record(extensions::TransferState& state, CompletedPart receipt) {
    state.completed_parts.push_back(std::move(receipt));
}

auto UploadFlavor::verify_complete(const extensions::TransferState& state)
    -> infra::VoidResult
{
    if (state.completed_parts.size() != state.part_count) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupt, fmt::format(
            "{} receipts recorded for {} parts", state.completed_parts.size(), state.part_count)));
    }
    return check_source_size(state);
}

auto UploadFlavor::finalize(const extensions::TransferState& state)
    -> infra::Result<std::string>
{
    spdlog::info("Completing multipart upload of {}/{} ({} parts)",
                 state.bucket, state.key, state.completed_parts.size());
    auto e_tag = store_.complete_multipart_upload(state.object(), state.upload_id.value_or(""),
                                                  state.completed_parts);
    if (!e_tag) {
        return std::unexpected(std::move(e_tag.error()).retryable()
            .context("Failed to complete multipart upload"));
    }
    spdlog::info("Successfully uploaded {} to {}/{} (ETag {})",
                 state.local_path.string(), state.bucket, state.key, *e_tag);
    return e_tag;
}

auto UploadFlavor::cancel(const extensions::TransferState& state)
    -> infra::VoidResult
{
    if (!state.upload_id) {
        return {};
    }
    spdlog::info("Aborting multipart upload {} of {}/{}", *state.upload_id, state.bucket, state.key);
    auto aborted = store_.abort_multipart_upload(state.object(), *state.upload_id);
    if (!aborted) {
        return std::unexpected(std::move(aborted.error())
            .context("Failed to abort multipart upload"));
    }
    return {};
}

} // namespace persevere::core

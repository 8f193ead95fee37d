#include "part_driver.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../adapters/region_stream.hpp"

namespace persevere::core {

auto upload_part(adapters::ObjectStore& store,
                 const extensions::TransferState& state,
                 const PartDescriptor& part)
    -> infra::Result<CompletedPart>
{
    spdlog::info("Starting upload of part {} of {} ({} bytes)...",
                 part.number, state.part_count, part.length);

    auto file = adapters::fs::open_for_read_at(state.local_path, part.offset);
    if (!file) {
        return std::unexpected(std::move(file.error()).unrecoverable());
    }

    adapters::BoundedInputStream body(*file, part.length);
    auto uploaded = store.upload_part(state.object(), state.upload_id.value_or(""),
                                      part.number, body, part.length);

    // A short source means the file changed underneath us, whatever the store made of it.
    if (body.buffer().truncated()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch, fmt::format(
            "{} ended after {} of the {} bytes of part {}",
            state.local_path.string(), body.buffer().consumed(), part.length, part.number)));
    }
    if (!uploaded) {
        return std::unexpected(std::move(uploaded.error()).retryable()
            .context(fmt::format("Upload of part {} failed", part.number)));
    }
    if (uploaded->part_number != part.number) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteFailure, fmt::format(
            "Receipt for part {} names part {}", part.number, uploaded->part_number)));
    }

    spdlog::info("Finished upload of part {} of {} ({} bytes)",
                 part.number, state.part_count, part.length);
    return std::move(*uploaded);
}

auto download_part(adapters::ObjectStore& store,
                   const extensions::TransferState& state,
                   const PartDescriptor& part)
    -> infra::Result<std::uint64_t>
{
    spdlog::info("Starting download of part {} of {} ({} bytes)...",
                 part.number, state.part_count, part.length);

    auto file = adapters::fs::open_for_write_at(state.local_path, part.offset);
    if (!file) {
        return std::unexpected(std::move(file.error()).unrecoverable());
    }

    const auto range = download_range(state.object_size, state.part_size, part);
    spdlog::debug("Retrieving bytes={}-{}", range.first, range.last);
    auto copied = store.read_range(state.object(), range, *file);

    if (file->fail()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, fmt::format(
            "Cannot write part {} to {}", part.number, state.local_path.string())));
    }
    if (!copied) {
        return std::unexpected(std::move(copied.error()).retryable()
            .context(fmt::format("Download of part {} failed", part.number)));
    }
    if (*copied != part.length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteFailure, fmt::format(
            "Part {} delivered {} bytes, expected {}", part.number, *copied, part.length)));
    }

    file->close();
    if (file->fail()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, fmt::format(
            "Cannot flush part {} to {}", part.number, state.local_path.string())));
    }

    spdlog::info("Finished download of part {} of {} ({} bytes)",
                 part.number, state.part_count, part.length);
    return *copied;
}

} // namespace persevere::core

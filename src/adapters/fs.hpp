#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace persevere::adapters::fs {

inline constexpr std::size_t kCopyBufferSize = 64 * 1024;

[[nodiscard]] auto file_size(const std::filesystem::path& path)
    -> infra::Result<std::uint64_t>;

// Opens `path` for reading, positioned at `offset`.
[[nodiscard]] auto open_for_read_at(const std::filesystem::path& path,
                                    std::uint64_t offset)
    -> infra::Result<std::ifstream>;

// Opens an existing file for writing without truncating it, positioned at `offset`.
[[nodiscard]] auto open_for_write_at(const std::filesystem::path& path,
                                     std::uint64_t offset)
    -> infra::Result<std::ofstream>;

// Creates (or truncates) `path` and sizes it to exactly `size` bytes.
[[nodiscard]] auto preallocate(const std::filesystem::path& path, std::uint64_t size)
    -> infra::VoidResult;

// false when there was nothing to remove.
[[nodiscard]] auto remove_if_exists(const std::filesystem::path& path)
    -> infra::Result<bool>;

// Writes `contents` to "<path>.tmp", syncs it and renames it over `path`.
[[nodiscard]] auto write_file_atomically(const std::filesystem::path& path,
                                         std::string_view contents)
    -> infra::VoidResult;

struct CopyResult {
    std::uint64_t bytes = 0;
    bool read_failed = false;  // the source went bad (not plain end of data)
    bool write_failed = false;
};

// Copies up to `limit` bytes, stopping early at the end of `in`.
[[nodiscard]] auto copy_stream(std::istream& in, std::ostream& out,
                               std::uint64_t limit = UINT64_MAX) -> CopyResult;

} // namespace persevere::adapters::fs

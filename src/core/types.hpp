#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace persevere::core {

inline constexpr std::uint64_t KiB = 1024;
inline constexpr std::uint64_t MiB = 1024 * KiB;
inline constexpr std::uint64_t GiB = 1024 * MiB;
inline constexpr std::uint64_t TiB = 1024 * GiB;

enum class Direction {
    Upload,
    Download,
};

[[nodiscard]] constexpr auto to_string(Direction direction) -> std::string_view {
    return direction == Direction::Upload ? "upload" : "download";
}

// Remote object address.
struct ObjectId {
    std::string bucket;
    std::string key;
};

// Receipt of one uploaded part. Everything except the part number is opaque
// to the engine and handed back to the store on completion.
struct CompletedPart {
    std::uint64_t part_number = 0;
    std::string e_tag;
    std::optional<std::string> checksum_crc32;
    std::optional<std::string> checksum_crc32c;
    std::optional<std::string> checksum_sha1;
    std::optional<std::string> checksum_sha256;

    bool operator==(const CompletedPart&) const = default;
};

// Inclusive byte range, as in an HTTP Range header.
struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    bool operator==(const ByteRange&) const = default;
};

} // namespace persevere::core

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include "../types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace persevere::core {

struct ServiceLimits {
    std::uint64_t min_part_size;
    std::uint64_t max_part_size;
    std::uint64_t max_part_count;
    std::uint64_t min_object_size;
    std::uint64_t max_object_size;
};

/// S3 multipart upload quotas
/// (https://docs.aws.amazon.com/AmazonS3/latest/userguide/qfacts.html).
/// The last part may be smaller than min_part_size; objects smaller than one
/// minimum part can't go through a multipart upload at all.
[[nodiscard]] constexpr auto upload_limits() -> ServiceLimits {
    return ServiceLimits{
        .min_part_size = 5 * MiB,
        .max_part_size = 5 * GiB,
        .max_part_count = 10'000,
        .min_object_size = 5 * MiB,
        .max_object_size = 5 * TiB,
    };
}

// Part size of a download when neither the command line nor the config names one.
inline constexpr std::uint64_t kDefaultDownloadPartSize = 100 * MiB;

/// Ranged GETs have no part quota, only the object size limit applies.
[[nodiscard]] constexpr auto download_limits() -> ServiceLimits {
    return ServiceLimits{
        .min_part_size = 1,
        .max_part_size = 5 * GiB,
        .max_part_count = std::numeric_limits<std::uint64_t>::max(),
        .min_object_size = 1,
        .max_object_size = 5 * TiB,
    };
}

struct TransferPlan {
    std::uint64_t object_size = 0;
    std::uint64_t part_size = 0;
    std::uint64_t part_count = 0;

    bool operator==(const TransferPlan&) const = default;
};

struct PartDescriptor {
    std::uint64_t number = 0; // 1-based
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    bool operator==(const PartDescriptor&) const = default;
};

[[nodiscard]] constexpr auto div_ceil(std::uint64_t a, std::uint64_t b) -> std::uint64_t {
    return a / b + (a % b != 0 ? 1 : 0);
}

/// Chooses part size and part count for an object of `object_size` bytes.
/// With `part_size_override` the override is validated and used as-is,
/// otherwise the smallest part size that keeps the count within the limit.
[[nodiscard]] auto compute_plan(std::uint64_t object_size,
                                std::optional<std::uint64_t> part_size_override,
                                const ServiceLimits& limits)
    -> infra::Result<TransferPlan>;

/// Part `number` of a transfer of `object_size` bytes cut into `part_count`
/// parts of `part_size` bytes.
[[nodiscard]] auto part_descriptor(std::uint64_t object_size,
                                   std::uint64_t part_size,
                                   std::uint64_t part_count,
                                   std::uint64_t number)
    -> infra::Result<PartDescriptor>;

[[nodiscard]] auto part_descriptor(const TransferPlan& plan, std::uint64_t number)
    -> infra::Result<PartDescriptor>;

/// Range requested for a part when downloading. The end is computed from the
/// part size and only pulled back to the last byte of the object when it lies
/// strictly past object_size.
[[nodiscard]] auto download_range(std::uint64_t object_size,
                                  std::uint64_t part_size,
                                  const PartDescriptor& part) -> ByteRange;

} // namespace persevere::core

#include "transfer_plan.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace persevere::core {

namespace {

auto reject(std::string message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::InvalidArgument, message);
}

} // namespace

auto compute_plan(std::uint64_t object_size,
                  std::optional<std::uint64_t> part_size_override,
                  const ServiceLimits& limits)
    -> infra::Result<TransferPlan>
{
    if (object_size < limits.min_object_size) {
        return std::unexpected(reject(fmt::format(
            "Object of {} bytes is too small for a multipart transfer, it must be at least {} bytes",
            object_size, limits.min_object_size)));
    }
    if (object_size > limits.max_object_size) {
        return std::unexpected(reject(fmt::format(
            "Object of {} bytes exceeds the maximum object size of {} bytes",
            object_size, limits.max_object_size)));
    }

    std::uint64_t part_size = 0;
    if (part_size_override) {
        part_size = *part_size_override;
        if (part_size < limits.min_part_size) {
            return std::unexpected(reject(fmt::format(
                "The part size is too small, it must be at least {} bytes", limits.min_part_size)));
        }
        if (part_size > limits.max_part_size) {
            return std::unexpected(reject(fmt::format(
                "The part size is too large, it must be at most {} bytes", limits.max_part_size)));
        }
        if (div_ceil(object_size, part_size) > limits.max_part_count) {
            return std::unexpected(reject(fmt::format(
                "A part size of {} bytes needs more than the maximum of {} parts",
                part_size, limits.max_part_count)));
        }
    } else {
        // At least the minimum part size, but large enough to stay within the part count limit.
        part_size = std::max(limits.min_part_size, div_ceil(object_size, limits.max_part_count));
        if (part_size > limits.max_part_size) {
            return std::unexpected(reject(fmt::format(
                "The required part size of {} bytes exceeds the maximum part size of {} bytes",
                part_size, limits.max_part_size)));
        }
    }

    const auto part_count = div_ceil(object_size, part_size);
    if (part_count > limits.max_part_count) {
        return std::unexpected(reject(fmt::format(
            "{} parts exceed the maximum of {} parts", part_count, limits.max_part_count)));
    }

    spdlog::debug("Object size: {} bytes. Part size: {} bytes. Number of parts: {}.",
                  object_size, part_size, part_count);
    return TransferPlan{
        .object_size = object_size,
        .part_size = part_size,
        .part_count = part_count,
    };
}

auto part_descriptor(std::uint64_t object_size,
                     std::uint64_t part_size,
                     std::uint64_t part_count,
                     std::uint64_t number)
    -> infra::Result<PartDescriptor>
{
    if (part_size == 0 || number < 1 || number > part_count) {
        return std::unexpected(reject(fmt::format(
            "Part {} is outside of 1..{} (part size {})", number, part_count, part_size)));
    }

    PartDescriptor part{
        .number = number,
        .offset = (number - 1) * part_size,
        .length = part_size,
    };
    if (number == part_count) {
        const auto remainder = object_size - (part_count - 1) * part_size;
        // An exact multiple leaves a full-sized last part.
        part.length = remainder == 0 ? part_size : remainder;
    }
    return part;
}

auto part_descriptor(const TransferPlan& plan, std::uint64_t number)
    -> infra::Result<PartDescriptor>
{
    return part_descriptor(plan.object_size, plan.part_size, plan.part_count, number);
}

auto download_range(std::uint64_t object_size,
                    std::uint64_t part_size,
                    const PartDescriptor& part) -> ByteRange
{
    ByteRange range{
        .first = part.offset,
        .last = part.offset + part_size - 1,
    };
    if (range.last > object_size) {
        range.last = object_size - 1;
    }
    return range;
}

} // namespace persevere::core

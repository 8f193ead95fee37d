#include "local_object_store.hpp"
#include <algorithm>
#include <fstream>
#include <random>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../fs.hpp"
#include "../../infra/hash/xxhash_digest.hpp"

namespace persevere::adapters {

namespace {

constexpr const char* kStagingDir = ".multipart";
constexpr const char* kMetaFile = "meta";

auto remote_error(std::string_view message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::RemoteFailure, message);
}

auto as_remote(infra::Error err) -> infra::Error {
    err.code = infra::ErrorCode::RemoteFailure;
    err.kind = infra::ErrorKind::Retryable;
    return err;
}

auto new_upload_id() -> std::string {
    std::random_device device;
    std::mt19937_64 engine(
        (static_cast<std::uint64_t>(device()) << 32) ^ static_cast<std::uint64_t>(device()));
    return fmt::format("{:016x}{:016x}",
                       static_cast<unsigned long long>(engine()),
                       static_cast<unsigned long long>(engine()));
}

auto valid_upload_id(std::string_view id) -> bool {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

// Keys map onto relative paths below the bucket; nothing may climb out of it.
auto valid_name(std::string_view name) -> bool {
    if (name.empty() || name.front() == '/') {
        return false;
    }
    const std::filesystem::path path(name);
    return std::none_of(path.begin(), path.end(), [](const std::filesystem::path& element) {
        return element == ".." || element == ".";
    });
}

} // namespace

LocalObjectStore::LocalObjectStore(std::filesystem::path root)
    : root_(std::move(root)) {}

auto LocalObjectStore::object_path(const core::ObjectId& object) const
    -> infra::Result<std::filesystem::path>
{
    if (!valid_name(object.bucket) || object.bucket.find('/') != std::string::npos
        || object.bucket == kStagingDir) {
        return std::unexpected(remote_error(fmt::format("Invalid bucket name '{}'", object.bucket)));
    }
    if (!valid_name(object.key)) {
        return std::unexpected(remote_error(fmt::format("Invalid key '{}'", object.key)));
    }
    return root_ / object.bucket / object.key;
}

auto LocalObjectStore::upload_dir(const core::ObjectId& object, std::string_view upload_id) const
    -> infra::Result<std::filesystem::path>
{
    if (!valid_upload_id(upload_id)) {
        return std::unexpected(remote_error(fmt::format("Invalid upload ID '{}'", upload_id)));
    }
    const auto dir = root_ / kStagingDir / std::string(upload_id);

    std::ifstream meta(dir / kMetaFile);
    std::string bucket;
    std::string key;
    if (!meta || !std::getline(meta, bucket) || !std::getline(meta, key)) {
        return std::unexpected(remote_error(fmt::format("No such upload: {}", upload_id)));
    }
    if (bucket != object.bucket || key != object.key) {
        return std::unexpected(remote_error(fmt::format(
            "Upload {} belongs to {}/{}, not {}/{}", upload_id, bucket, key, object.bucket, object.key)));
    }
    return dir;
}

auto LocalObjectStore::create_multipart_upload(const core::ObjectId& object)
    -> infra::Result<std::string>
{
    auto path = object_path(object);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    const auto upload_id = new_upload_id();
    const auto dir = root_ / kStagingDir / upload_id;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(as_remote(infra::make_io_error(
            fmt::format("Cannot create staging directory {}", dir.string()), ec)));
    }

    std::ofstream meta(dir / kMetaFile, std::ios::trunc);
    meta << object.bucket << '\n' << object.key << '\n';
    if (!meta.flush()) {
        return std::unexpected(remote_error(fmt::format("Cannot record upload {}", upload_id)));
    }

    spdlog::debug("Created upload {} for {}/{} in {}", upload_id, object.bucket, object.key, root_.string());
    return upload_id;
}

auto LocalObjectStore::upload_part(const core::ObjectId& object,
                                   std::string_view upload_id,
                                   std::uint64_t part_number,
                                   std::istream& body,
                                   std::uint64_t length)
    -> infra::Result<core::CompletedPart>
{
    if (part_number < 1 || part_number > kMaxPartNumber) {
        return std::unexpected(remote_error(fmt::format("Invalid part number {}", part_number)));
    }
    auto dir = upload_dir(object, upload_id);
    if (!dir) {
        return std::unexpected(std::move(dir.error()));
    }

    const auto part_path = *dir / std::to_string(part_number);
    auto tmp_path = part_path;
    tmp_path += ".tmp";

    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(remote_error(fmt::format("Cannot stage part {}", part_number)));
    }

    infra::XXH64Digest digest;
    std::vector<char> buffer(fs::kCopyBufferSize);
    std::uint64_t received = 0;
    while (body.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || body.gcount() > 0) {
        const auto got = body.gcount();
        digest.update(buffer.data(), static_cast<std::size_t>(got));
        if (!out.write(buffer.data(), got)) {
            return std::unexpected(remote_error(fmt::format("Cannot stage part {}", part_number)));
        }
        received += static_cast<std::uint64_t>(got);
    }
    out.close();

    if (body.bad() || received != length) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return std::unexpected(remote_error(fmt::format(
            "Part {}: received {} bytes, expected {}", part_number, received, length)));
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, part_path, ec);
    if (ec) {
        return std::unexpected(as_remote(infra::make_io_error(
            fmt::format("Cannot store part {}", part_number), ec)));
    }

    return core::CompletedPart{
        .part_number = part_number,
        .e_tag = infra::XXH64Digest::to_hex(digest.digest()),
    };
}

auto LocalObjectStore::complete_multipart_upload(const core::ObjectId& object,
                                                 std::string_view upload_id,
                                                 const std::vector<core::CompletedPart>& parts)
    -> infra::Result<std::string>
{
    auto dir = upload_dir(object, upload_id);
    if (!dir) {
        return std::unexpected(std::move(dir.error()));
    }
    auto target = object_path(object);
    if (!target) {
        return std::unexpected(std::move(target.error()));
    }
    if (parts.empty()) {
        return std::unexpected(remote_error("A multipart upload needs at least one part"));
    }

    // Every receipt must name a staged part with the same content, in ascending order.
    infra::XXH64Digest object_digest;
    std::uint64_t previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            return std::unexpected(remote_error(fmt::format(
                "Parts must be in ascending order, got {} after {}", part.part_number, previous)));
        }
        previous = part.part_number;

        auto hash = infra::XXH64Digest::hash_file(*dir / std::to_string(part.part_number));
        if (!hash) {
            return std::unexpected(remote_error(fmt::format("Invalid part {}", part.part_number)));
        }
        const auto e_tag = infra::XXH64Digest::to_hex(*hash);
        if (e_tag != part.e_tag) {
            return std::unexpected(remote_error(fmt::format(
                "ETag of part {} is {}, receipt says {}", part.part_number, e_tag, part.e_tag)));
        }
        object_digest.update(e_tag.data(), e_tag.size());
    }

    std::error_code ec;
    std::filesystem::create_directories(target->parent_path(), ec);
    if (ec) {
        return std::unexpected(as_remote(infra::make_io_error(
            fmt::format("Cannot create {}", target->parent_path().string()), ec)));
    }

    auto assembled = *target;
    assembled += fmt::format(".{}.tmp", upload_id);
    {
        std::ofstream out(assembled, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(remote_error(fmt::format("Cannot create {}", assembled.string())));
        }
        for (const auto& part : parts) {
            std::ifstream in(*dir / std::to_string(part.part_number), std::ios::binary);
            const auto copied = fs::copy_stream(in, out);
            if (!in && !in.eof()) {
                return std::unexpected(remote_error(fmt::format("Cannot read part {}", part.part_number)));
            }
            if (copied.read_failed || copied.write_failed) {
                std::filesystem::remove(assembled, ec);
                return std::unexpected(remote_error(fmt::format(
                    "Cannot assemble part {} into {}", part.part_number, assembled.string())));
            }
        }
    }

    std::filesystem::rename(assembled, *target, ec);
    if (ec) {
        return std::unexpected(as_remote(infra::make_io_error(
            fmt::format("Cannot move {} into place", assembled.string()), ec)));
    }

    std::filesystem::remove_all(*dir, ec);
    if (ec) {
        spdlog::warn("Completed upload {}, but its staging directory remains: {}", upload_id, ec.message());
    }

    return fmt::format("{}-{}", infra::XXH64Digest::to_hex(object_digest.digest()), parts.size());
}

auto LocalObjectStore::abort_multipart_upload(const core::ObjectId& object,
                                              std::string_view upload_id)
    -> infra::VoidResult
{
    auto dir = upload_dir(object, upload_id);
    if (!dir) {
        return std::unexpected(std::move(dir.error()));
    }

    std::error_code ec;
    std::filesystem::remove_all(*dir, ec);
    if (ec) {
        return std::unexpected(as_remote(infra::make_io_error(
            fmt::format("Cannot remove upload {}", upload_id), ec)));
    }
    spdlog::debug("Aborted upload {} for {}/{}", upload_id, object.bucket, object.key);
    return {};
}

auto LocalObjectStore::object_size(const core::ObjectId& object)
    -> infra::Result<std::uint64_t>
{
    auto path = object_path(object);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }
    auto size = fs::file_size(*path);
    if (!size) {
        return std::unexpected(remote_error(fmt::format("No such key: {}/{}", object.bucket, object.key)));
    }
    return *size;
}

auto LocalObjectStore::read_range(const core::ObjectId& object,
                                  core::ByteRange range,
                                  std::ostream& sink)
    -> infra::Result<std::uint64_t>
{
    auto size = object_size(object);
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }
    if (range.first > range.last || range.first >= *size) {
        return std::unexpected(remote_error(fmt::format(
            "Invalid range {}-{} for an object of {} bytes", range.first, range.last, *size)));
    }
    const auto last = std::min(range.last, *size - 1);

    auto in = fs::open_for_read_at(*object_path(object), range.first);
    if (!in) {
        return std::unexpected(as_remote(std::move(in.error())));
    }

    const auto copied = fs::copy_stream(*in, sink, last - range.first + 1);
    if (copied.read_failed || copied.write_failed) {
        return std::unexpected(remote_error(fmt::format(
            "Transfer of range {}-{} broke off after {} bytes", range.first, last, copied.bytes)));
    }
    return copied.bytes;
}

} // namespace persevere::adapters

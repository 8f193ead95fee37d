#include "fs.hpp"
#include <algorithm>
#include <cerrno>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace persevere::adapters::fs {

namespace {

auto last_errno() -> std::error_code {
    return std::error_code(errno, std::generic_category());
}

} // namespace

auto file_size(const std::filesystem::path& path)
    -> infra::Result<std::uint64_t>
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot get size of {}", path.string()), ec));
    }
    return static_cast<std::uint64_t>(size);
}

auto open_for_read_at(const std::filesystem::path& path, std::uint64_t offset)
    -> infra::Result<std::ifstream>
{
    spdlog::debug("Opening {} for reading at offset {}", path.string(), offset);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        const auto code = std::filesystem::exists(path, ec)
            ? infra::ErrorCode::PermissionDenied : infra::ErrorCode::FileNotFound;
        return std::unexpected(infra::make_error(code,
            fmt::format("Cannot open {} for reading", path.string())));
    }
    if (!file.seekg(static_cast<std::streamoff>(offset))) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot seek to offset {} in {}", offset, path.string())));
    }
    return file;
}

auto open_for_write_at(const std::filesystem::path& path, std::uint64_t offset)
    -> infra::Result<std::ofstream>
{
    spdlog::debug("Opening {} for writing at offset {}", path.string(), offset);
    // in|out keeps the existing contents and refuses to create the file.
    std::ofstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) {
        std::error_code ec;
        const auto code = std::filesystem::exists(path, ec)
            ? infra::ErrorCode::PermissionDenied : infra::ErrorCode::FileNotFound;
        return std::unexpected(infra::make_error(code,
            fmt::format("Cannot open {} for writing", path.string())));
    }
    if (!file.seekp(static_cast<std::streamoff>(offset))) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot seek to offset {} in {}", offset, path.string())));
    }
    return file;
}

auto preallocate(const std::filesystem::path& path, std::uint64_t size)
    -> infra::VoidResult
{
    spdlog::debug("Sizing {} to {} bytes", path.string(), size);
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create {}", path.string())));
        }
    }

    std::error_code ec;
    std::filesystem::resize_file(path, size, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot resize {} to {} bytes", path.string(), size), ec));
    }
    return {};
}

auto remove_if_exists(const std::filesystem::path& path)
    -> infra::Result<bool>
{
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot remove {}", path.string()), ec));
    }
    return removed;
}

auto write_file_atomically(const std::filesystem::path& path, std::string_view contents)
    -> infra::VoidResult
{
    auto tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot open {}", tmp.string()), last_errno()));
    }

    const char* data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            const auto ec = last_errno();
            ::close(fd);
            ::unlink(tmp.c_str());
            return std::unexpected(infra::make_io_error(
                fmt::format("Cannot write {}", tmp.string()), ec));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) == -1) {
        const auto ec = last_errno();
        ::close(fd);
        ::unlink(tmp.c_str());
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot sync {}", tmp.string()), ec));
    }
    if (::close(fd) == -1) {
        const auto ec = last_errno();
        ::unlink(tmp.c_str());
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot close {}", tmp.string()), ec));
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        ::unlink(tmp.c_str());
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot move {} into place", tmp.string()), ec));
    }
    return {};
}

auto copy_stream(std::istream& in, std::ostream& out, std::uint64_t limit) -> CopyResult {
    CopyResult result;
    std::vector<char> buffer(kCopyBufferSize);

    while (result.bytes < limit) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(buffer.size(), limit - result.bytes));
        in.read(buffer.data(), want);
        const auto got = in.gcount();
        if (got > 0) {
            if (!out.write(buffer.data(), got)) {
                result.write_failed = true;
                return result;
            }
            result.bytes += static_cast<std::uint64_t>(got);
        }
        if (got < want) {
            result.read_failed = in.bad();
            break;
        }
    }

    if (!out.flush()) {
        result.write_failed = true;
    }
    return result;
}

} // namespace persevere::adapters::fs

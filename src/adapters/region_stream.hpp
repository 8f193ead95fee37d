#pragma once

#include <algorithm>
#include <cstdint>
#include <istream>
#include <streambuf>
#include <vector>
#include "fs.hpp"

namespace persevere::adapters {

// Exposes at most `limit` bytes of `source` as a stream of its own. Used to
// hand exactly one part of an open file to an object store.
class BoundedStreamBuf : public std::streambuf {
public:
    BoundedStreamBuf(std::istream& source, std::uint64_t limit)
        : source_(source), remaining_(limit), buffer_(fs::kCopyBufferSize) {}

    [[nodiscard]] auto consumed() const -> std::uint64_t { return consumed_; }
    [[nodiscard]] auto remaining() const -> std::uint64_t { return remaining_; }

    // The source ran dry (or failed) before `limit` bytes were read.
    [[nodiscard]] auto truncated() const -> bool { return truncated_; }

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        if (remaining_ == 0) {
            return traits_type::eof();
        }

        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(remaining_, buffer_.size()));
        source_.read(buffer_.data(), want);
        const auto got = source_.gcount();
        if (got <= 0) {
            truncated_ = true;
            return traits_type::eof();
        }

        remaining_ -= static_cast<std::uint64_t>(got);
        consumed_ += static_cast<std::uint64_t>(got);
        setg(buffer_.data(), buffer_.data(), buffer_.data() + got);
        return traits_type::to_int_type(*gptr());
    }

private:
    std::istream& source_;
    std::uint64_t remaining_;
    std::uint64_t consumed_ = 0;
    bool truncated_ = false;
    std::vector<char> buffer_;
};

class BoundedInputStream : public std::istream {
public:
    BoundedInputStream(std::istream& source, std::uint64_t limit)
        : std::istream(nullptr), buf_(source, limit)
    {
        rdbuf(&buf_);
    }

    [[nodiscard]] auto buffer() const -> const BoundedStreamBuf& { return buf_; }

private:
    BoundedStreamBuf buf_;
};

} // namespace persevere::adapters

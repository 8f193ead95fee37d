#pragma once

#include <cstddef>
#include <filesystem>
#include <expected>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace persevere::infra {

// Streaming xxHash64 (seed 0).
class XXH64Digest {
public:
    XXH64Digest();
    ~XXH64Digest();

    XXH64Digest(const XXH64Digest&) = delete;
    XXH64Digest& operator=(const XXH64Digest&) = delete;

    void update(const void* data, std::size_t size);
    [[nodiscard]] auto digest() const -> XXH64_hash_t;

    [[nodiscard]] static auto to_hex(XXH64_hash_t hash) -> std::string;

    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

private:
    static constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024;

    XXH64_state_t* state_;
};

} // namespace persevere::infra

#include "xxhash_digest.hpp"
#include <fstream>
#include <new>
#include <vector>
#include <fmt/core.h>

namespace persevere::infra {

XXH64Digest::XXH64Digest()
    : state_(XXH64_createState())
{
    if (!state_) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_, 0);
}

XXH64Digest::~XXH64Digest() {
    XXH64_freeState(state_);
}

void XXH64Digest::update(const void* data, std::size_t size) {
    XXH64_update(state_, data, size);
}

auto XXH64Digest::digest() const -> XXH64_hash_t {
    return XXH64_digest(state_);
}

auto XXH64Digest::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", static_cast<unsigned long long>(hash));
}

auto XXH64Digest::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                         fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    XXH64Digest digest;
    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        digest.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                         fmt::format("Error reading file: {}", path.string())));
    }

    return digest.digest();
}

} // namespace persevere::infra

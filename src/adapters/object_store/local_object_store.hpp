#pragma once

#include <filesystem>
#include "object_store.hpp"

namespace persevere::adapters {

// Object store kept in a local directory (a mounted share, or a scratch
// directory in tests):
//
//   <root>/<bucket>/<key>                 assembled objects
//   <root>/.multipart/<upload_id>/meta    bucket and key of the upload
//   <root>/.multipart/<upload_id>/<n>     staged part n
//
// Part ETags are the hex xxHash64 of the part's bytes.
class LocalObjectStore final : public ObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root);

    [[nodiscard]] auto create_multipart_upload(const core::ObjectId& object)
        -> infra::Result<std::string> override;

    [[nodiscard]] auto upload_part(const core::ObjectId& object,
                                   std::string_view upload_id,
                                   std::uint64_t part_number,
                                   std::istream& body,
                                   std::uint64_t length)
        -> infra::Result<core::CompletedPart> override;

    [[nodiscard]] auto complete_multipart_upload(const core::ObjectId& object,
                                                 std::string_view upload_id,
                                                 const std::vector<core::CompletedPart>& parts)
        -> infra::Result<std::string> override;

    [[nodiscard]] auto abort_multipart_upload(const core::ObjectId& object,
                                              std::string_view upload_id)
        -> infra::VoidResult override;

    [[nodiscard]] auto object_size(const core::ObjectId& object)
        -> infra::Result<std::uint64_t> override;

    [[nodiscard]] auto read_range(const core::ObjectId& object,
                                  core::ByteRange range,
                                  std::ostream& sink)
        -> infra::Result<std::uint64_t> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

    static constexpr std::uint64_t kMaxPartNumber = 10'000;

private:
    [[nodiscard]] auto object_path(const core::ObjectId& object) const
        -> infra::Result<std::filesystem::path>;

    // The staging directory of an open upload for `object`.
    [[nodiscard]] auto upload_dir(const core::ObjectId& object, std::string_view upload_id) const
        -> infra::Result<std::filesystem::path>;

    std::filesystem::path root_;
};

} // namespace persevere::adapters

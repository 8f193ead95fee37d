#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "../../core/types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace persevere::adapters {

// Remote object storage with a multipart upload protocol. Every failure is
// reported as ErrorCode::RemoteFailure; callers decide whether it is retried.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    [[nodiscard]] virtual auto create_multipart_upload(const core::ObjectId& object)
        -> infra::Result<std::string> = 0;

    // Consumes `body` up to its end, which must be `length` bytes away.
    [[nodiscard]] virtual auto upload_part(const core::ObjectId& object,
                                           std::string_view upload_id,
                                           std::uint64_t part_number,
                                           std::istream& body,
                                           std::uint64_t length)
        -> infra::Result<core::CompletedPart> = 0;

    // Returns the ETag of the assembled object.
    [[nodiscard]] virtual auto complete_multipart_upload(const core::ObjectId& object,
                                                         std::string_view upload_id,
                                                         const std::vector<core::CompletedPart>& parts)
        -> infra::Result<std::string> = 0;

    [[nodiscard]] virtual auto abort_multipart_upload(const core::ObjectId& object,
                                                      std::string_view upload_id)
        -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto object_size(const core::ObjectId& object)
        -> infra::Result<std::uint64_t> = 0;

    // Streams the bytes of `range` into `sink` and returns how many were written.
    // A range reaching past the end of the object is served up to the last byte.
    [[nodiscard]] virtual auto read_range(const core::ObjectId& object,
                                          core::ByteRange range,
                                          std::ostream& sink)
        -> infra::Result<std::uint64_t> = 0;
};

// "file://<dir>" or a plain directory: LocalObjectStore.
// "s3" or "s3://<endpoint>": S3ObjectStore (only when built with the AWS SDK).
[[nodiscard]] auto make_object_store(std::string_view uri)
    -> infra::Result<std::unique_ptr<ObjectStore>>;

} // namespace persevere::adapters

#pragma once

#include <memory>
#include <string>
#include "object_store.hpp"

namespace Aws::S3 { class S3Client; }

namespace persevere::adapters {

// Amazon S3 (or anything speaking its API) through the AWS SDK.
// Credentials and region come from the SDK's default provider chain.
class S3ObjectStore final : public ObjectStore {
public:
    // An empty endpoint talks to AWS itself. Otherwise path-style
    // requests go to `endpoint` ("http://localhost:9000").
    explicit S3ObjectStore(const std::string& endpoint = {});
    ~S3ObjectStore() override;

    S3ObjectStore(const S3ObjectStore&) = delete;
    S3ObjectStore& operator=(const S3ObjectStore&) = delete;

    [[nodiscard]] auto create_multipart_upload(const core::ObjectId& object)
        -> infra::Result<std::string> override;

    // The part is buffered in memory before it is sent.
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

private:
    class SdkSession;

    std::shared_ptr<SdkSession> session_;
    std::shared_ptr<Aws::S3::S3Client> client_;
};

} // namespace persevere::adapters

#include "s3_object_store.hpp"
#include <cstdlib>
#include <mutex>
#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../fs.hpp"

namespace persevere::adapters {

namespace {

constexpr const char* kAwsTag = "PersevereS3Client";
constexpr const char* kDefaultS3Region = "us-east-1";

template<typename Outcome>
auto s3_error(std::string_view what, const core::ObjectId& object, const Outcome& outcome)
    -> infra::Error
{
    const auto& error = outcome.GetError();
    const auto type = error.GetErrorType();
    const auto code = type == Aws::S3::S3Errors::REQUEST_TIMEOUT || type == Aws::S3::S3Errors::NETWORK_CONNECTION
        ? infra::ErrorCode::NetworkTimeout
        : infra::ErrorCode::RemoteFailure;
    return infra::make_error(code, fmt::format(
        "{} ({}/{}): {}: {} [HTTP {}]",
        what, object.bucket, object.key,
        error.GetExceptionName(), error.GetMessage(),
        static_cast<int>(error.GetResponseCode())));
}

auto to_aws(std::string_view s) -> Aws::String {
    return Aws::String(s.data(), s.size());
}

auto optional_checksum(const Aws::String& value) -> std::optional<std::string> {
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value.c_str(), value.size());
}

} // namespace

// InitAPI/ShutdownAPI bracket every client; shared between stores of one process.
class S3ObjectStore::SdkSession {
public:
    SdkSession() { Aws::InitAPI(options_); }
    ~SdkSession() { Aws::ShutdownAPI(options_); }

    SdkSession(const SdkSession&) = delete;
    SdkSession& operator=(const SdkSession&) = delete;

    static auto acquire() -> std::shared_ptr<SdkSession> {
        static std::mutex mutex;
        static std::weak_ptr<SdkSession> current;
        std::lock_guard lock(mutex);
        auto session = current.lock();
        if (!session) {
            session = std::make_shared<SdkSession>();
            current = session;
        }
        return session;
    }

private:
    Aws::SDKOptions options_;
};

S3ObjectStore::S3ObjectStore(const std::string& endpoint)
    : session_(SdkSession::acquire())
{
    Aws::Client::ClientConfiguration cfg;
    if (const char* region = std::getenv("AWS_DEFAULT_REGION"); region != nullptr && *region != '\0') {
        cfg.region = region;
    }
    if (cfg.region.empty()) {
        cfg.region = kDefaultS3Region;
    }
    // Retries are ours, the SDK must report the first failure.
    cfg.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAwsTag, 0);

    bool use_virtual_addressing = true;
    if (!endpoint.empty()) {
        cfg.endpointOverride = to_aws(endpoint);
        if (endpoint.starts_with("http://")) {
            cfg.scheme = Aws::Http::Scheme::HTTP;
        }
        use_virtual_addressing = false;
    }

    spdlog::debug("S3 client: region {}, endpoint {}", cfg.region,
                  endpoint.empty() ? std::string("default") : endpoint);
    client_ = Aws::MakeShared<Aws::S3::S3Client>(
        kAwsTag, Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(kAwsTag), cfg,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        use_virtual_addressing);
}

// Clients must be gone before ShutdownAPI.
S3ObjectStore::~S3ObjectStore() {
    client_.reset();
}

auto S3ObjectStore::create_multipart_upload(const core::ObjectId& object)
    -> infra::Result<std::string>
{
    Aws::S3::Model::CreateMultipartUploadRequest request;
    request.WithBucket(to_aws(object.bucket)).WithKey(to_aws(object.key));

    auto outcome = client_->CreateMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(s3_error("CreateMultipartUpload failed", object, outcome));
    }
    const auto& upload_id = outcome.GetResult().GetUploadId();
    return std::string(upload_id.c_str(), upload_id.size());
}

auto S3ObjectStore::upload_part(const core::ObjectId& object,
                                std::string_view upload_id,
                                std::uint64_t part_number,
                                std::istream& body,
                                std::uint64_t length)
    -> infra::Result<core::CompletedPart>
{
    auto buffer = Aws::MakeShared<Aws::StringStream>(kAwsTag);
    const auto copied = fs::copy_stream(body, *buffer, length);
    if (copied.read_failed || copied.write_failed || copied.bytes != length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteFailure, fmt::format(
            "Could only buffer {} of the {} bytes of part {}", copied.bytes, length, part_number)));
    }

    Aws::S3::Model::UploadPartRequest request;
    request.WithBucket(to_aws(object.bucket))
        .WithKey(to_aws(object.key))
        .WithUploadId(to_aws(upload_id))
        .WithPartNumber(static_cast<int>(part_number))
        .WithContentLength(static_cast<long long>(length));
    request.SetBody(buffer);

    auto outcome = client_->UploadPart(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(s3_error(fmt::format("UploadPart {} failed", part_number), object, outcome));
    }

    const auto& result = outcome.GetResult();
    core::CompletedPart part;
    part.part_number = part_number;
    part.e_tag = std::string(result.GetETag().c_str(), result.GetETag().size());
    part.checksum_crc32 = optional_checksum(result.GetChecksumCRC32());
    part.checksum_crc32c = optional_checksum(result.GetChecksumCRC32C());
    part.checksum_sha1 = optional_checksum(result.GetChecksumSHA1());
    part.checksum_sha256 = optional_checksum(result.GetChecksumSHA256());
    return part;
}

auto S3ObjectStore::complete_multipart_upload(const core::ObjectId& object,
                                              std::string_view upload_id,
                                              const std::vector<core::CompletedPart>& parts)
    -> infra::Result<std::string>
{
    Aws::S3::Model::CompletedMultipartUpload completed;
    for (const auto& part : parts) {
        Aws::S3::Model::CompletedPart aws_part;
        aws_part.WithPartNumber(static_cast<int>(part.part_number)).WithETag(to_aws(part.e_tag));
        if (part.checksum_crc32) aws_part.SetChecksumCRC32(to_aws(*part.checksum_crc32));
        if (part.checksum_crc32c) aws_part.SetChecksumCRC32C(to_aws(*part.checksum_crc32c));
        if (part.checksum_sha1) aws_part.SetChecksumSHA1(to_aws(*part.checksum_sha1));
        if (part.checksum_sha256) aws_part.SetChecksumSHA256(to_aws(*part.checksum_sha256));
        completed.AddParts(std::move(aws_part));
    }

    Aws::S3::Model::CompleteMultipartUploadRequest request;
    request.WithBucket(to_aws(object.bucket))
        .WithKey(to_aws(object.key))
        .WithUploadId(to_aws(upload_id))
        .WithMultipartUpload(std::move(completed));

    auto outcome = client_->CompleteMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(s3_error("CompleteMultipartUpload failed", object, outcome));
    }
    const auto& e_tag = outcome.GetResult().GetETag();
    return std::string(e_tag.c_str(), e_tag.size());
}

auto S3ObjectStore::abort_multipart_upload(const core::ObjectId& object,
                                           std::string_view upload_id)
    -> infra::VoidResult
{
    Aws::S3::Model::AbortMultipartUploadRequest request;
    request.WithBucket(to_aws(object.bucket))
        .WithKey(to_aws(object.key))
        .WithUploadId(to_aws(upload_id));

    auto outcome = client_->AbortMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(s3_error("AbortMultipartUpload failed", object, outcome));
    }
    return {};
}

auto S3ObjectStore::object_size(const core::ObjectId& object)
    -> infra::Result<std::uint64_t>
{
    Aws::S3::Model::HeadObjectRequest request;
    request.WithBucket(to_aws(object.bucket)).WithKey(to_aws(object.key));

    auto outcome = client_->HeadObject(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(s3_error("HeadObject failed", object, outcome));
    }
    const auto size = outcome.GetResult().GetContentLength();
    if (size < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteFailure, fmt::format(
            "HeadObject of {}/{} reported no content length", object.bucket, object.key)));
    }
    return static_cast<std::uint64_t>(size);
}

auto S3ObjectStore::read_range(const core::ObjectId& object,
                               core::ByteRange range,
                               std::ostream& sink)
    -> infra::Result<std::uint64_t>
{
    Aws::S3::Model::GetObjectRequest request;
    request.WithBucket(to_aws(object.bucket))
        .WithKey(to_aws(object.key))
        .WithRange(to_aws(fmt::format("bytes={}-{}", range.first, range.last)));

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        return std::unexpected(s3_error("GetObject failed", object, outcome));
    }

    auto result = outcome.GetResultWithOwnership();
    const auto copied = fs::copy_stream(result.GetBody(), sink);
    if (copied.read_failed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteFailure, fmt::format(
            "Response body of {}/{} broke off after {} bytes", object.bucket, object.key, copied.bytes)));
    }
    return copied.bytes;
}

} // namespace persevere::adapters

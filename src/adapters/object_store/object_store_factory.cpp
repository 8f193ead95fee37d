#include "object_store.hpp"
#include <filesystem>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "local_object_store.hpp"
#ifdef PERSEVERE_WITH_S3
#include "s3_object_store.hpp"
#endif

namespace persevere::adapters {

namespace {

constexpr std::string_view kFileScheme = "file://";
constexpr std::string_view kS3Scheme = "s3://";

auto make_local_store(std::string_view directory)
    -> infra::Result<std::unique_ptr<ObjectStore>>
{
    if (directory.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "A local object store needs a directory"));
    }

    const std::filesystem::path root{std::string(directory)};
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound, fmt::format(
            "Object store directory {} does not exist", root.string())));
    }
    spdlog::debug("Using the local object store in {}", root.string());
    return std::make_unique<LocalObjectStore>(root);
}

auto make_s3_store([[maybe_unused]] std::string_view endpoint)
    -> infra::Result<std::unique_ptr<ObjectStore>>
{
#ifdef PERSEVERE_WITH_S3
    return std::make_unique<S3ObjectStore>(std::string(endpoint));
#else
    return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedFeature,
        "This build has no S3 support, use a file:// store instead"));
#endif
}

} // namespace

auto make_object_store(std::string_view uri)
    -> infra::Result<std::unique_ptr<ObjectStore>>
{
    if (uri == "s3") {
        return make_s3_store({});
    }
    if (uri.starts_with(kS3Scheme)) {
        auto endpoint = uri.substr(kS3Scheme.size());
        // s3://host:port talks plain HTTP unless a scheme is spelled out.
        if (endpoint.find("://") == std::string_view::npos) {
            return make_s3_store(fmt::format("http://{}", endpoint));
        }
        return make_s3_store(endpoint);
    }
    if (uri.starts_with(kFileScheme)) {
        return make_local_store(uri.substr(kFileScheme.size()));
    }
    return make_local_store(uri);
}

} // namespace persevere::adapters

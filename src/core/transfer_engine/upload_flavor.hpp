#pragma once

#include <string>
#include <string_view>
#include "transfer_engine.hpp"
#include "../../adapters/object_store/object_store.hpp"

namespace persevere::core {

// Local file -> multipart upload.
class UploadFlavor {
public:
    using Receipt = CompletedPart;
    static constexpr Direction direction = Direction::Upload;

    explicit UploadFlavor(adapters::ObjectStore& store, ServiceLimits limits = upload_limits())
        : store_(store), limits_(limits) {}

    // Plans the parts and creates the remote multipart upload.
    [[nodiscard]] auto begin(const TransferRequest& request)
        -> infra::Result<extensions::TransferState>;

    // The source must still have the size the plan was made for.
    [[nodiscard]] auto validate_resume(const extensions::TransferState& state)
        -> infra::VoidResult;

    [[nodiscard]] auto transfer_part(const extensions::TransferState& state,
                                     const PartDescriptor& part)
        -> infra::Result<CompletedPart>;

    void record(extensions::TransferState& state, CompletedPart receipt);

    [[nodiscard]] auto verify_complete(const extensions::TransferState& state)
        -> infra::VoidResult;

    // Completes the multipart upload and returns the ETag of the object.
    [[nodiscard]] auto finalize(const extensions::TransferState& state)
        -> infra::Result<std::string>;

    [[nodiscard]] auto cancel(const extensions::TransferState& state)
        -> infra::VoidResult;

private:
    adapters::ObjectStore& store_;
    ServiceLimits limits_;
};

static_assert(TransferFlavor<UploadFlavor>);

} // namespace persevere::core

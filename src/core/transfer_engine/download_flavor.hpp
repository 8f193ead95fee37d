#pragma once

#include <cstdint>
#include <string>
#include "transfer_engine.hpp"
#include "../../adapters/object_store/object_store.hpp"

namespace persevere::core {

// Remote object -> pre-allocated local file, one ranged read per part.
class DownloadFlavor {
public:
    // Bytes written; the file itself is the record.
    using Receipt = std::uint64_t;
    static constexpr Direction direction = Direction::Download;

    explicit DownloadFlavor(adapters::ObjectStore& store, ServiceLimits limits = download_limits())
        : store_(store), limits_(limits) {}

    [[nodiscard]] auto begin(const TransferRequest& request)
        -> infra::Result<extensions::TransferState>;

    [[nodiscard]] auto validate_resume(const extensions::TransferState& state)
        -> infra::VoidResult;

    [[nodiscard]] auto transfer_part(const extensions::TransferState& state,
                                     const PartDescriptor& part)
        -> infra::Result<std::uint64_t>;

    void record(extensions::TransferState&, std::uint64_t) {}

    [[nodiscard]] auto verify_complete(const extensions::TransferState& state)
        -> infra::VoidResult;

    // Nothing to commit remotely; returns an empty ETag.
    [[nodiscard]] auto finalize(const extensions::TransferState& state)
        -> infra::Result<std::string>;

    // Downloads hold nothing remotely. The partial output is left in place.
    [[nodiscard]] auto cancel(const extensions::TransferState& state)
        -> infra::VoidResult;

private:
    adapters::ObjectStore& store_;
    ServiceLimits limits_;
};

static_assert(TransferFlavor<DownloadFlavor>);

} // namespace persevere::core

#pragma once

#include <cstdint>
#include "../types.hpp"
#include "../transfer_plan/transfer_plan.hpp"
#include "../../adapters/object_store/object_store.hpp"
#include "../../extensions/state_store/state_store.hpp"
#include "../../infra/error_handler/error.hpp"

namespace persevere::core {

/// Uploads one part of state.local_path. Local open/seek failures and a source
/// shorter than the part are unrecoverable; failures of the store are retryable.
[[nodiscard]] auto upload_part(adapters::ObjectStore& store,
                               const extensions::TransferState& state,
                               const PartDescriptor& part)
    -> infra::Result<CompletedPart>;

/// Downloads one part into the pre-allocated state.local_path and returns the
/// number of bytes written. Local open/seek/write failures are unrecoverable;
/// failed requests, broken streams and short bodies are retryable.
[[nodiscard]] auto download_part(adapters::ObjectStore& store,
                                 const extensions::TransferState& state,
                                 const PartDescriptor& part)
    -> infra::Result<std::uint64_t>;

} // namespace persevere::core

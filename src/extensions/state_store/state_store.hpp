// State file of one resumable transfer.
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../../core/types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace persevere::extensions {

inline constexpr int kStateVersion = 1;

struct TransferState {
    core::Direction direction = core::Direction::Upload;
    std::string store;
    std::string bucket;
    std::string key;
    std::filesystem::path local_path;
    std::uint64_t object_size = 0;
    std::uint64_t part_size = 0;
    std::uint64_t part_count = 0;
    std::optional<std::string> upload_id;          // uploads only
    std::uint64_t last_completed_part = 0;         // 0 = none
    std::vector<core::CompletedPart> completed_parts; // uploads only, parts 1..last_completed_part
    std::optional<std::string> failure;            // set once the transfer failed unrecoverably
    bool remote_aborted = false;

    [[nodiscard]] auto object() const -> core::ObjectId { return {bucket, key}; }

    bool operator==(const TransferState&) const = default;
};

/// InvalidArgument unless `value` is valid UTF-8. State files are JSON, which
/// has no way to carry other bytes.
[[nodiscard]] auto check_storable_text(std::string_view field, std::string_view value)
    -> infra::VoidResult;

/// check_storable_text over every string of `state`.
[[nodiscard]] auto check_storable(const TransferState& state) -> infra::VoidResult;

[[nodiscard]] auto to_json(const TransferState& state) -> std::string;

[[nodiscard]] auto from_json(const std::string& text) -> infra::Result<TransferState>;

/// FileNotFound when there is no state file, StateCorrupt when it can't be used.
[[nodiscard]] auto load_state(const std::filesystem::path& state_file)
    -> infra::Result<TransferState>;

/// Replaces the whole file through a temporary sibling and a rename.
/// Refuses a state that would not read back identically.
[[nodiscard]] auto save_state(const TransferState& state,
                              const std::filesystem::path& state_file)
    -> infra::VoidResult;

/// A missing file counts as removed.
[[nodiscard]] auto remove_state(const std::filesystem::path& state_file)
    -> infra::VoidResult;

/// Sole writer of one state file. Move-only: whoever holds the handle is the
/// only code that can persist or delete the file.
class StateHandle {
public:
    /// Fails with AlreadyExists if `state_file` is present, otherwise writes it.
    [[nodiscard]] static auto create(std::filesystem::path state_file, TransferState state)
        -> infra::Result<StateHandle>;

    [[nodiscard]] static auto open(std::filesystem::path state_file)
        -> infra::Result<StateHandle>;

    StateHandle(const StateHandle&) = delete;
    StateHandle& operator=(const StateHandle&) = delete;
    StateHandle(StateHandle&&) noexcept = default;
    StateHandle& operator=(StateHandle&&) noexcept = default;
    ~StateHandle() = default;

    [[nodiscard]] auto state() -> TransferState& { return state_; }
    [[nodiscard]] auto state() const -> const TransferState& { return state_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto persist() -> infra::VoidResult;

    /// Deletes the state file; the handle is consumed.
    [[nodiscard]] auto release() && -> infra::VoidResult;

private:
    StateHandle(std::filesystem::path path, TransferState state)
        : path_(std::move(path)), state_(std::move(state)) {}

    std::filesystem::path path_;
    TransferState state_;
};

} // namespace persevere::extensions

// state_store.cpp
#include "state_store.hpp"
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include "../../adapters/fs.hpp"
#include "../../core/transfer_plan/transfer_plan.hpp"

namespace persevere::extensions {

namespace {

auto corrupt(std::string_view message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::StateCorrupt, message);
}

template<typename T>
auto required_field(const YAML::Node& node, const char* name) -> infra::Result<T> {
    const YAML::Node value = node[name];
    if (!value || value.IsNull()) {
        return std::unexpected(corrupt(fmt::format("Missing field '{}'", name)));
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        return std::unexpected(corrupt(fmt::format("Invalid field '{}': {}", name, e.what())));
    }
}

template<typename T>
auto optional_field(const YAML::Node& node, const char* name) -> infra::Result<std::optional<T>> {
    const YAML::Node value = node[name];
    if (!value || value.IsNull()) {
        return std::optional<T>{};
    }
    try {
        return std::optional<T>{value.as<T>()};
    } catch (const YAML::Exception& e) {
        return std::unexpected(corrupt(fmt::format("Invalid field '{}': {}", name, e.what())));
    }
}

void emit_optional(YAML::Emitter& out, const char* name, const std::optional<std::string>& value) {
    if (value) {
        out << YAML::Key << name << YAML::Value << *value;
    }
}

// Length of the UTF-8 sequence starting at `text[i]`, 0 if it is malformed,
// overlong, a surrogate or beyond U+10FFFF.
auto utf8_sequence_length(std::string_view text, std::size_t i) -> std::size_t {
    const auto byte = [&](std::size_t at) { return static_cast<unsigned char>(text[at]); };
    const unsigned char lead = byte(i);
    if (lead < 0x80) return 1;

    std::size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) min_second = 0xA0;
        if (lead == 0xED) max_second = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) min_second = 0x90;
        if (lead == 0xF4) max_second = 0x8F;
    } else {
        return 0;
    }

    if (i + length > text.size()) return 0;
    if (byte(i + 1) < min_second || byte(i + 1) > max_second) return 0;
    for (std::size_t k = 2; k < length; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) return 0;
    }
    return length;
}

auto parse_part(const YAML::Node& node) -> infra::Result<core::CompletedPart> {
    if (!node.IsMap()) {
        return std::unexpected(corrupt("Completed part is not an object"));
    }
    core::CompletedPart part;

    auto number = required_field<std::uint64_t>(node, "part_number");
    if (!number) return std::unexpected(std::move(number.error()));
    part.part_number = *number;

    auto e_tag = optional_field<std::string>(node, "e_tag");
    if (!e_tag) return std::unexpected(std::move(e_tag.error()));
    part.e_tag = e_tag->value_or("");

    struct Checksum {
        const char* name;
        std::optional<std::string>* target;
    };
    const Checksum checksums[] = {
        {"checksum_crc32", &part.checksum_crc32},
        {"checksum_crc32_c", &part.checksum_crc32c},
        {"checksum_sha1", &part.checksum_sha1},
        {"checksum_sha256", &part.checksum_sha256},
    };
    for (const auto& checksum : checksums) {
        auto value = optional_field<std::string>(node, checksum.name);
        if (!value) return std::unexpected(std::move(value.error()));
        *checksum.target = std::move(*value);
    }
    return part;
}

// Structure first, then the invariants resume depends on.
auto parse_state(const YAML::Node& root) -> infra::Result<TransferState> {
    if (!root.IsMap()) {
        return std::unexpected(corrupt("State file does not contain an object"));
    }

    auto version = required_field<int>(root, "version");
    if (!version) return std::unexpected(std::move(version.error()));
    if (*version != kStateVersion) {
        return std::unexpected(corrupt(fmt::format("Unsupported state file version {}", *version)));
    }

    TransferState state;

    auto direction = required_field<std::string>(root, "direction");
    if (!direction) return std::unexpected(std::move(direction.error()));
    if (*direction == core::to_string(core::Direction::Upload)) {
        state.direction = core::Direction::Upload;
    } else if (*direction == core::to_string(core::Direction::Download)) {
        state.direction = core::Direction::Download;
    } else {
        return std::unexpected(corrupt(fmt::format("Unknown direction '{}'", *direction)));
    }

    auto store = required_field<std::string>(root, "store");
    if (!store) return std::unexpected(std::move(store.error()));
    state.store = std::move(*store);

    auto bucket = required_field<std::string>(root, "bucket");
    if (!bucket) return std::unexpected(std::move(bucket.error()));
    state.bucket = std::move(*bucket);

    auto key = required_field<std::string>(root, "key");
    if (!key) return std::unexpected(std::move(key.error()));
    state.key = std::move(*key);

    auto local_path = required_field<std::string>(root, "local_path");
    if (!local_path) return std::unexpected(std::move(local_path.error()));
    state.local_path = std::move(*local_path);

    auto object_size = required_field<std::uint64_t>(root, "object_size");
    if (!object_size) return std::unexpected(std::move(object_size.error()));
    state.object_size = *object_size;

    auto part_size = required_field<std::uint64_t>(root, "part_size");
    if (!part_size) return std::unexpected(std::move(part_size.error()));
    state.part_size = *part_size;

    auto part_count = required_field<std::uint64_t>(root, "part_count");
    if (!part_count) return std::unexpected(std::move(part_count.error()));
    state.part_count = *part_count;

    auto last_completed = required_field<std::uint64_t>(root, "last_completed_part");
    if (!last_completed) return std::unexpected(std::move(last_completed.error()));
    state.last_completed_part = *last_completed;

    auto upload_id = optional_field<std::string>(root, "upload_id");
    if (!upload_id) return std::unexpected(std::move(upload_id.error()));
    state.upload_id = std::move(*upload_id);

    auto failure = optional_field<std::string>(root, "failure");
    if (!failure) return std::unexpected(std::move(failure.error()));
    state.failure = std::move(*failure);

    auto remote_aborted = optional_field<bool>(root, "remote_aborted");
    if (!remote_aborted) return std::unexpected(std::move(remote_aborted.error()));
    state.remote_aborted = remote_aborted->value_or(false);

    if (const YAML::Node parts = root["completed_parts"]; parts && !parts.IsNull()) {
        if (!parts.IsSequence()) {
            return std::unexpected(corrupt("'completed_parts' is not an array"));
        }
        for (const auto& node : parts) {
            auto part = parse_part(node);
            if (!part) return std::unexpected(std::move(part.error()));
            state.completed_parts.push_back(std::move(*part));
        }
    }

    if (state.object_size == 0 || state.part_size == 0) {
        return std::unexpected(corrupt("Object size and part size must be positive"));
    }
    if (state.part_count != core::div_ceil(state.object_size, state.part_size)) {
        return std::unexpected(corrupt(fmt::format(
            "Part count {} does not match {} bytes in parts of {} bytes",
            state.part_count, state.object_size, state.part_size)));
    }
    if (state.last_completed_part > state.part_count) {
        return std::unexpected(corrupt(fmt::format(
            "Last completed part {} is beyond the part count {}",
            state.last_completed_part, state.part_count)));
    }

    if (state.direction == core::Direction::Upload) {
        if (!state.upload_id || state.upload_id->empty()) {
            return std::unexpected(corrupt("Upload state has no upload ID"));
        }
        if (state.completed_parts.size() != state.last_completed_part) {
            return std::unexpected(corrupt(fmt::format(
                "{} completed parts recorded, but the last completed part is {}",
                state.completed_parts.size(), state.last_completed_part)));
        }
        for (std::size_t i = 0; i < state.completed_parts.size(); ++i) {
            if (state.completed_parts[i].part_number != i + 1) {
                return std::unexpected(corrupt(fmt::format(
                    "Completed part at position {} has part number {}",
                    i + 1, state.completed_parts[i].part_number)));
            }
        }
    } else if (!state.completed_parts.empty()) {
        return std::unexpected(corrupt("Download state must not carry completed parts"));
    }

    return state;
}

} // namespace

auto check_storable_text(std::string_view field, std::string_view value)
    -> infra::VoidResult
{
    for (std::size_t i = 0; i < value.size();) {
        const auto length = utf8_sequence_length(value, i);
        if (length == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, fmt::format(
                "The {} is not valid UTF-8 (byte {}) and can't be recorded in a state file",
                field, i)));
        }
        i += length;
    }
    return {};
}

auto check_storable(const TransferState& state) -> infra::VoidResult {
    const std::pair<std::string_view, const std::string*> fields[] = {
        {"store", &state.store},
        {"bucket", &state.bucket},
        {"key", &state.key},
        {"local path", &state.local_path.native()},
    };
    for (const auto& [field, value] : fields) {
        if (auto checked = check_storable_text(field, *value); !checked) {
            return checked;
        }
    }
    for (const auto* text : {&state.upload_id, &state.failure}) {
        if (*text) {
            if (auto checked = check_storable_text("upload ID or failure", **text); !checked) {
                return checked;
            }
        }
    }
    for (const auto& part : state.completed_parts) {
        if (auto checked = check_storable_text(fmt::format("ETag of part {}", part.part_number), part.e_tag);
            !checked) {
            return checked;
        }
        for (const auto* checksum : {&part.checksum_crc32, &part.checksum_crc32c,
                                     &part.checksum_sha1, &part.checksum_sha256}) {
            if (*checksum) {
                if (auto checked = check_storable_text(
                        fmt::format("checksum of part {}", part.part_number), **checksum); !checked) {
                    return checked;
                }
            }
        }
    }
    return {};
}

auto to_json(const TransferState& state) -> std::string {
    YAML::Emitter out;
    out.SetOutputCharset(YAML::EscapeAsJson);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);

    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kStateVersion;
    out << YAML::Key << "direction" << YAML::Value << std::string(core::to_string(state.direction));
    out << YAML::Key << "store" << YAML::Value << state.store;
    out << YAML::Key << "bucket" << YAML::Value << state.bucket;
    out << YAML::Key << "key" << YAML::Value << state.key;
    out << YAML::Key << "local_path" << YAML::Value << state.local_path.string();
    out << YAML::Key << "object_size" << YAML::Value << state.object_size;
    out << YAML::Key << "part_size" << YAML::Value << state.part_size;
    out << YAML::Key << "part_count" << YAML::Value << state.part_count;
    emit_optional(out, "upload_id", state.upload_id);
    out << YAML::Key << "last_completed_part" << YAML::Value << state.last_completed_part;

    out << YAML::Key << "completed_parts" << YAML::Value << YAML::BeginSeq;
    for (const auto& part : state.completed_parts) {
        out << YAML::BeginMap;
        out << YAML::Key << "part_number" << YAML::Value << part.part_number;
        out << YAML::Key << "e_tag" << YAML::Value << part.e_tag;
        emit_optional(out, "checksum_crc32", part.checksum_crc32);
        emit_optional(out, "checksum_crc32_c", part.checksum_crc32c);
        emit_optional(out, "checksum_sha1", part.checksum_sha1);
        emit_optional(out, "checksum_sha256", part.checksum_sha256);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    emit_optional(out, "failure", state.failure);
    out << YAML::Key << "remote_aborted" << YAML::Value << state.remote_aborted;
    out << YAML::EndMap;

    return std::string(out.c_str(), out.size());
}

auto from_json(const std::string& text) -> infra::Result<TransferState> {
    try {
        return parse_state(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        return std::unexpected(corrupt(fmt::format("Failed to parse state: {}", e.what())));
    }
}

auto load_state(const std::filesystem::path& state_file)
    -> infra::Result<TransferState>
{
    std::error_code ec;
    if (!std::filesystem::exists(state_file, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("State file {} does not exist", state_file.string())));
    }

    spdlog::debug("Loading state file {}", state_file.string());
    try {
        auto state = parse_state(YAML::LoadFile(state_file.string()));
        if (!state) {
            return std::unexpected(std::move(state.error()).context(
                fmt::format("Failed to deserialize state file {}", state_file.string())));
        }
        return state;
    } catch (const YAML::BadFile& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Failed to open state file {}: {}", state_file.string(), e.what())));
    } catch (const YAML::Exception& e) {
        return std::unexpected(corrupt(fmt::format(
            "Failed to deserialize state file {}: {}", state_file.string(), e.what())));
    }
}

auto save_state(const TransferState& state,
                const std::filesystem::path& state_file)
    -> infra::VoidResult
{
    spdlog::debug("Writing state file {} (last completed part {} of {})",
                  state_file.string(), state.last_completed_part, state.part_count);
    if (auto storable = check_storable(state); !storable) {
        return std::unexpected(std::move(storable.error()).context("Failed to write state file"));
    }
    auto written = adapters::fs::write_file_atomically(state_file, to_json(state));
    if (!written) {
        return std::unexpected(std::move(written.error()).context("Failed to write state file"));
    }
    return {};
}

auto remove_state(const std::filesystem::path& state_file)
    -> infra::VoidResult
{
    spdlog::debug("Removing state file {}", state_file.string());
    auto removed = adapters::fs::remove_if_exists(state_file);
    if (!removed) {
        return std::unexpected(std::move(removed.error()).context("Failed to remove state file"));
    }
    if (!*removed) {
        spdlog::debug("State file {} did not exist", state_file.string());
    }
    return {};
}

auto StateHandle::create(std::filesystem::path state_file, TransferState state)
    -> infra::Result<StateHandle>
{
    std::error_code ec;
    if (std::filesystem::exists(state_file, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
            fmt::format("The state file {} already exists. Use 'resume' to continue that transfer, "
                        "or remove the file or pick another one to start a new transfer.",
                        state_file.string())));
    }
    if (ec) {
        return std::unexpected(infra::make_io_error(
            fmt::format("Cannot check state file {}", state_file.string()), ec));
    }

    StateHandle handle{std::move(state_file), std::move(state)};
    auto persisted = handle.persist();
    if (!persisted) {
        return std::unexpected(std::move(persisted.error()));
    }
    return handle;
}

auto StateHandle::open(std::filesystem::path state_file)
    -> infra::Result<StateHandle>
{
    auto state = load_state(state_file);
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }
    return StateHandle{std::move(state_file), std::move(*state)};
}

auto StateHandle::persist() -> infra::VoidResult {
    return save_state(state_, path_);
}

auto StateHandle::release() && -> infra::VoidResult {
    return remove_state(path_);
}

} // namespace persevere::extensions

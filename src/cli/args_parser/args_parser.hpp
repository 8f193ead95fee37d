#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include "../../core/types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace persevere::args_parser {

enum class Action {
    Start,
    Resume,
    Abort,
};

struct CLIArgs
{
    core::Direction direction{core::Direction::Upload};   // upload | download
    Action action{Action::Start};                         // start | resume | abort
    std::string bucket;                                   // --s3-bucket
    std::string key;                                      // --s3-key
    std::string local_path;                               // --file-to-upload / --output
    std::string state_file;                               // --state-file
    std::optional<std::uint64_t> part_size;               // --override-part-size / --part-size
    std::optional<std::string> store;                     // --store
    std::optional<std::string> log_level;                 // --log-level
    bool quiet{false};                                    // -q, --quiet
    bool version{false};                                  // --version
    bool help{false};                                     // -h, --help
};

[[nodiscard]] auto to_string(Action action) -> std::string_view;

/// Parses command-line arguments. With --help or --version only those flags
/// are set; InvalidArgument for anything malformed.
[[nodiscard]] auto parse_args(int argc, char const* const* argv)
    -> infra::Result<CLIArgs>;

[[nodiscard]] auto usage() -> std::string;

/// What to run after a retryable failure of `args`' command: resume for
/// start and resume, the same abort again for abort.
[[nodiscard]] auto retry_hint(const CLIArgs& args) -> std::string;

} // namespace persevere::args_parser

#include "args_parser.hpp"
#include <sstream>
#include <boost/program_options.hpp>
#include <fmt/core.h>

namespace po = boost::program_options;

namespace persevere::args_parser {

namespace {

auto logging_options() -> po::options_description {
    po::options_description desc{"Logging"};
    desc.add_options()
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error, critical or off")
        ("quiet,q", "only log warnings and errors, no progress");
    return desc;
}

auto start_options(core::Direction direction) -> po::options_description {
    po::options_description desc{fmt::format("{} start", core::to_string(direction))};
    desc.add_options()
        ("s3-bucket", po::value<std::string>()->required(), "bucket of the remote object")
        ("s3-key", po::value<std::string>()->required(), "key of the remote object")
        ("state-file", po::value<std::string>()->required(), "where progress is recorded")
        ("store", po::value<std::string>(), "object store: s3, s3://<endpoint>, file://<dir>");
    if (direction == core::Direction::Upload) {
        desc.add_options()
            ("file-to-upload", po::value<std::string>()->required(), "local file to upload")
            ("override-part-size", po::value<std::uint64_t>(), "part size in bytes");
    } else {
        desc.add_options()
            ("output", po::value<std::string>()->required(), "local file to create")
            ("part-size", po::value<std::uint64_t>(), "part size in bytes");
    }
    return desc;
}

auto state_file_options(Action action) -> po::options_description {
    po::options_description desc{fmt::format("resume / abort ({})", to_string(action))};
    desc.add_options()
        ("state-file", po::value<std::string>()->required(), "state file written by start");
    return desc;
}

auto parse_direction(const std::string& word) -> std::optional<core::Direction> {
    if (word == "upload") return core::Direction::Upload;
    if (word == "download") return core::Direction::Download;
    return std::nullopt;
}

auto parse_action(const std::string& word) -> std::optional<Action> {
    if (word == "start") return Action::Start;
    if (word == "resume") return Action::Resume;
    if (word == "abort") return Action::Abort;
    return std::nullopt;
}

auto usage_error(std::string_view message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::InvalidArgument, message);
}

} // namespace

auto to_string(Action action) -> std::string_view {
    switch (action) {
        case Action::Start: return "start";
        case Action::Resume: return "resume";
        case Action::Abort: return "abort";
    }
    return "unknown";
}

auto usage() -> std::string {
    std::ostringstream out;
    out << "Usage:\n"
        << "  persevere [--log-level L] [--quiet] [--version] [--help]\n"
        << "  persevere upload start --s3-bucket B --s3-key K --file-to-upload F --state-file S\n"
        << "                         [--override-part-size N] [--store URI]\n"
        << "  persevere upload resume --state-file S\n"
        << "  persevere upload abort --state-file S\n"
        << "  persevere download start --s3-bucket B --s3-key K --output F --state-file S\n"
        << "                           [--part-size N] [--store URI]\n"
        << "  persevere download resume --state-file S\n"
        << "  persevere download abort --state-file S\n\n"
        << logging_options() << '\n'
        << start_options(core::Direction::Upload) << '\n'
        << start_options(core::Direction::Download);
    return out.str();
}

auto retry_hint(const CLIArgs& args) -> std::string {
    const auto direction = core::to_string(args.direction);
    if (args.action == Action::Abort) {
        return fmt::format("The abort can be retried with:\n  persevere {} abort --state-file '{}'\n",
                           direction, args.state_file);
    }
    return fmt::format("The {} can be resumed with:\n  persevere {} resume --state-file '{}'\n",
                       direction, direction, args.state_file);
}

auto parse_args(int argc, char const* const* argv) -> infra::Result<CLIArgs> {
    CLIArgs args{};

    po::options_description global{"Global options"};
    global.add_options()
        ("help,h", "print usage")
        ("version", "print build information")
        ("direction", po::value<std::string>(), "upload or download")
        ("action", po::value<std::string>(), "start, resume or abort")
        ("subargs", po::value<std::vector<std::string>>(), "options of the command");
    global.add(logging_options());

    po::positional_options_description positional;
    positional.add("direction", 1).add("action", 1).add("subargs", -1);

    try {
        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(global)
            .positional(positional)
            .allow_unregistered()
            .run();

        po::variables_map vm;
        po::store(parsed, vm);

        args.help = vm.count("help") > 0;
        args.version = vm.count("version") > 0;
        if (args.help || args.version) {
            return args;
        }

        if (!vm.count("direction") || !vm.count("action")) {
            return std::unexpected(usage_error("Expected a command: upload|download start|resume|abort"));
        }
        const auto direction = parse_direction(vm["direction"].as<std::string>());
        if (!direction) {
            return std::unexpected(usage_error(fmt::format(
                "Unknown command '{}', expected upload or download", vm["direction"].as<std::string>())));
        }
        const auto action = parse_action(vm["action"].as<std::string>());
        if (!action) {
            return std::unexpected(usage_error(fmt::format(
                "Unknown action '{}', expected start, resume or abort", vm["action"].as<std::string>())));
        }
        args.direction = *direction;
        args.action = *action;

        // Everything after "<direction> <action>" is parsed again with the command's own options
        std::vector<std::string> rest = po::collect_unrecognized(parsed.options, po::include_positional);
        rest.erase(rest.begin(), rest.begin() + 2);

        po::options_description command = *action == Action::Start
            ? start_options(*direction)
            : state_file_options(*action);
        command.add(logging_options());

        po::variables_map cvm;
        po::store(po::command_line_parser(rest).options(command).run(), cvm);
        po::notify(cvm);

        for (const auto* source : {&vm, &cvm}) {
            if (source->count("log-level")) args.log_level = (*source)["log-level"].as<std::string>();
            if (source->count("quiet")) args.quiet = true;
        }

        args.state_file = cvm["state-file"].as<std::string>();
        if (*action == Action::Start) {
            args.bucket = cvm["s3-bucket"].as<std::string>();
            args.key = cvm["s3-key"].as<std::string>();
            if (cvm.count("store")) args.store = cvm["store"].as<std::string>();
            if (*direction == core::Direction::Upload) {
                args.local_path = cvm["file-to-upload"].as<std::string>();
                if (cvm.count("override-part-size")) args.part_size = cvm["override-part-size"].as<std::uint64_t>();
            } else {
                args.local_path = cvm["output"].as<std::string>();
                if (cvm.count("part-size")) args.part_size = cvm["part-size"].as<std::uint64_t>();
            }
        }

        if (args.part_size && *args.part_size == 0) {
            return std::unexpected(usage_error("The part size must be positive"));
        }
    } catch (const po::error& e) {
        return std::unexpected(usage_error(e.what()));
    }

    return args;
}

} // namespace persevere::args_parser

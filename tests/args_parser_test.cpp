#include <gtest/gtest.h>

#include <vector>
#include "cli/args_parser/args_parser.hpp"

using namespace persevere;
using args_parser::Action;
using args_parser::parse_args;

namespace {

auto parse(std::vector<const char*> argv) -> infra::Result<args_parser::CLIArgs> {
    argv.insert(argv.begin(), "persevere");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ArgsParserTest, UploadStart)
{
    auto args = parse({"upload", "start", "--s3-bucket", "b", "--s3-key", "k/ey",
                       "--file-to-upload", "/data/f.bin", "--state-file", "s.json",
                       "--override-part-size", "5242880"});
    ASSERT_TRUE(args.has_value()) << args.error().message;
    EXPECT_EQ(args->direction, core::Direction::Upload);
    EXPECT_EQ(args->action, Action::Start);
    EXPECT_EQ(args->bucket, "b");
    EXPECT_EQ(args->key, "k/ey");
    EXPECT_EQ(args->local_path, "/data/f.bin");
    EXPECT_EQ(args->state_file, "s.json");
    EXPECT_EQ(args->part_size, 5242880u);
    EXPECT_FALSE(args->store.has_value());
}

TEST(ArgsParserTest, DownloadStartWithGlobalOptionsOnEitherSide)
{
    auto args = parse({"--log-level", "debug", "download", "start", "--s3-bucket=b", "--s3-key=k",
                       "--output", "out.bin", "--state-file", "s.json", "--part-size", "1024",
                       "--store", "file:///srv", "--quiet"});
    ASSERT_TRUE(args.has_value()) << args.error().message;
    EXPECT_EQ(args->direction, core::Direction::Download);
    EXPECT_EQ(args->local_path, "out.bin");
    EXPECT_EQ(args->part_size, 1024u);
    EXPECT_EQ(args->store, "file:///srv");
    EXPECT_EQ(args->log_level, "debug");
    EXPECT_TRUE(args->quiet);
}

TEST(ArgsParserTest, ResumeAndAbortOnlyNeedStateFile)
{
    auto resume = parse({"upload", "resume", "--state-file", "s.json"});
    ASSERT_TRUE(resume.has_value()) << resume.error().message;
    EXPECT_EQ(resume->action, Action::Resume);
    EXPECT_EQ(resume->state_file, "s.json");

    auto abort = parse({"download", "abort", "--state-file", "s.json"});
    ASSERT_TRUE(abort.has_value()) << abort.error().message;
    EXPECT_EQ(abort->direction, core::Direction::Download);
    EXPECT_EQ(abort->action, Action::Abort);
}

TEST(ArgsParserTest, HelpAndVersionNeedNoCommand)
{
    auto help = parse({"--help"});
    ASSERT_TRUE(help.has_value());
    EXPECT_TRUE(help->help);

    auto version = parse({"--version"});
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version->version);
}

TEST(ArgsParserTest, RejectsMalformedCommandLines)
{
    EXPECT_FALSE(parse({}).has_value());
    EXPECT_FALSE(parse({"sideload", "start"}).has_value());
    EXPECT_FALSE(parse({"upload", "restart", "--state-file", "s"}).has_value());
    EXPECT_FALSE(parse({"upload", "resume"}).has_value());
    EXPECT_FALSE(parse({"upload", "start", "--s3-bucket", "b", "--state-file", "s"}).has_value());
    EXPECT_FALSE(parse({"upload", "resume", "--state-file", "s", "--part-size", "5"}).has_value());
    EXPECT_FALSE(parse({"download", "start", "--s3-bucket", "b", "--s3-key", "k", "--output", "o",
                        "--state-file", "s", "--part-size", "0"}).has_value());

    auto err = parse({"upload"});
    ASSERT_FALSE(err.has_value());
    EXPECT_EQ(err.error().code, infra::ErrorCode::InvalidArgument);
}

TEST(ArgsParserTest, RetryHintNamesTheCommandToRunAgain)
{
    args_parser::CLIArgs args;
    args.direction = core::Direction::Download;
    args.action = Action::Start;
    args.state_file = "s.json";
    EXPECT_EQ(args_parser::retry_hint(args),
              "The download can be resumed with:\n  persevere download resume --state-file 's.json'\n");

    args.action = Action::Abort;
    const auto hint = args_parser::retry_hint(args);
    EXPECT_EQ(hint, "The abort can be retried with:\n  persevere download abort --state-file 's.json'\n");
    EXPECT_EQ(hint.find("resumed"), std::string::npos);
}

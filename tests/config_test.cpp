#include <gtest/gtest.h>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/transfer_plan/transfer_plan.hpp"
#include "support/temp_dir.hpp"

using namespace persevere;
using infra::Config;

TEST(ConfigTest, EmptyDocumentGivesDefaults)
{
    auto cfg = infra::parse_config("");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->effective_log_level(), "info");
    EXPECT_EQ(cfg->effective_store(), "s3");
    EXPECT_EQ(cfg->effective_download_part_size(), core::kDefaultDownloadPartSize);
    EXPECT_EQ(core::kDefaultDownloadPartSize, 100u * 1024 * 1024);
    EXPECT_FALSE(cfg->quiet);

    const auto policy = cfg->retry_policy();
    EXPECT_EQ(policy.max_attempts, 3);
    EXPECT_EQ(policy.initial_delay.count(), 0);
}

TEST(ConfigTest, ParsesAllKeys)
{
    auto cfg = infra::parse_config(
        "log_level: debug\n"
        "quiet: true\n"
        "store: file:///srv/objects\n"
        "download_part_size: 8388608\n"
        "retry:\n"
        "  max_attempts: 5\n"
        "  delay_ms: 250\n"
        "  backoff_factor: 1.5\n");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->effective_log_level(), "debug");
    EXPECT_TRUE(cfg->quiet);
    EXPECT_EQ(cfg->effective_store(), "file:///srv/objects");
    EXPECT_EQ(cfg->effective_download_part_size(), 8388608u);

    const auto policy = cfg->retry_policy();
    EXPECT_EQ(policy.max_attempts, 5);
    EXPECT_EQ(policy.initial_delay.count(), 250);
    EXPECT_DOUBLE_EQ(policy.backoff_factor, 1.5);
}

TEST(ConfigTest, RejectsInvalidValues)
{
    EXPECT_FALSE(infra::parse_config("log_level: chatty\n").has_value());
    EXPECT_FALSE(infra::parse_config("download_part_size: 0\n").has_value());
    EXPECT_FALSE(infra::parse_config("retry:\n  max_attempts: 0\n").has_value());
    EXPECT_FALSE(infra::parse_config("quiet: maybe\n").has_value());
    EXPECT_FALSE(infra::parse_config("retry:\n  max_attempts: 1000\n").has_value());
    EXPECT_FALSE(infra::parse_config("retry:\n  delay_ms: 86400000\n").has_value());
    EXPECT_FALSE(infra::parse_config("retry:\n  backoff_factor: 1e30\n").has_value());
    EXPECT_FALSE(infra::parse_config("retry:\n  backoff_factor: .nan\n").has_value());
    EXPECT_FALSE(infra::parse_config("- a\n- b\n").has_value());
    EXPECT_FALSE(infra::parse_config("store: [unterminated\n").has_value());
}

TEST(ConfigTest, RetryBoundsAreInclusive)
{
    auto cfg = infra::parse_config(
        "retry:\n  max_attempts: 100\n  delay_ms: 3600000\n  backoff_factor: 10\n");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    const auto policy = cfg->retry_policy();
    EXPECT_EQ(policy.max_attempts, infra::kMaxRetryAttempts);
    EXPECT_EQ(policy.delay_before(3), infra::kMaxRetryDelay);
}

TEST(ConfigTest, CommandLineOverridesFile)
{
    auto file = infra::parse_config("log_level: debug\nstore: s3://minio:9000\ndownload_part_size: 1024\n");
    ASSERT_TRUE(file.has_value());

    args_parser::CLIArgs args;
    args.direction = core::Direction::Download;
    args.store = "file:///tmp/objects";
    args.part_size = 4096;
    args.quiet = true;

    auto cfg = *file;
    cfg.merge_with(infra::config_from_cli(args));
    EXPECT_EQ(cfg.effective_log_level(), "debug");
    EXPECT_EQ(cfg.effective_store(), "file:///tmp/objects");
    EXPECT_EQ(cfg.effective_download_part_size(), 4096u);
    EXPECT_TRUE(cfg.quiet);
}

TEST(ConfigTest, LoadsFromFile)
{
    test_support::TempDir dir;
    test_support::write_file(dir / "config.yaml", "store: file:///data\n");

    auto cfg = infra::load_config(dir / "config.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->effective_store(), "file:///data");

    auto missing = infra::load_config(dir / "absent.yaml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, infra::ErrorCode::IoError);
}

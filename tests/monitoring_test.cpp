#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

using persevere::infra::ProgressMonitor;

TEST(ProgressMonitorTest, CountsResumedProgress)
{
    ProgressMonitor monitor(false);
    monitor.set_total(4, 100, 1, 25);
    monitor.update(1, 25);

    const auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_parts, 2u);
    EXPECT_EQ(stats.processed_bytes, 50u);
    EXPECT_EQ(stats.session_bytes, 25u);
    EXPECT_NE(monitor.describe().find("50.0% | 2/4 parts"), std::string::npos) << monitor.describe();
}

TEST(ProgressMonitorTest, FinishedTransferHasNoEta)
{
    ProgressMonitor monitor(false);
    monitor.set_total(2, 10);
    monitor.update(1, 6);
    monitor.update(1, 4);

    const auto text = monitor.describe();
    EXPECT_NE(text.find("100.0% | 2/2 parts"), std::string::npos) << text;
    EXPECT_NE(text.find("ETA: 00:00"), std::string::npos) << text;
}

TEST(ProgressMonitorTest, SetTotalStartsANewSession)
{
    ProgressMonitor monitor(true);
    EXPECT_TRUE(monitor.is_enabled());
    monitor.set_total(3, 30);
    monitor.update(1, 10);
    monitor.set_total(3, 30, 1, 10);

    const auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_parts, 1u);
    EXPECT_EQ(stats.session_bytes, 0u);
}

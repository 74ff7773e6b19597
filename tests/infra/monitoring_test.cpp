#include <gtest/gtest.h>

#include <chrono>
#include "infra/monitoring/monitoring.hpp"

using dbxfer::infra::ProgressMonitor;

TEST(ProgressMonitorTest, DisabledWhenQuiet)
{
    ProgressMonitor monitor(true, true);
    EXPECT_FALSE(monitor.is_enabled());
}

TEST(ProgressMonitorTest, KeepsLatestValues)
{
    ProgressMonitor monitor(false);
    monitor.set_percentage(42);
    monitor.set_files(2, 5);
    monitor.set_status("Pulling: a.jpg");

    const auto stats = monitor.get_stats();
    EXPECT_EQ(stats.percentage, 42);
    EXPECT_EQ(stats.files_done, 2u);
    EXPECT_EQ(stats.files_total, 5u);
    EXPECT_EQ(stats.status, "Pulling: a.jpg");

    monitor.set_percentage(250);
    EXPECT_EQ(monitor.get_stats().percentage, 100);
    monitor.finish();
    monitor.finish();
}

TEST(ProgressMonitorTest, FormatLine)
{
    ProgressMonitor::Stats stats;
    stats.percentage = 50;
    stats.files_done = 1;
    stats.files_total = 3;
    stats.status = "Pull completed successfully.";
    stats.start_time = std::chrono::steady_clock::now();

    const auto line = ProgressMonitor::format_line(stats, stats.start_time + std::chrono::seconds(75));
    EXPECT_NE(line.find(" 50%"), std::string::npos);
    EXPECT_NE(line.find("1/3 files"), std::string::npos);
    EXPECT_NE(line.find("01:15"), std::string::npos);
    EXPECT_NE(line.find("Pull completed successfully."), std::string::npos);
}

TEST(ProgressMonitorTest, LongStatusIsShortened)
{
    ProgressMonitor::Stats stats;
    stats.status = std::string(200, 'x') + "tail";
    stats.start_time = std::chrono::steady_clock::now();

    const auto line = ProgressMonitor::format_line(stats, stats.start_time);
    EXPECT_NE(line.find("...x"), std::string::npos);
    EXPECT_NE(line.find("tail"), std::string::npos);
    EXPECT_LT(line.size(), 200u);
}

TEST(ProgressMonitorTest, ShortenedStatusKeepsWholeUtf8Characters)
{
    std::string cyrillic;
    for (int i = 0; i < 20; ++i) cyrillic += "Ж"; // по 2 байта
    ProgressMonitor::Stats stats;
    stats.status = "/sdcard/" + cyrillic + "ab";
    stats.start_time = std::chrono::steady_clock::now();

    const auto line = ProgressMonitor::format_line(stats, stats.start_time);
    const auto dots = line.rfind("...");
    ASSERT_NE(dots, std::string::npos);
    const auto tail = line.substr(dots + 3);

    std::string expected;
    for (int i = 0; i < 17; ++i) expected += "Ж";
    EXPECT_EQ(tail, expected + "ab");
    EXPECT_NE(static_cast<unsigned char>(tail.front()) & 0xC0, 0x80);
}

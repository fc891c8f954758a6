/**
 * @file test_process_monitor.cpp
 * @brief Tests for /proc status parsing.
 */

#include "resource_monitor/process_monitor.hpp"

#include <gtest/gtest.h>

using namespace sandbox_orchestrator;

TEST(ProcessMonitor, ParsesMemoryFields) {
    constexpr std::string_view status =
        "Name:\tsandbox_orchestrator\n"
        "VmPeak:\t  300000 kB\n"
        "VmSize:\t  250000 kB\n"
        "VmHWM:\t    9000 kB\n"
        "VmRSS:\t    8192 kB\n"
        "Threads:\t12\n";

    auto memory = parse_proc_status(status);
    ASSERT_TRUE(memory.has_value()) << memory.error().message;
    EXPECT_EQ(memory->rss_bytes, 8192u * 1024);
    EXPECT_EQ(memory->virtual_bytes, 250000u * 1024);
    EXPECT_EQ(memory->peak_rss_bytes, 9000u * 1024);
}

TEST(ProcessMonitor, MissingOptionalFieldsStayZero) {
    auto memory = parse_proc_status("VmRSS:\t100 kB\n");
    ASSERT_TRUE(memory.has_value());
    EXPECT_EQ(memory->rss_bytes, 100u * 1024);
    EXPECT_EQ(memory->virtual_bytes, 0u);
    EXPECT_EQ(memory->peak_rss_bytes, 0u);
}

TEST(ProcessMonitor, NoRssIsError) {
    auto memory = parse_proc_status("Name:\tkthreadd\nState:\tS (sleeping)\n");
    EXPECT_FALSE(memory.has_value());
}

TEST(ProcessMonitor, ReadsOwnProcess) {
    auto memory = read_process_memory();
    ASSERT_TRUE(memory.has_value()) << memory.error().message;
    EXPECT_GT(memory->rss_bytes, 0u);
    EXPECT_GE(memory->virtual_bytes, memory->rss_bytes);
}

TEST(ProcessMonitor, MissingFileIsError) {
    EXPECT_FALSE(read_process_memory("/nonexistent/status").has_value());
}

TEST(ProcessMonitor, UptimeIsMonotonic) {
    double first = process_uptime_seconds();
    double second = process_uptime_seconds();
    EXPECT_GE(first, 0.0);
    EXPECT_GE(second, first);
}

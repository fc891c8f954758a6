/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace sandbox_orchestrator;

TEST(ExecutionStatusTest, ToString) {
    EXPECT_EQ(to_string(ExecutionStatus::Queued), "queued");
    EXPECT_EQ(to_string(ExecutionStatus::Initializing), "initializing");
    EXPECT_EQ(to_string(ExecutionStatus::Running), "running");
    EXPECT_EQ(to_string(ExecutionStatus::Completed), "completed");
    EXPECT_EQ(to_string(ExecutionStatus::Failed), "failed");
    EXPECT_EQ(to_string(ExecutionStatus::Timeout), "timeout");
    EXPECT_EQ(to_string(ExecutionStatus::Cancelled), "cancelled");
}

TEST(ExecutionStatusTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(ExecutionStatus::Queued));
    EXPECT_FALSE(is_terminal(ExecutionStatus::Initializing));
    EXPECT_FALSE(is_terminal(ExecutionStatus::Running));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Completed));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Failed));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Timeout));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Cancelled));
}

TEST(ExecutionStatusTest, CompletedIsNotRetryable) {
    EXPECT_FALSE(is_retryable(ExecutionStatus::Completed));
    EXPECT_FALSE(is_retryable(ExecutionStatus::Running));
    EXPECT_TRUE(is_retryable(ExecutionStatus::Failed));
    EXPECT_TRUE(is_retryable(ExecutionStatus::Timeout));
    EXPECT_TRUE(is_retryable(ExecutionStatus::Cancelled));
}

TEST(ExecutionStatusTest, ForwardTransitionsOnly) {
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Queued, ExecutionStatus::Initializing));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Initializing, ExecutionStatus::Running));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::Completed));

    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::Queued));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::Initializing));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Queued, ExecutionStatus::Completed));
    EXPECT_FALSE(is_valid_transition(ExecutionStatus::Completed, ExecutionStatus::Cancelled));
}

TEST(ExecutionStatusTest, CancelReachableFromEveryLiveState) {
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Queued, ExecutionStatus::Cancelled));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Initializing, ExecutionStatus::Cancelled));
    EXPECT_TRUE(is_valid_transition(ExecutionStatus::Running, ExecutionStatus::Cancelled));
}

TEST(ExecutionRecordTest, ExecutionTimeNeedsBothTimestamps) {
    ExecutionRecord record;
    EXPECT_FALSE(record.execution_time_ms().has_value());

    auto start = std::chrono::system_clock::now();
    record.started_at = start;
    EXPECT_FALSE(record.execution_time_ms().has_value());

    record.completed_at = start + std::chrono::milliseconds(1250);
    ASSERT_TRUE(record.execution_time_ms().has_value());
    EXPECT_EQ(*record.execution_time_ms(), 1250);
}

TEST(ExecutionRecordTest, Defaults) {
    ExecutionRecord record;
    EXPECT_EQ(record.status, ExecutionStatus::Queued);
    EXPECT_EQ(record.timeout_ms, 30000u);
    EXPECT_EQ(record.retry_count, 0u);
    EXPECT_EQ(record.max_retries, 3u);
    EXPECT_FALSE(record.output.has_value());
    EXPECT_FALSE(record.error_message.has_value());
    EXPECT_TRUE(record.attempts.empty());
}

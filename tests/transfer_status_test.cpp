/**
 * @file transfer_status_test.cpp
 * @brief Unit tests for percentages, progress throttling and state texts
 */

#include "securexfer/TransferStatus.h"
#include <gtest/gtest.h>

using namespace SecureXfer;

TEST(TransferStatusTest, PercentageRoundsToNearest) {
    EXPECT_EQ(computePercentage(0, 1000), 0);
    EXPECT_EQ(computePercentage(4, 1000), 0);
    EXPECT_EQ(computePercentage(5, 1000), 1);
    EXPECT_EQ(computePercentage(333, 1000), 33);
    EXPECT_EQ(computePercentage(995, 1000), 100);
    EXPECT_EQ(computePercentage(1000, 1000), 100);
}

TEST(TransferStatusTest, UnknownTotalIsIndeterminate) {
    EXPECT_EQ(computePercentage(123, 0), -1);
}

TEST(TransferStatusTest, ThrottleEmitsOncePerPercentage) {
    ThrottledProgress throttle;
    EXPECT_TRUE(throttle.shouldEmit(0));
    EXPECT_FALSE(throttle.shouldEmit(0));
    EXPECT_TRUE(throttle.shouldEmit(1));
    EXPECT_FALSE(throttle.shouldEmit(1));
    EXPECT_TRUE(throttle.shouldEmit(100));
}

TEST(TransferStatusTest, IndeterminateProgressIsTimeThrottled) {
    ThrottledProgress throttle;
    EXPECT_TRUE(throttle.shouldEmit(-1));
    EXPECT_FALSE(throttle.shouldEmit(-1));
}

TEST(TransferStatusTest, TerminalStates) {
    EXPECT_FALSE(isTerminalState(TransferState::Open));
    EXPECT_FALSE(isTerminalState(TransferState::Accepted));
    EXPECT_FALSE(isTerminalState(TransferState::Transferring));
    EXPECT_TRUE(isTerminalState(TransferState::Completed));
    EXPECT_TRUE(isTerminalState(TransferState::Failed));
    EXPECT_TRUE(isTerminalState(TransferState::Declined));
    EXPECT_TRUE(isTerminalState(TransferState::Cancelled));
    EXPECT_TRUE(isTerminalState(TransferState::TimedOut));
}

TEST(TransferStatusTest, StateNamesAndTexts) {
    EXPECT_STREQ(transferStateToString(TransferState::TimedOut), "TIMED_OUT");
    EXPECT_STREQ(statusTextForState(TransferState::Declined), "Denied by recipient");
    EXPECT_STREQ(statusTextForState(TransferState::Open), "Waiting for approval");
    EXPECT_STREQ(statusPhaseToString(StatusPhase::Error), "error");
}

TEST(ErrorCodesTest, FormatPrefixesCode) {
    EXPECT_EQ(ErrorCodes::format(ErrorCodes::DECISION_TIMED_OUT, "No answer"),
              "[SXF-TIME-5000] No answer");
    EXPECT_STREQ(errorKindToString(ErrorKind::Trust), "TrustError");
    EXPECT_STREQ(errorKindToString(ErrorKind::Timeout), "TimeoutError");
}

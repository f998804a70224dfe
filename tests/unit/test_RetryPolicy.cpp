#include <gtest/gtest.h>
#include "util/RetryPolicy.hpp"

#include <vector>

using namespace sm::util;
using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    std::vector<std::chrono::milliseconds> slept;
    RetryPolicy policy;

    void SetUp() override {
        policy.maxRetries = 3;
        policy.baseDelay = 100ms;
        policy.maxDelay = 300ms;
        policy.sleep = [this](const std::chrono::milliseconds d) { slept.push_back(d); };
    }
};

TEST_F(RetryPolicyTest, BackoffDoublesUpToCap) {
    EXPECT_EQ(policy.delayFor(0), 100ms);
    EXPECT_EQ(policy.delayFor(1), 200ms);
    EXPECT_EQ(policy.delayFor(2), 300ms);
    EXPECT_EQ(policy.delayFor(10), 300ms);
}

TEST_F(RetryPolicyTest, RetriesTransientFailureUntilSuccess) {
    int calls = 0;
    std::vector<unsigned int> attempts;
    const auto result = policy.run([&] {
        if (++calls < 3) throw MigrationError(ErrorCode::TransientNetworkFailure, "timeout");
        return 42;
    }, {ErrorCode::TransientNetworkFailure}, [&](const unsigned int attempt, const MigrationError&) {
        attempts.push_back(attempt);
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(attempts, (std::vector<unsigned int>{1, 2}));
    EXPECT_EQ(slept, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST_F(RetryPolicyTest, GivesUpAfterMaxRetries) {
    int calls = 0;
    EXPECT_THROW(policy.run([&]() -> int {
        ++calls;
        throw MigrationError(ErrorCode::ChecksumMismatch, "bad chunk");
    }, {ErrorCode::ChecksumMismatch}), MigrationError);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(slept.size(), 3u);
}

TEST_F(RetryPolicyTest, OtherErrorsAreNotRetried) {
    int calls = 0;
    try {
        policy.run([&]() -> int {
            ++calls;
            throw MigrationError(ErrorCode::AuthFailure, "bad secret");
        }, {ErrorCode::TransientNetworkFailure});
        FAIL() << "expected AuthFailure";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthFailure);
        EXPECT_TRUE(e.fatal());
    }
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(slept.empty());
}

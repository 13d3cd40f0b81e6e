#include "tracker_session/reconnect_policy.hpp"
#include <gtest/gtest.h>

using namespace tracker_session;
using std::chrono::milliseconds;

TEST(ReconnectPolicyTest, DoublesUpToCap) {
    ReconnectPolicy policy;

    EXPECT_EQ(policy.nextDelay(), milliseconds(5000));
    EXPECT_EQ(policy.nextDelay(), milliseconds(10000));
    EXPECT_EQ(policy.nextDelay(), milliseconds(20000));
    EXPECT_EQ(policy.nextDelay(), milliseconds(40000));
    EXPECT_EQ(policy.nextDelay(), milliseconds(60000));
    EXPECT_EQ(policy.nextDelay(), milliseconds(60000));
    EXPECT_EQ(policy.attempts(), 6u);
}

TEST(ReconnectPolicyTest, ResetReturnsToInitialDelay) {
    ReconnectPolicy policy;
    policy.nextDelay();
    policy.nextDelay();

    policy.reset();
    EXPECT_EQ(policy.attempts(), 0u);
    EXPECT_EQ(policy.nextDelay(), milliseconds(5000));
}

TEST(ReconnectPolicyTest, CustomConfig) {
    ReconnectConfig config;
    config.initialDelay = milliseconds(100);
    config.maxDelay = milliseconds(250);
    config.multiplier = 1.5;

    ReconnectPolicy policy(config);
    EXPECT_EQ(policy.nextDelay(), milliseconds(100));
    EXPECT_EQ(policy.nextDelay(), milliseconds(150));
    EXPECT_EQ(policy.nextDelay(), milliseconds(225));
    EXPECT_EQ(policy.nextDelay(), milliseconds(250));
}

TEST(ReconnectPolicyTest, FixedDelayWithUnitMultiplier) {
    ReconnectConfig config;
    config.initialDelay = milliseconds(2000);
    config.maxDelay = milliseconds(2000);
    config.multiplier = 1.0;

    ReconnectPolicy policy(config);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(policy.nextDelay(), milliseconds(2000));
    }
}

#include <gtest/gtest.h>
#include "supervisor/restart_policy.hpp"

using namespace std::chrono_literals;

TEST(RestartPolicyTest, Defaults) {
    RestartPolicy policy;
    EXPECT_EQ(policy.exit_delay, 2000ms);
    EXPECT_EQ(policy.spawn_failure_delay, 5000ms);
    EXPECT_EQ(policy.max_attempts, 0);
    EXPECT_EQ(policy.shutdown_grace, 5000ms);
}

TEST(RestartPolicyTest, DelayDependsOnFailureKind) {
    RestartPolicy policy;
    policy.exit_delay = 150ms;
    policy.spawn_failure_delay = 700ms;
    EXPECT_EQ(policy.delay_for(FailureKind::UnexpectedExit), 150ms);
    EXPECT_EQ(policy.delay_for(FailureKind::SpawnFailure), 700ms);
}

TEST(RestartPolicyTest, UnboundedByDefault) {
    RestartPolicy policy;
    EXPECT_TRUE(policy.allows_retry(0));
    EXPECT_TRUE(policy.allows_retry(1000));
    EXPECT_TRUE(policy.allows_retry(1000000));
}

TEST(RestartPolicyTest, CapStopsRetries) {
    RestartPolicy policy;
    policy.max_attempts = 3;
    EXPECT_TRUE(policy.allows_retry(0));
    EXPECT_TRUE(policy.allows_retry(2));
    EXPECT_FALSE(policy.allows_retry(3));
    EXPECT_FALSE(policy.allows_retry(4));
}

TEST(RestartPolicyTest, StableRun) {
    RestartPolicy policy;
    policy.reset_after = 1000ms;
    EXPECT_FALSE(policy.is_stable_run(999ms));
    EXPECT_TRUE(policy.is_stable_run(1000ms));
    EXPECT_TRUE(policy.is_stable_run(5000ms));
}

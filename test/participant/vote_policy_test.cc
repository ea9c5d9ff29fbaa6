#include <gtest/gtest.h>
#include "../../src/participant/vote_policy.h"

#include <stdexcept>

using namespace XtSim;
using namespace std::chrono_literals;

class VotePolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.base_delay = {100ms, 200ms};
        options_.late_delay = {3000ms, 6000ms};
        options_.seed = 1234;
    }

    VotePolicyOptions options_;
};

TEST_F(VotePolicyTest, ParseNames) {
    EXPECT_EQ(ParseVoteStrategy("commit"), VoteStrategy::kCommit);
    EXPECT_EQ(ParseVoteStrategy("ABORT"), VoteStrategy::kAbort);
    EXPECT_EQ(ParseVoteStrategy("Random"), VoteStrategy::kRandom);
    EXPECT_EQ(ParseVoteStrategy("delay"), VoteStrategy::kDelay);
    EXPECT_THROW(ParseVoteStrategy("maybe"), std::invalid_argument);
    EXPECT_THROW(ParseVoteStrategy(""), std::invalid_argument);
    EXPECT_THROW(ParseVoteStrategy("\xc3\xa9"), std::invalid_argument);
    EXPECT_THROW(ParseVoteStrategy("COMMIT\xff"), std::invalid_argument);
    EXPECT_STREQ(VoteStrategyName(VoteStrategy::kDelay), "delay");
}

TEST_F(VotePolicyTest, CommitReusesBaseDelay) {
    VotePolicy policy(VoteStrategy::kCommit, options_);
    EXPECT_GE(policy.base_delay(), 100ms);
    EXPECT_LE(policy.base_delay(), 200ms);
    for (uint32_t xt_id = 1; xt_id <= 20; ++xt_id) {
        VoteDecision d = policy.Decide(xt_id);
        EXPECT_TRUE(d.commit);
        EXPECT_EQ(d.delay, policy.base_delay());
    }
}

TEST_F(VotePolicyTest, AbortAlwaysVotesFalse) {
    VotePolicy policy(VoteStrategy::kAbort, options_);
    for (uint32_t xt_id = 1; xt_id <= 20; ++xt_id) {
        VoteDecision d = policy.Decide(xt_id);
        EXPECT_FALSE(d.commit);
        EXPECT_EQ(d.delay, policy.base_delay());
    }
}

TEST_F(VotePolicyTest, RandomProducesBothOutcomes) {
    VotePolicy policy(VoteStrategy::kRandom, options_);
    int commits = 0;
    const int kVotes = 200;
    for (int i = 0; i < kVotes; ++i) {
        VoteDecision d = policy.Decide(static_cast<uint32_t>(i + 1));
        EXPECT_EQ(d.delay, policy.base_delay());
        commits += d.commit ? 1 : 0;
    }
    EXPECT_GT(commits, 0);
    EXPECT_LT(commits, kVotes);
}

TEST_F(VotePolicyTest, DelayRedrawsFromLateRange) {
    VotePolicy policy(VoteStrategy::kDelay, options_);
    for (uint32_t xt_id = 1; xt_id <= 20; ++xt_id) {
        VoteDecision d = policy.Decide(xt_id);
        EXPECT_TRUE(d.commit);
        EXPECT_GE(d.delay, 3000ms);
        EXPECT_LE(d.delay, 6000ms);
    }
}

TEST_F(VotePolicyTest, SameSeedSameDecisions) {
    VotePolicy a(VoteStrategy::kRandom, options_);
    VotePolicy b(VoteStrategy::kRandom, options_);
    EXPECT_EQ(a.base_delay(), b.base_delay());
    for (uint32_t xt_id = 1; xt_id <= 50; ++xt_id) {
        EXPECT_EQ(a.Decide(xt_id).commit, b.Decide(xt_id).commit);
    }
}

TEST_F(VotePolicyTest, UnknownStrategyFallsBackToCommit) {
    VotePolicy policy(static_cast<VoteStrategy>(99), options_);
    VoteDecision d = policy.Decide(1);
    EXPECT_TRUE(d.commit);
    EXPECT_EQ(d.delay, policy.base_delay());
}

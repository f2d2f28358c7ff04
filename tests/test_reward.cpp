#include <gtest/gtest.h>
#include "reward/reward_policy.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace codegym;

namespace {

std::vector<std::unique_ptr<RewardPolicy>> allPolicies() {
    std::vector<std::unique_ptr<RewardPolicy>> policies;
    for (const char* kind : {"linear", "ratio", "tiered"}) {
        RewardConfig config;
        config.kind = kind;
        policies.push_back(makeRewardPolicy(config));
    }
    return policies;
}

} // namespace

// ─── Shared Rules ─────────────────────────────────────────────

TEST(RewardPolicyTest, CompileFailureIsPenaltyRegardlessOfCounts) {
    for (const auto& p : allPolicies()) {
        EXPECT_DOUBLE_EQ(p->reward(false, 0, 0), -3.0) << p->name();
        EXPECT_DOUBLE_EQ(p->reward(false, 10, 0), -3.0) << p->name();
        EXPECT_DOUBLE_EQ(p->reward(false, 0, 10), -3.0) << p->name();
    }
}

TEST(RewardPolicyTest, PerfectRunIsMaxReward) {
    for (const auto& p : allPolicies()) {
        EXPECT_DOUBLE_EQ(p->reward(true, 1, 0), 7.0) << p->name();
        EXPECT_DOUBLE_EQ(p->reward(true, 25, 0), 7.0) << p->name();
    }
}

TEST(RewardPolicyTest, NoTestsNeverReachesPerfect) {
    for (const auto& p : allPolicies()) {
        double r = p->reward(true, 0, 0);
        EXPECT_LT(r, 7.0) << p->name();
        EXPECT_DOUBLE_EQ(r, 1.0) << p->name();  // base
    }
}

TEST(RewardPolicyTest, PartialResultStaysBelowPerfect) {
    for (const auto& p : allPolicies()) {
        for (int passed = 0; passed <= 30; passed++) {
            double r = p->reward(true, passed, 1);
            EXPECT_LE(r, 6.0) << p->name() << " passed=" << passed;
            EXPECT_GE(r, -3.0) << p->name() << " passed=" << passed;
        }
    }
}

TEST(RewardPolicyTest, MonotoneInPassedAndFailed) {
    for (const auto& p : allPolicies()) {
        for (int f = 0; f <= 8; f++) {
            for (int s = 0; s < 12; s++) {
                EXPECT_LE(p->reward(true, s, f), p->reward(true, s + 1, f))
                    << p->name() << " s=" << s << " f=" << f;
            }
        }
        for (int s = 0; s <= 8; s++) {
            for (int f = 0; f < 12; f++) {
                EXPECT_GE(p->reward(true, s, f), p->reward(true, s, f + 1))
                    << p->name() << " s=" << s << " f=" << f;
            }
        }
    }
}

TEST(RewardPolicyTest, NegativeCountsAreClampedToZero) {
    for (const auto& p : allPolicies()) {
        EXPECT_DOUBLE_EQ(p->reward(true, -5, -5), p->reward(true, 0, 0)) << p->name();
    }
}

TEST(RewardPolicyTest, VerdictOverload) {
    auto p = makeRewardPolicy(RewardConfig{});
    EXPECT_DOUBLE_EQ(p->reward(true, Verdict(2, 1)), p->reward(true, 2, 1));
}

// ─── Linear ───────────────────────────────────────────────────

TEST(LinearRewardTest, Formula) {
    auto p = makeRewardPolicy(RewardConfig{});
    EXPECT_EQ(p->name(), "linear");
    EXPECT_DOUBLE_EQ(p->reward(true, 1, 1), 3.0);   // 1 + 3 - 1
    EXPECT_DOUBLE_EQ(p->reward(true, 0, 2), -1.0);  // 1 - 2
}

TEST(LinearRewardTest, ClampsAtBounds) {
    auto p = makeRewardPolicy(RewardConfig{});
    EXPECT_DOUBLE_EQ(p->reward(true, 3, 1), 6.0);   // 9 capped below perfect
    EXPECT_DOUBLE_EQ(p->reward(true, 0, 20), -3.0);
}

// ─── Ratio ────────────────────────────────────────────────────

TEST(RatioRewardTest, Formula) {
    RewardConfig config;
    config.kind = "ratio";
    auto p = makeRewardPolicy(config);
    EXPECT_EQ(p->name(), "ratio");
    // 1 + 5 * 0.5 - 1
    EXPECT_DOUBLE_EQ(p->reward(true, 1, 1), 2.5);
    // 1 + 0 - 2
    EXPECT_DOUBLE_EQ(p->reward(true, 0, 2), -1.0);
}

// ─── Tiered ───────────────────────────────────────────────────

TEST(TieredRewardTest, TierBonusBySuccessRate) {
    TieredRewardPolicy p(RewardBounds{}, 1.0, 1.0, 1.0,
                         {{0.5, 1.0}, {0.9, 3.0}, {0.75, 2.0}});
    EXPECT_DOUBLE_EQ(p.tierBonus(0.95), 3.0);
    EXPECT_DOUBLE_EQ(p.tierBonus(0.9), 3.0);
    EXPECT_DOUBLE_EQ(p.tierBonus(0.8), 2.0);
    EXPECT_DOUBLE_EQ(p.tierBonus(0.5), 1.0);
    EXPECT_DOUBLE_EQ(p.tierBonus(0.4), 0.0);
}

TEST(TieredRewardTest, Formula) {
    RewardConfig config;
    config.kind = "tiered";
    config.pass_weight = 1.0;
    auto p = makeRewardPolicy(config);
    EXPECT_EQ(p->name(), "tiered");
    // 1 + 3 - 1 + 2 (75%)
    EXPECT_DOUBLE_EQ(p->reward(true, 3, 1), 5.0);
    // 1 + 1 - 3 + 0 (25%)
    EXPECT_DOUBLE_EQ(p->reward(true, 1, 3), -1.0);
}

// ─── Factory ──────────────────────────────────────────────────

TEST(RewardFactoryTest, UnknownKindThrows) {
    RewardConfig config;
    config.kind = "exponential";
    EXPECT_THROW(makeRewardPolicy(config), std::invalid_argument);
}

TEST(RewardFactoryTest, InvertedBoundsThrow) {
    RewardConfig config;
    config.bounds.min_reward = 10.0;
    EXPECT_THROW(makeRewardPolicy(config), std::invalid_argument);
}

TEST(RewardFactoryTest, ShrinkingTierBonusThrows) {
    RewardConfig config;
    config.kind = "tiered";
    config.tiers = {{0.9, 1.0}, {0.5, 2.0}};
    EXPECT_THROW(makeRewardPolicy(config), std::invalid_argument);
}

TEST(RewardFactoryTest, NegativeWeightThrows) {
    RewardConfig config;
    config.fail_weight = -1.0;
    EXPECT_THROW(makeRewardPolicy(config), std::invalid_argument);
}

TEST(RewardFactoryTest, CustomBounds) {
    RewardConfig config;
    config.bounds = RewardBounds{-10.0, -5.0, 20.0, 2.0};
    auto p = makeRewardPolicy(config);
    EXPECT_DOUBLE_EQ(p->reward(false, 3, 0), -10.0);
    EXPECT_DOUBLE_EQ(p->reward(true, 3, 0), 20.0);
    EXPECT_DOUBLE_EQ(p->reward(true, 10, 1), 18.0);
    EXPECT_DOUBLE_EQ(p->reward(true, 0, 10), -5.0);
}

#pragma once

#include "extract/verdict.hpp"

#include <memory>
#include <string>
#include <vector>

namespace codegym {

// ─── Reward Bounds ─────────────────────────────────────────────
// compile_penalty: returned whenever the code does not compile.
// max_reward:      returned for a perfect run (no failures, ≥1 pass).
// Everything else is clamped to [min_reward, max_reward - perfect_margin]
// so a partial result never ties with a perfect one.

struct RewardBounds {
    double compile_penalty = -3.0;
    double min_reward      = -3.0;
    double max_reward      = 7.0;
    double perfect_margin  = 1.0;
};

// ─── Reward Policy ─────────────────────────────────────────────
// reward(compiles, passed, failed) with these guarantees, for any
// subclass formula that is non-decreasing in passed and
// non-increasing in failed:
//   - !compiles                    → compile_penalty
//   - failed == 0 && passed > 0    → max_reward
//   - passed == failed == 0        → formula value, never max_reward
//   - output always bounded

class RewardPolicy {
public:
    explicit RewardPolicy(RewardBounds bounds) : bounds_(bounds) {}
    virtual ~RewardPolicy() = default;

    double reward(bool compiles, int passed, int failed) const;
    double reward(bool compiles, const Verdict& verdict) const {
        return reward(compiles, verdict.passed, verdict.failed);
    }

    virtual std::string name() const = 0;

    const RewardBounds& bounds() const { return bounds_; }

protected:
    /// Unclamped score for a compiling, non-perfect result.
    virtual double partialReward(int passed, int failed) const = 0;

private:
    RewardBounds bounds_;
};

// ─── Linear ────────────────────────────────────────────────────
// base + pass_weight·passed − fail_weight·failed

class LinearRewardPolicy : public RewardPolicy {
public:
    LinearRewardPolicy(RewardBounds bounds, double base, double pass_weight, double fail_weight);

    std::string name() const override { return "linear"; }

protected:
    double partialReward(int passed, int failed) const override;

private:
    double base_;
    double pass_weight_;
    double fail_weight_;
};

// ─── Ratio ─────────────────────────────────────────────────────
// base + scale·passed/(passed+failed) − fail_weight·failed

class RatioRewardPolicy : public RewardPolicy {
public:
    RatioRewardPolicy(RewardBounds bounds, double base, double scale, double fail_weight);

    std::string name() const override { return "ratio"; }

protected:
    double partialReward(int passed, int failed) const override;

private:
    double base_;
    double scale_;
    double fail_weight_;
};

// ─── Tiered ────────────────────────────────────────────────────
// Linear score plus the bonus of the highest success-rate tier
// reached. Tiers must give larger bonuses for higher thresholds.

struct RewardTier {
    double min_success_rate = 0.0;
    double bonus = 0.0;
};

class TieredRewardPolicy : public RewardPolicy {
public:
    TieredRewardPolicy(RewardBounds bounds, double base, double pass_weight, double fail_weight,
                       std::vector<RewardTier> tiers);

    std::string name() const override { return "tiered"; }

    double tierBonus(double success_rate) const;

protected:
    double partialReward(int passed, int failed) const override;

private:
    double base_;
    double pass_weight_;
    double fail_weight_;
    std::vector<RewardTier> tiers_;  // sorted by threshold, highest first
};

// ─── Config ────────────────────────────────────────────────────

struct RewardConfig {
    std::string kind = "linear";   // linear | ratio | tiered
    RewardBounds bounds;
    double base = 1.0;
    double pass_weight = 3.0;
    double fail_weight = 1.0;
    double ratio_scale = 5.0;
    std::vector<RewardTier> tiers = {{0.90, 3.0}, {0.75, 2.0}, {0.50, 1.0}};
};

/// Build the policy described by config.
/// Throws std::invalid_argument for an unknown kind or inconsistent bounds/tiers.
std::unique_ptr<RewardPolicy> makeRewardPolicy(const RewardConfig& config);

} // namespace codegym

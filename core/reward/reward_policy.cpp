#include "reward/reward_policy.hpp"

#include <algorithm>
#include <stdexcept>

namespace codegym {

// ─── Base ──────────────────────────────────────────────────────

double RewardPolicy::reward(bool compiles, int passed, int failed) const {
    if (!compiles) return bounds_.compile_penalty;

    passed = std::max(0, passed);
    failed = std::max(0, failed);

    if (failed == 0 && passed > 0) return bounds_.max_reward;

    double lo = bounds_.min_reward;
    double hi = std::max(lo, bounds_.max_reward - bounds_.perfect_margin);
    return std::clamp(partialReward(passed, failed), lo, hi);
}

// ─── Linear ────────────────────────────────────────────────────

LinearRewardPolicy::LinearRewardPolicy(RewardBounds bounds, double base,
                                       double pass_weight, double fail_weight)
    : RewardPolicy(bounds), base_(base), pass_weight_(pass_weight), fail_weight_(fail_weight) {}

double LinearRewardPolicy::partialReward(int passed, int failed) const {
    return base_ + pass_weight_ * passed - fail_weight_ * failed;
}

// ─── Ratio ─────────────────────────────────────────────────────

RatioRewardPolicy::RatioRewardPolicy(RewardBounds bounds, double base,
                                     double scale, double fail_weight)
    : RewardPolicy(bounds), base_(base), scale_(scale), fail_weight_(fail_weight) {}

double RatioRewardPolicy::partialReward(int passed, int failed) const {
    double total = static_cast<double>(passed) + failed;
    if (total == 0) return base_;
    double ratio = passed / total;
    return base_ + scale_ * ratio - fail_weight_ * failed;
}

// ─── Tiered ────────────────────────────────────────────────────

TieredRewardPolicy::TieredRewardPolicy(RewardBounds bounds, double base, double pass_weight,
                                       double fail_weight, std::vector<RewardTier> tiers)
    : RewardPolicy(bounds), base_(base), pass_weight_(pass_weight),
      fail_weight_(fail_weight), tiers_(std::move(tiers)) {
    std::sort(tiers_.begin(), tiers_.end(), [](const RewardTier& a, const RewardTier& b) {
        return a.min_success_rate > b.min_success_rate;
    });
}

double TieredRewardPolicy::tierBonus(double success_rate) const {
    for (const auto& tier : tiers_) {
        if (success_rate >= tier.min_success_rate) return tier.bonus;
    }
    return 0.0;
}

double TieredRewardPolicy::partialReward(int passed, int failed) const {
    double score = base_ + pass_weight_ * passed - fail_weight_ * failed;
    double total = static_cast<double>(passed) + failed;
    if (total > 0) {
        score += tierBonus(passed / total);
    }
    return score;
}

// ─── Factory ───────────────────────────────────────────────────

std::unique_ptr<RewardPolicy> makeRewardPolicy(const RewardConfig& config) {
    const RewardBounds& b = config.bounds;
    if (b.min_reward > b.max_reward) {
        throw std::invalid_argument("reward bounds: min_reward exceeds max_reward");
    }
    if (b.perfect_margin < 0.0) {
        throw std::invalid_argument("reward bounds: perfect_margin must be non-negative");
    }
    if (config.pass_weight < 0.0 || config.fail_weight < 0.0 || config.ratio_scale < 0.0) {
        throw std::invalid_argument("reward weights must be non-negative");
    }

    if (config.kind == "linear") {
        return std::make_unique<LinearRewardPolicy>(b, config.base, config.pass_weight,
                                                    config.fail_weight);
    }
    if (config.kind == "ratio") {
        return std::make_unique<RatioRewardPolicy>(b, config.base, config.ratio_scale,
                                                   config.fail_weight);
    }
    if (config.kind == "tiered") {
        std::vector<RewardTier> tiers = config.tiers;
        std::sort(tiers.begin(), tiers.end(), [](const RewardTier& a, const RewardTier& c) {
            return a.min_success_rate < c.min_success_rate;
        });
        for (std::size_t i = 1; i < tiers.size(); i++) {
            if (tiers[i].bonus < tiers[i - 1].bonus) {
                throw std::invalid_argument("reward tiers: bonus must not shrink as the threshold rises");
            }
        }
        return std::make_unique<TieredRewardPolicy>(b, config.base, config.pass_weight,
                                                    config.fail_weight, std::move(tiers));
    }
    throw std::invalid_argument("unknown reward policy kind: " + config.kind);
}

} // namespace codegym

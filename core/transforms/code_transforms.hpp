#pragma once

#include "transforms/transform_base.hpp"

#include <regex>
#include <string>
#include <vector>

namespace codegym {

// ─── Safety ────────────────────────────────────────────────────
// Scans core_code for dangerous constructs. The first matching
// pattern adds the penalty and is recorded as
// metadata["safety_violation"]; later patterns are not checked.

struct SafetyConfig {
    double penalty = -3.0;
    std::vector<std::string> patterns;
};

class SafetyTransform : public Transform {
public:
    /// Throws std::regex_error if a pattern does not compile.
    explicit SafetyTransform(const SafetyConfig& config);

    std::string name() const override { return "safety"; }
    Observation apply(Observation obs) const override;

    /// Source of the first pattern found in code, or "" if none.
    std::string firstViolation(const std::string& code) const;

    double penalty() const { return penalty_; }
    size_t patternCount() const { return compiled_.size(); }

private:
    double penalty_;
    std::vector<std::string> sources_;
    std::vector<std::regex> compiled_;
};

// ─── Quality ───────────────────────────────────────────────────
// Rewards short submissions: trimmed core_code of at most
// max_length characters earns concise_bonus, anything longer loses
// verbosity_penalty. The applied delta goes to
// metadata["quality_adjustment"].

struct QualityConfig {
    size_t max_length = 120;
    double concise_bonus = 1.0;
    double verbosity_penalty = 0.1;
};

class QualityTransform : public Transform {
public:
    explicit QualityTransform(const QualityConfig& config) : config_(config) {}

    std::string name() const override { return "quality"; }
    Observation apply(Observation obs) const override;

    double adjustmentFor(const std::string& code) const;

private:
    QualityConfig config_;
};

/// Built-in danger patterns for a language id (empty for unknown ids).
std::vector<std::string> defaultDangerPatterns(const std::string& language);

/// Character count of s without surrounding whitespace (UTF-8 aware).
size_t trimmedLength(const std::string& s);

} // namespace codegym

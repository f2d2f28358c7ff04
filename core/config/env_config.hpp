#pragma once

#include "reward/reward_policy.hpp"
#include "transforms/code_transforms.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace codegym {

/// Invalid configuration: unreadable file, malformed JSON, wrong
/// field types or values outside their allowed range.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── Environment Config ────────────────────────────────────────
// Everything that can be tuned for one language's environment.
//
// JSON layout (every field optional, overlaid on the defaults):
//   {
//     "timeout_seconds": 60,
//     "max_output_bytes": 1048576,
//     "imports": ["LinearAlgebra"],
//     "safety":  {"penalty": -3, "patterns": [...], "extra_patterns": [...]},
//     "quality": {"max_length": 120, "concise_bonus": 1, "verbosity_penalty": 0.1},
//     "reward":  {"kind": "linear", "base": 1, "pass_weight": 3, "fail_weight": 1,
//                 "ratio_scale": 5, "compile_penalty": -3, "min_reward": -3,
//                 "max_reward": 7, "perfect_margin": 1,
//                 "tiers": [{"min_success_rate": 0.9, "bonus": 3}]}
//   }
// "patterns" replaces the built-in danger list; "extra_patterns"
// appends to it. "imports" is Julia only: each package is loaded
// with `using` ahead of the submitted code in both stages.

struct EnvConfig {
    std::string language;
    double timeout_seconds = 60.0;
    size_t max_output_bytes = 1024 * 1024;
    std::vector<std::string> imports;
    SafetyConfig safety;
    QualityConfig quality;
    RewardConfig reward;
};

/// Upper bound on timeout_seconds (one day).
constexpr double MAX_TIMEOUT_SECONDS = 86400.0;

/// The language ids with built-in defaults, sorted.
const std::vector<std::string>& supportedLanguages();

bool isSupportedLanguage(const std::string& language);

/// Built-in defaults. Throws ConfigError for an unknown language.
EnvConfig defaultEnvConfig(const std::string& language);

/// Defaults for language with the fields present in j applied on top.
EnvConfig envConfigFromJson(const nlohmann::json& j, const std::string& language);

/// Read a JSON file holding either one config object or an object
/// keyed by language id. A keyed file without an entry for language
/// yields the defaults.
EnvConfig loadEnvConfig(const std::string& path, const std::string& language);

nlohmann::json envConfigToJson(const EnvConfig& config);

/// Throws ConfigError if the config cannot build a working environment.
void validateEnvConfig(const EnvConfig& config);

} // namespace codegym

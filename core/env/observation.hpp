#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace codegym {

/// Thrown when a step receives an action it cannot accept (a tagged
/// action for another language, or a malformed wire request).
class ActionTypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ─── Action ────────────────────────────────────────────────────
// Code submitted for one step. language is optional; when set it
// must name the episode's language.

struct Action {
    std::string core_code;
    std::string test_code;
    std::string language;
};

// ─── Observation ───────────────────────────────────────────────
// What the agent sees after reset() or step(). stdout/stderr and
// exit_code come from the test stage; code_compiles from the
// compile stage. metadata is a JSON object carrying at least
// core_code and test_code.

struct Observation {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    int tests_passed = 0;
    int tests_failed = 0;
    bool code_compiles = true;
    std::optional<double> reward;
    bool done = false;
    nlohmann::json metadata = nlohmann::json::object();
};

/// Transport-facing shape of a step.
struct StepResult {
    Observation observation;
    std::optional<double> reward;
    bool done = false;
};

inline StepResult toStepResult(const Observation& obs) {
    return StepResult{obs, obs.reward, obs.done};
}

// ─── Episode State ─────────────────────────────────────────────
// total_tests_passed/failed hold the latest step's counts, not a
// running sum.

struct EpisodeState {
    std::string episode_id;
    int step_count = 0;
    int last_exit_code = 0;
    bool last_code_compiles = true;
    int total_tests_passed = 0;
    int total_tests_failed = 0;
};

} // namespace codegym

#pragma once

#include "env/observation.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace codegym {

// ─── Wire Format ───────────────────────────────────────────────
// JSON shapes exchanged with a transport:
//
//   step request   {"core_code": "...", "test_code": "...", "language"?: "go"}
//   step response  {"observation": {"stdout", "stderr", "exit_code",
//                                   "tests_passed", "tests_failed",
//                                   "code_compiles", "metadata"},
//                   "reward": number | null, "done": bool}
//   state response {"episode_id", "step_count", "last_exit_code",
//                   "last_code_compiles", "total_tests_passed",
//                   "total_tests_failed"}

nlohmann::json actionToJson(const Action& action);

/// Throws ActionTypeError for a non-object, a missing field or a
/// field of the wrong type.
Action actionFromJson(const nlohmann::json& j);

/// Observation as a step response.
nlohmann::json observationToJson(const Observation& obs);

/// Inverse of observationToJson. Throws std::invalid_argument on a
/// malformed response.
Observation observationFromJson(const nlohmann::json& j);

nlohmann::json stepResultToJson(const StepResult& result);

nlohmann::json stateToJson(const EpisodeState& state);

/// Throws std::invalid_argument on a malformed state response.
EpisodeState stateFromJson(const nlohmann::json& j);

} // namespace codegym

#include "wire/wire_format.hpp"

#include <stdexcept>

namespace codegym {

using nlohmann::json;

namespace {

template <typename T>
T field(const json& j, const char* key, const char* what) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw std::invalid_argument(std::string(what) + ": missing field '" + key + "'");
    }
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        throw std::invalid_argument(std::string(what) + ": field '" + key + "' has the wrong type");
    }
}

std::string requestString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) throw ActionTypeError(std::string("step request missing '") + key + "'");
    if (!it->is_string()) throw ActionTypeError(std::string("step request field '") + key + "' must be a string");
    return it->get<std::string>();
}

} // namespace

// ─── Action ────────────────────────────────────────────────────

json actionToJson(const Action& action) {
    json j = {{"core_code", action.core_code}, {"test_code", action.test_code}};
    if (!action.language.empty()) j["language"] = action.language;
    return j;
}

Action actionFromJson(const json& j) {
    if (!j.is_object()) throw ActionTypeError("step request must be a JSON object");
    Action action;
    action.core_code = requestString(j, "core_code");
    action.test_code = requestString(j, "test_code");
    if (j.contains("language")) action.language = requestString(j, "language");
    return action;
}

// ─── Observation ───────────────────────────────────────────────

json observationToJson(const Observation& obs) {
    return stepResultToJson(toStepResult(obs));
}

json stepResultToJson(const StepResult& result) {
    const Observation& obs = result.observation;
    json o = {
        {"stdout", obs.stdout_text},
        {"stderr", obs.stderr_text},
        {"exit_code", obs.exit_code},
        {"tests_passed", obs.tests_passed},
        {"tests_failed", obs.tests_failed},
        {"code_compiles", obs.code_compiles},
        {"metadata", obs.metadata},
    };
    json j = {{"observation", o}, {"done", result.done}};
    j["reward"] = result.reward ? json(*result.reward) : json(nullptr);
    return j;
}

Observation observationFromJson(const json& j) {
    const char* what = "step response";
    if (!j.is_object()) throw std::invalid_argument("step response must be a JSON object");
    auto it = j.find("observation");
    if (it == j.end() || !it->is_object()) {
        throw std::invalid_argument("step response: missing object 'observation'");
    }
    const json& o = *it;

    Observation obs;
    obs.stdout_text = field<std::string>(o, "stdout", what);
    obs.stderr_text = field<std::string>(o, "stderr", what);
    obs.exit_code = field<int>(o, "exit_code", what);
    obs.tests_passed = field<int>(o, "tests_passed", what);
    obs.tests_failed = field<int>(o, "tests_failed", what);
    obs.code_compiles = field<bool>(o, "code_compiles", what);
    obs.metadata = o.value("metadata", json::object());

    auto r = j.find("reward");
    if (r != j.end() && !r->is_null()) {
        if (!r->is_number()) throw std::invalid_argument("step response: 'reward' must be a number or null");
        obs.reward = r->get<double>();
    }
    obs.done = j.value("done", false);
    return obs;
}

// ─── State ─────────────────────────────────────────────────────

json stateToJson(const EpisodeState& state) {
    return {
        {"episode_id", state.episode_id},
        {"step_count", state.step_count},
        {"last_exit_code", state.last_exit_code},
        {"last_code_compiles", state.last_code_compiles},
        {"total_tests_passed", state.total_tests_passed},
        {"total_tests_failed", state.total_tests_failed},
    };
}

EpisodeState stateFromJson(const json& j) {
    const char* what = "state response";
    if (!j.is_object()) throw std::invalid_argument("state response must be a JSON object");
    EpisodeState state;
    state.episode_id = field<std::string>(j, "episode_id", what);
    state.step_count = field<int>(j, "step_count", what);
    state.last_exit_code = field<int>(j, "last_exit_code", what);
    state.last_code_compiles = field<bool>(j, "last_code_compiles", what);
    state.total_tests_passed = field<int>(j, "total_tests_passed", what);
    state.total_tests_failed = field<int>(j, "total_tests_failed", what);
    return state;
}

} // namespace codegym

#include "env/code_episode.hpp"
#include "runtime/runtime_registry.hpp"
#include "util/log.hpp"

#include <cstdint>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace codegym {

std::string generateEpisodeId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

CodeEpisode::CodeEpisode(std::shared_ptr<const LanguageRuntime> runtime,
                         std::unique_ptr<ProcessRunner> runner,
                         TransformPipeline pipeline)
    : runtime_(std::move(runtime)), runner_(std::move(runner)), pipeline_(std::move(pipeline)) {
    if (!runtime_) throw std::invalid_argument("CodeEpisode needs a runtime");
    if (!runner_) throw std::invalid_argument("CodeEpisode needs a process runner");
}

Observation CodeEpisode::reset() {
    state_ = EpisodeState{};
    state_.episode_id = generateEpisodeId();
    started_ = true;

    Observation obs;
    obs.exit_code = 0;
    obs.reward = 0.0;
    obs.code_compiles = true;
    obs.metadata = {{"core_code", ""}, {"test_code", ""}};

    CODEGYM_LOG_DEBUG("Episode " << state_.episode_id << " reset (" << language() << ")");
    return pipeline_.apply(std::move(obs));
}

Observation CodeEpisode::step(const Action& action) {
    if (!started_) {
        throw std::logic_error("step() called before reset()");
    }
    if (!action.language.empty() && action.language != runtime_->language()) {
        throw ActionTypeError("expected a " + runtime_->language() + " action, got '" +
                              action.language + "'");
    }

    // Stage 1: core code alone decides whether it compiles.
    ExecResult core = runtime_->compileCheck(action.core_code, *runner_);
    bool compiles = core.ok();

    // Stage 2: combined run for the test verdict.
    ExecResult full = runtime_->reusesCompileResult(action.test_code)
                          ? core
                          : runtime_->runTests(action.core_code, action.test_code, *runner_);

    Extraction extraction = runtime_->extractVerdict(full.stdout_text, full.stderr_text);
    const Verdict& verdict = extraction.verdict;
    double reward = runtime_->reward(compiles, verdict);

    state_.step_count++;
    state_.last_exit_code = full.exit_code;
    state_.last_code_compiles = compiles;
    state_.total_tests_passed = verdict.passed;
    state_.total_tests_failed = verdict.failed;

    Observation obs;
    obs.stdout_text = full.stdout_text;
    obs.stderr_text = full.stderr_text;
    obs.exit_code = full.exit_code;
    obs.tests_passed = verdict.passed;
    obs.tests_failed = verdict.failed;
    obs.code_compiles = compiles;
    obs.reward = reward;
    obs.metadata = {
        {"core_code", action.core_code},
        {"test_code", action.test_code},
        {"language", runtime_->language()},
        {"verdict_source", extraction.strategy},
    };

    bool timed_out = core.timed_out || full.timed_out;
    if (timed_out) {
        obs.metadata["timed_out"] = true;
        CODEGYM_LOG_WARN("Episode " << state_.episode_id << " step " << state_.step_count
                         << ": " << (core.timed_out ? "compile check" : "test run")
                         << " timed out after " << formatSeconds(runner_->timeoutSeconds())
                         << "s");
    }

    obs = pipeline_.apply(std::move(obs));

    CODEGYM_LOG_INFO("Episode " << state_.episode_id << " step " << state_.step_count
                     << " [" << runtime_->language() << "] compiles=" << (compiles ? "yes" : "no")
                     << " tests=" << verdict.passed << "/" << verdict.total()
                     << " reward=" << obs.reward.value_or(0.0));
    return obs;
}

CodeEpisode makeEpisode(const EnvConfig& config) {
    validateEnvConfig(config);
    auto runner = std::make_unique<LocalProcessRunner>(config.timeout_seconds,
                                                       config.max_output_bytes);
    return CodeEpisode(makeRuntime(config), std::move(runner),
                       makeDefaultPipeline(config.safety, config.quality));
}

CodeEpisode makeEpisode(const std::string& language) {
    return makeEpisode(defaultEnvConfig(language));
}

} // namespace codegym

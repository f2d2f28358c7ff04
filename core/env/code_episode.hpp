#pragma once

#include "config/env_config.hpp"
#include "env/observation.hpp"
#include "exec/process_runner.hpp"
#include "runtime/language_runtime.hpp"
#include "transforms/transform_pipeline.hpp"

#include <memory>
#include <string>

namespace codegym {

/// One reinforcement-learning episode for a single language.
///
///   reset()      → baseline observation, fresh episode id
///   step(action) → compile-check core_code, run it with test_code,
///                  extract the verdict, score it, apply the pipeline
///   state()      → snapshot of the episode counters
///
/// An episode owns its runner and state and is not thread-safe.
/// The runtime is shared and read-only.
class CodeEpisode {
public:
    CodeEpisode(std::shared_ptr<const LanguageRuntime> runtime,
                std::unique_ptr<ProcessRunner> runner,
                TransformPipeline pipeline);

    Observation reset();

    /// Throws ActionTypeError for an action tagged with another
    /// language, std::logic_error before the first reset().
    Observation step(const Action& action);

    EpisodeState state() const { return state_; }

    bool started() const { return started_; }
    const std::string& language() const { return runtime_->language(); }
    const LanguageRuntime& runtime() const { return *runtime_; }
    const TransformPipeline& pipeline() const { return pipeline_; }
    ProcessRunner& runner() { return *runner_; }

private:
    std::shared_ptr<const LanguageRuntime> runtime_;
    std::unique_ptr<ProcessRunner> runner_;
    TransformPipeline pipeline_;
    EpisodeState state_;
    bool started_ = false;
};

/// Episode running real toolchains on this machine, wired from config.
CodeEpisode makeEpisode(const EnvConfig& config);

/// Same, with the built-in defaults for language.
CodeEpisode makeEpisode(const std::string& language);

/// Random RFC 4122 version-4 UUID in canonical text form.
std::string generateEpisodeId();

} // namespace codegym

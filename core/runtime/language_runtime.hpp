#pragma once

#include "exec/process_runner.hpp"
#include "extract/test_result_extractor.hpp"
#include "reward/reward_policy.hpp"

#include <memory>
#include <string>

namespace codegym {

/// Everything language-specific about an environment: how to
/// compile-check a snippet, how to run it against tests, how to read
/// the test output and how to score it.
///
/// Subclasses provide the two invocation shapes; extraction and
/// reward are shared and driven by the cascade and policy passed in.
/// Runtimes are immutable after construction and may be shared
/// across episodes.
class LanguageRuntime {
public:
    LanguageRuntime(std::string language, Cascade cascade, std::unique_ptr<RewardPolicy> policy);
    virtual ~LanguageRuntime() = default;

    const std::string& language() const { return language_; }

    /// Stage 1: run core_code alone. exit_code == 0 means it compiles.
    virtual ExecResult compileCheck(const std::string& core_code, ProcessRunner& runner) const = 0;

    /// Stage 2: run core_code together with test_code.
    virtual ExecResult runTests(const std::string& core_code, const std::string& test_code,
                                ProcessRunner& runner) const = 0;

    /// True when stage 2 would only repeat stage 1 for this test code,
    /// so the caller may reuse the stage-1 result.
    virtual bool reusesCompileResult(const std::string& test_code) const;

    Extraction extractVerdict(const std::string& stdout_text, const std::string& stderr_text) const;

    double reward(bool compiles, const Verdict& verdict) const;

    const RewardPolicy& rewardPolicy() const { return *policy_; }

private:
    std::string language_;
    TestResultExtractor extractor_;
    std::unique_ptr<RewardPolicy> policy_;
};

/// Source text submitted for the combined run: core, blank line, tests.
std::string combineSources(const std::string& core_code, const std::string& test_code);

} // namespace codegym

#pragma once

#include "runtime/language_runtime.hpp"

#include <string>
#include <vector>

namespace codegym {

// ─── Script Profile ────────────────────────────────────────────
// Invocation shape of a single-file toolchain: the source is
// written to source_file in a fresh directory and the command runs
// there. check_argv runs core_code alone, test_argv runs the
// combined source. prelude, when set, is written ahead of the
// source in both stages.

struct ScriptProfile {
    std::string language;
    std::string source_file;
    std::vector<std::string> check_argv;
    std::vector<std::string> test_argv;
    std::string prelude;
};

ScriptProfile rubyProfile();

/// julia --project, with one `using` line per package in imports.
ScriptProfile juliaProfile(const std::vector<std::string>& imports = {});
ScriptProfile rProfile();
ScriptProfile zigProfile();

// ─── Script Runtime ────────────────────────────────────────────

class ScriptRuntime : public LanguageRuntime {
public:
    ScriptRuntime(ScriptProfile profile, std::unique_ptr<RewardPolicy> policy);

    ExecResult compileCheck(const std::string& core_code, ProcessRunner& runner) const override;
    ExecResult runTests(const std::string& core_code, const std::string& test_code,
                        ProcessRunner& runner) const override;

    Invocation compileInvocation(const std::string& core_code) const;
    Invocation testInvocation(const std::string& core_code, const std::string& test_code) const;

    const ScriptProfile& profile() const { return profile_; }

private:
    ScriptProfile profile_;
};

} // namespace codegym

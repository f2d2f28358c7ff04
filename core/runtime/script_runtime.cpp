#include "runtime/script_runtime.hpp"

namespace codegym {

ScriptProfile rubyProfile() {
    return {"ruby", "code.rb", {"ruby", "code.rb"}, {"ruby", "code.rb"}, ""};
}

ScriptProfile juliaProfile(const std::vector<std::string>& imports) {
    std::string prelude;
    for (const auto& pkg : imports) prelude += "using " + pkg + "\n";
    return {"julia", "code.jl",
            {"julia", "--project", "code.jl"}, {"julia", "--project", "code.jl"},
            prelude};
}

ScriptProfile rProfile() {
    return {"r", "code.R", {"Rscript", "code.R"}, {"Rscript", "code.R"}, ""};
}

// zig has no interpreter: stage 1 only builds an object file.
ScriptProfile zigProfile() {
    return {"zig", "main.zig", {"zig", "build-obj", "main.zig"}, {"zig", "test", "main.zig"}, ""};
}

ScriptRuntime::ScriptRuntime(ScriptProfile profile, std::unique_ptr<RewardPolicy> policy)
    : LanguageRuntime(profile.language, makeCascade(profile.language), std::move(policy)),
      profile_(std::move(profile)) {}

Invocation ScriptRuntime::compileInvocation(const std::string& core_code) const {
    Invocation inv;
    inv.files[profile_.source_file] = profile_.prelude + core_code;
    inv.argv = profile_.check_argv;
    return inv;
}

Invocation ScriptRuntime::testInvocation(const std::string& core_code,
                                         const std::string& test_code) const {
    Invocation inv;
    inv.files[profile_.source_file] = profile_.prelude + combineSources(core_code, test_code);
    inv.argv = profile_.test_argv;
    return inv;
}

ExecResult ScriptRuntime::compileCheck(const std::string& core_code, ProcessRunner& runner) const {
    return runner.execute(compileInvocation(core_code));
}

ExecResult ScriptRuntime::runTests(const std::string& core_code, const std::string& test_code,
                                   ProcessRunner& runner) const {
    return runner.execute(testInvocation(core_code, test_code));
}

} // namespace codegym

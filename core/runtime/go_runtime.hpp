#pragma once

#include "runtime/language_runtime.hpp"

namespace codegym {

/// Go needs a module in the working directory and keeps tests in a
/// separate _test.go file, so it does not fit ScriptProfile.
///   stage 1: main.go;                go mod init tempmodule; go run main.go
///   stage 2: main.go + main_test.go; go mod init tempmodule; go test -v
/// With blank test code stage 2 is skipped and stage 1's result reused.
class GoRuntime : public LanguageRuntime {
public:
    static constexpr const char* MODULE_NAME = "tempmodule";

    explicit GoRuntime(std::unique_ptr<RewardPolicy> policy);

    ExecResult compileCheck(const std::string& core_code, ProcessRunner& runner) const override;
    ExecResult runTests(const std::string& core_code, const std::string& test_code,
                        ProcessRunner& runner) const override;

    bool reusesCompileResult(const std::string& test_code) const override;

    Invocation compileInvocation(const std::string& core_code) const;
    Invocation testInvocation(const std::string& core_code, const std::string& test_code) const;
};

} // namespace codegym

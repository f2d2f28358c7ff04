#include "runtime/go_runtime.hpp"

#include <cctype>

namespace codegym {

namespace {

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

GoRuntime::GoRuntime(std::unique_ptr<RewardPolicy> policy)
    : LanguageRuntime("go", makeGoCascade(), std::move(policy)) {}

Invocation GoRuntime::compileInvocation(const std::string& core_code) const {
    Invocation inv;
    inv.files["main.go"] = core_code;
    inv.setup.push_back({"go", "mod", "init", MODULE_NAME});
    inv.argv = {"go", "run", "main.go"};
    return inv;
}

Invocation GoRuntime::testInvocation(const std::string& core_code,
                                     const std::string& test_code) const {
    Invocation inv;
    inv.files["main.go"] = core_code;
    inv.files["main_test.go"] = test_code;
    inv.setup.push_back({"go", "mod", "init", MODULE_NAME});
    inv.argv = {"go", "test", "-v"};
    return inv;
}

bool GoRuntime::reusesCompileResult(const std::string& test_code) const {
    return isBlank(test_code);
}

ExecResult GoRuntime::compileCheck(const std::string& core_code, ProcessRunner& runner) const {
    return runner.execute(compileInvocation(core_code));
}

ExecResult GoRuntime::runTests(const std::string& core_code, const std::string& test_code,
                               ProcessRunner& runner) const {
    if (isBlank(test_code)) return compileCheck(core_code, runner);
    return runner.execute(testInvocation(core_code, test_code));
}

} // namespace codegym

#include "runtime/language_runtime.hpp"

#include <stdexcept>

namespace codegym {

LanguageRuntime::LanguageRuntime(std::string language, Cascade cascade,
                                 std::unique_ptr<RewardPolicy> policy)
    : language_(std::move(language)), policy_(std::move(policy)) {
    if (!policy_) throw std::invalid_argument("runtime '" + language_ + "' needs a reward policy");
    extractor_.registerCascade(language_, std::move(cascade));
}

bool LanguageRuntime::reusesCompileResult(const std::string&) const {
    return false;
}

Extraction LanguageRuntime::extractVerdict(const std::string& stdout_text,
                                           const std::string& stderr_text) const {
    return extractor_.extractDetailed(language_, stdout_text, stderr_text);
}

double LanguageRuntime::reward(bool compiles, const Verdict& verdict) const {
    return policy_->reward(compiles, verdict);
}

std::string combineSources(const std::string& core_code, const std::string& test_code) {
    return core_code + "\n\n" + test_code;
}

} // namespace codegym

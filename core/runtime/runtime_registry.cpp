#include "runtime/runtime_registry.hpp"
#include "runtime/go_runtime.hpp"
#include "runtime/script_runtime.hpp"

#include <stdexcept>

namespace codegym {

void RuntimeRegistry::add(std::shared_ptr<const LanguageRuntime> runtime) {
    if (!runtime) throw std::invalid_argument("null runtime");
    std::string lang = runtime->language();
    runtimes_[lang] = std::move(runtime);
}

bool RuntimeRegistry::has(const std::string& language) const {
    return runtimes_.count(language) > 0;
}

std::shared_ptr<const LanguageRuntime> RuntimeRegistry::get(const std::string& language) const {
    auto it = runtimes_.find(language);
    if (it == runtimes_.end()) {
        throw std::out_of_range("no runtime registered for language '" + language + "'");
    }
    return it->second;
}

std::vector<std::string> RuntimeRegistry::languages() const {
    std::vector<std::string> result;
    for (const auto& [lang, _] : runtimes_) result.push_back(lang);
    return result;
}

std::shared_ptr<const LanguageRuntime> makeRuntime(const EnvConfig& config) {
    auto policy = makeRewardPolicy(config.reward);
    const std::string& lang = config.language;

    if (lang == "go") return std::make_shared<GoRuntime>(std::move(policy));
    if (lang == "ruby") return std::make_shared<ScriptRuntime>(rubyProfile(), std::move(policy));
    if (lang == "julia") {
        return std::make_shared<ScriptRuntime>(juliaProfile(config.imports), std::move(policy));
    }
    if (lang == "r") return std::make_shared<ScriptRuntime>(rProfile(), std::move(policy));
    if (lang == "zig") return std::make_shared<ScriptRuntime>(zigProfile(), std::move(policy));

    throw std::out_of_range("no runtime for language '" + lang + "'");
}

RuntimeRegistry makeDefaultRuntimeRegistry(const std::map<std::string, EnvConfig>& configs) {
    RuntimeRegistry registry;
    for (const auto& lang : supportedLanguages()) {
        auto it = configs.find(lang);
        registry.add(makeRuntime(it != configs.end() ? it->second : defaultEnvConfig(lang)));
    }
    return registry;
}

} // namespace codegym

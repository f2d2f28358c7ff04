#pragma once

#include "config/env_config.hpp"
#include "runtime/language_runtime.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codegym {

/// Language id → runtime. Runtimes are shared read-only.
class RuntimeRegistry {
public:
    /// Register (or replace) the runtime under its language id.
    void add(std::shared_ptr<const LanguageRuntime> runtime);

    bool has(const std::string& language) const;

    /// Throws std::out_of_range naming the language if unknown.
    std::shared_ptr<const LanguageRuntime> get(const std::string& language) const;

    std::vector<std::string> languages() const;
    size_t count() const { return runtimes_.size(); }

private:
    std::map<std::string, std::shared_ptr<const LanguageRuntime>> runtimes_;
};

/// Build the runtime for one language from its config.
/// Throws std::out_of_range for an unknown language.
std::shared_ptr<const LanguageRuntime> makeRuntime(const EnvConfig& config);

/// All built-in languages, each using configs[lang] when present and
/// its defaults otherwise.
RuntimeRegistry makeDefaultRuntimeRegistry(const std::map<std::string, EnvConfig>& configs = {});

} // namespace codegym

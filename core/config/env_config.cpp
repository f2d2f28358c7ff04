#include "config/env_config.hpp"
#include "exec/process_runner.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

namespace codegym {

using nlohmann::json;

namespace {

double readNumber(const json& obj, const std::string& section, const std::string& key,
                  double fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_number()) {
        throw ConfigError("config field '" + section + key + "' must be a number");
    }
    return it->get<double>();
}

std::vector<std::string> readStringList(const json& obj, const std::string& section,
                                        const std::string& key) {
    const json& arr = obj.at(key);
    if (!arr.is_array()) {
        throw ConfigError("config field '" + section + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& v : arr) {
        if (!v.is_string()) {
            throw ConfigError("config field '" + section + key + "' must be an array of strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

const json& section(const json& j, const std::string& name) {
    static const json empty = json::object();
    auto it = j.find(name);
    if (it == j.end()) return empty;
    if (!it->is_object()) throw ConfigError("config section '" + name + "' must be an object");
    return *it;
}

void warnUnknownKeys(const json& obj, const std::string& where,
                     const std::vector<std::string>& known) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (std::find(known.begin(), known.end(), it.key()) == known.end()) {
            CODEGYM_LOG_WARN("Ignoring unknown config key '" << where << it.key() << "'");
        }
    }
}

void applySafety(const json& j, SafetyConfig& safety) {
    warnUnknownKeys(j, "safety.", {"penalty", "patterns", "extra_patterns"});
    safety.penalty = readNumber(j, "safety.", "penalty", safety.penalty);
    if (j.contains("patterns")) safety.patterns = readStringList(j, "safety.", "patterns");
    if (j.contains("extra_patterns")) {
        for (auto& p : readStringList(j, "safety.", "extra_patterns")) {
            safety.patterns.push_back(std::move(p));
        }
    }
}

void applyQuality(const json& j, QualityConfig& quality) {
    warnUnknownKeys(j, "quality.", {"max_length", "concise_bonus", "verbosity_penalty"});
    if (j.contains("max_length")) {
        const json& v = j.at("max_length");
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            throw ConfigError("config field 'quality.max_length' must be a non-negative integer");
        }
        quality.max_length = v.get<size_t>();
    }
    quality.concise_bonus = readNumber(j, "quality.", "concise_bonus", quality.concise_bonus);
    quality.verbosity_penalty =
        readNumber(j, "quality.", "verbosity_penalty", quality.verbosity_penalty);
}

void applyReward(const json& j, RewardConfig& reward) {
    warnUnknownKeys(j, "reward.",
                    {"kind", "base", "pass_weight", "fail_weight", "ratio_scale",
                     "compile_penalty", "min_reward", "max_reward", "perfect_margin", "tiers"});
    if (j.contains("kind")) {
        if (!j.at("kind").is_string()) throw ConfigError("config field 'reward.kind' must be a string");
        reward.kind = j.at("kind").get<std::string>();
    }
    reward.base = readNumber(j, "reward.", "base", reward.base);
    reward.pass_weight = readNumber(j, "reward.", "pass_weight", reward.pass_weight);
    reward.fail_weight = readNumber(j, "reward.", "fail_weight", reward.fail_weight);
    reward.ratio_scale = readNumber(j, "reward.", "ratio_scale", reward.ratio_scale);

    RewardBounds& b = reward.bounds;
    b.compile_penalty = readNumber(j, "reward.", "compile_penalty", b.compile_penalty);
    b.min_reward = readNumber(j, "reward.", "min_reward", b.min_reward);
    b.max_reward = readNumber(j, "reward.", "max_reward", b.max_reward);
    b.perfect_margin = readNumber(j, "reward.", "perfect_margin", b.perfect_margin);

    if (j.contains("tiers")) {
        const json& arr = j.at("tiers");
        if (!arr.is_array()) throw ConfigError("config field 'reward.tiers' must be an array");
        reward.tiers.clear();
        for (const auto& t : arr) {
            if (!t.is_object()) throw ConfigError("each entry of 'reward.tiers' must be an object");
            RewardTier tier;
            tier.min_success_rate = readNumber(t, "reward.tiers.", "min_success_rate", 0.0);
            tier.bonus = readNumber(t, "reward.tiers.", "bonus", 0.0);
            reward.tiers.push_back(tier);
        }
    }
}

} // namespace

// ─── Defaults ──────────────────────────────────────────────────

const std::vector<std::string>& supportedLanguages() {
    static const std::vector<std::string> langs = {"go", "julia", "r", "ruby", "zig"};
    return langs;
}

bool isSupportedLanguage(const std::string& language) {
    const auto& langs = supportedLanguages();
    return std::find(langs.begin(), langs.end(), language) != langs.end();
}

EnvConfig defaultEnvConfig(const std::string& language) {
    if (!isSupportedLanguage(language)) {
        throw ConfigError("unsupported language: '" + language + "'");
    }

    EnvConfig config;
    config.language = language;
    config.safety.patterns = defaultDangerPatterns(language);

    // Julia has no strong per-test signal in script mode, so it gets
    // smaller per-test weights and success-rate tiers instead.
    if (language == "julia") {
        config.reward.kind = "tiered";
        config.reward.pass_weight = 1.0;
        config.reward.fail_weight = 1.0;
    }
    return config;
}

// ─── JSON ──────────────────────────────────────────────────────

EnvConfig envConfigFromJson(const json& j, const std::string& language) {
    if (!j.is_object()) throw ConfigError("config must be a JSON object");

    EnvConfig config = defaultEnvConfig(language);
    warnUnknownKeys(j, "", {"language", "timeout_seconds", "max_output_bytes", "imports",
                            "safety", "quality", "reward"});

    if (j.contains("language")) {
        const json& v = j.at("language");
        if (!v.is_string() || v.get<std::string>() != language) {
            throw ConfigError("config 'language' does not match '" + language + "'");
        }
    }

    config.timeout_seconds = readNumber(j, "", "timeout_seconds", config.timeout_seconds);
    if (j.contains("max_output_bytes")) {
        const json& v = j.at("max_output_bytes");
        if (!v.is_number_integer() || v.get<long long>() <= 0) {
            throw ConfigError("config field 'max_output_bytes' must be a positive integer");
        }
        config.max_output_bytes = v.get<size_t>();
    }
    if (j.contains("imports")) config.imports = readStringList(j, "", "imports");

    applySafety(section(j, "safety"), config.safety);
    applyQuality(section(j, "quality"), config.quality);
    applyReward(section(j, "reward"), config.reward);

    validateEnvConfig(config);
    return config;
}

EnvConfig loadEnvConfig(const std::string& path, const std::string& language) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file: " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError("config file must hold a JSON object: " + path);

    bool keyed = false;
    for (const auto& lang : supportedLanguages()) {
        if (j.contains(lang)) keyed = true;
    }

    if (!keyed) {
        CODEGYM_LOG_DEBUG("Loaded " << language << " config from " << path);
        return envConfigFromJson(j, language);
    }

    auto it = j.find(language);
    if (it == j.end()) {
        CODEGYM_LOG_INFO("No '" << language << "' entry in " << path << ", using defaults");
        return defaultEnvConfig(language);
    }
    CODEGYM_LOG_DEBUG("Loaded " << language << " config from " << path);
    return envConfigFromJson(*it, language);
}

json envConfigToJson(const EnvConfig& config) {
    json tiers = json::array();
    for (const auto& t : config.reward.tiers) {
        tiers.push_back({{"min_success_rate", t.min_success_rate}, {"bonus", t.bonus}});
    }
    const RewardBounds& b = config.reward.bounds;
    return {
        {"language", config.language},
        {"timeout_seconds", config.timeout_seconds},
        {"max_output_bytes", config.max_output_bytes},
        {"imports", config.imports},
        {"safety", {{"penalty", config.safety.penalty}, {"patterns", config.safety.patterns}}},
        {"quality", {{"max_length", config.quality.max_length},
                     {"concise_bonus", config.quality.concise_bonus},
                     {"verbosity_penalty", config.quality.verbosity_penalty}}},
        {"reward", {{"kind", config.reward.kind},
                    {"base", config.reward.base},
                    {"pass_weight", config.reward.pass_weight},
                    {"fail_weight", config.reward.fail_weight},
                    {"ratio_scale", config.reward.ratio_scale},
                    {"compile_penalty", b.compile_penalty},
                    {"min_reward", b.min_reward},
                    {"max_reward", b.max_reward},
                    {"perfect_margin", b.perfect_margin},
                    {"tiers", tiers}}},
    };
}

// ─── Validation ────────────────────────────────────────────────

void validateEnvConfig(const EnvConfig& config) {
    if (!(config.timeout_seconds > 0.0)) {
        throw ConfigError("timeout_seconds must be positive");
    }
    if (config.timeout_seconds > MAX_TIMEOUT_SECONDS) {
        throw ConfigError("timeout_seconds must not exceed " + formatSeconds(MAX_TIMEOUT_SECONDS));
    }
    if (config.max_output_bytes == 0) {
        throw ConfigError("max_output_bytes must be positive");
    }
    if (config.quality.verbosity_penalty < 0.0) {
        throw ConfigError("quality.verbosity_penalty must be non-negative");
    }

    if (!config.imports.empty() && config.language != "julia") {
        throw ConfigError("imports are only supported for julia");
    }
    static const std::regex package_name(R"(^[A-Za-z_][A-Za-z0-9_]*(\.[A-Za-z_][A-Za-z0-9_]*)*$)");
    for (const auto& pkg : config.imports) {
        if (!std::regex_match(pkg, package_name)) {
            throw ConfigError("invalid package name in imports: '" + pkg + "'");
        }
    }

    try {
        makeRewardPolicy(config.reward);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("invalid reward config: ") + e.what());
    }

    for (const auto& p : config.safety.patterns) {
        try {
            std::regex re(p, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw ConfigError("invalid safety pattern '" + p + "': " + e.what());
        }
    }
}

} // namespace codegym

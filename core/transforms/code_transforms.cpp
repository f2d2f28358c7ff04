#include "transforms/code_transforms.hpp"

#include <cctype>

namespace codegym {

// ─── Safety ────────────────────────────────────────────────────

SafetyTransform::SafetyTransform(const SafetyConfig& config)
    : penalty_(config.penalty), sources_(config.patterns) {
    compiled_.reserve(sources_.size());
    for (const auto& p : sources_) {
        compiled_.emplace_back(p, std::regex::ECMAScript);
    }
}

std::string SafetyTransform::firstViolation(const std::string& code) const {
    for (size_t i = 0; i < compiled_.size(); i++) {
        if (std::regex_search(code, compiled_[i])) return sources_[i];
    }
    return "";
}

Observation SafetyTransform::apply(Observation obs) const {
    std::string hit = firstViolation(submittedCode(obs));
    if (hit.empty()) {
        adjustReward(obs, 0.0);
        return obs;
    }
    adjustReward(obs, penalty_);
    addMetadata(obs, "safety_violation", hit);
    return obs;
}

// ─── Quality ───────────────────────────────────────────────────

size_t trimmedLength(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;

    size_t count = 0;
    for (size_t i = b; i < e; i++) {
        // skip UTF-8 continuation bytes
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) count++;
    }
    return count;
}

double QualityTransform::adjustmentFor(const std::string& code) const {
    if (trimmedLength(code) <= config_.max_length) return config_.concise_bonus;
    return -config_.verbosity_penalty;
}

Observation QualityTransform::apply(Observation obs) const {
    double delta = adjustmentFor(submittedCode(obs));
    adjustReward(obs, delta);
    addMetadata(obs, "quality_adjustment", delta);
    return obs;
}

// ─── Danger Patterns ───────────────────────────────────────────

std::vector<std::string> defaultDangerPatterns(const std::string& language) {
    if (language == "ruby") {
        return {
            R"(`)", R"(system\()", R"(exec\()", R"(spawn\()", R"(eval\()",
            R"(File\.delete)", R"(File\.unlink)", R"(FileUtils\.rm)", R"(Dir\.delete)",
            R"(require\s+['"]open-uri['"])", R"(Net::HTTP)", R"(open\()",
            R"(IO\.popen)", R"(Kernel\.fork)",
        };
    }
    if (language == "go") {
        return {
            R"(os\.Remove)", R"(os\.RemoveAll)", R"(os\.Exit)", R"(os\.Exec)",
            R"(os\.StartProcess)", R"(syscall\.)", R"(unsafe\.)", R"(exec\.Command)",
            R"(http\.Get)", R"(http\.Post)", R"(net\.Dial)", R"(ioutil\.WriteFile)",
            R"(os\.WriteFile)", R"(os\.Create)", R"(os\.OpenFile)",
        };
    }
    if (language == "julia") {
        return {
            R"(run\()", R"(read\()", R"(write\()", R"(unsafe_)", R"(ccall\()",
            R"(Base\.exit)", R"(Base\.kill)", R"(rm\()", R"(download\()",
        };
    }
    if (language == "r") {
        return {
            R"(system\()", R"(system2\()", R"(shell\()", R"(file\.remove\()",
            R"(unlink\()", R"(download\.file\()", R"(install\.packages\()",
            R"(setwd\()", R"(Sys\.setenv\()", R"(\.C\()", R"(\.Call\()",
            R"(\.External\()", R"(\.Fortran\()",
        };
    }
    if (language == "zig") {
        return {
            R"(@cImport)", R"(@cInclude)", R"(@cDefine)", R"(std\.os\.exit)",
            R"(std\.process\.exit)", R"(std\.fs\.deleteFile)", R"(std\.fs\.deleteDir)",
            R"(@panic)", R"(std\.os\.execve)", R"(std\.ChildProcess)",
        };
    }
    return {};
}

} // namespace codegym

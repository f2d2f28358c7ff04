#pragma once

#include <climits>
#include <string>

namespace codegym {

/// a + b for non-negative counts, stopping at INT_MAX instead of
/// overflowing.
inline int saturatingAdd(int a, int b) {
    return a > INT_MAX - b ? INT_MAX : a + b;
}

/// Normalized test outcome. (0, 0) means no tests ran.
struct Verdict {
    int passed = 0;
    int failed = 0;

    Verdict() = default;
    Verdict(int p, int f) : passed(p < 0 ? 0 : p), failed(f < 0 ? 0 : f) {}

    int total() const { return saturatingAdd(passed, failed); }
    bool empty() const { return passed == 0 && failed == 0; }

    bool operator==(const Verdict& other) const {
        return passed == other.passed && failed == other.failed;
    }
    bool operator!=(const Verdict& other) const { return !(*this == other); }
};

/// A verdict together with the strategy that produced it.
/// strategy is empty when nothing matched.
struct Extraction {
    Verdict verdict;
    std::string strategy;
};

} // namespace codegym

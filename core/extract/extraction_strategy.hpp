#pragma once

#include "extract/verdict.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace codegym {

/// Where a strategy sits in a cascade. Informational; the cascade
/// order is what decides precedence.
enum class StrategyTier { Summary, Markers, Fallback };

const char* tierName(StrategyTier tier);

/// Lines longer than this are never handed to a regex. Every verdict
/// line is short, and std::regex recursion grows with the line.
constexpr std::size_t MAX_MATCH_LINE = 4096;

// ─── Extraction Strategy ───────────────────────────────────────
// One way of reading a verdict out of combined tool output.
// Returns nullopt when the output carries nothing this strategy
// recognizes. Must be pure: same input, same answer. Output comes
// from untrusted code, so extract() never throws.

class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() = default;

    virtual std::string name() const = 0;
    virtual StrategyTier tier() const = 0;
    virtual std::optional<Verdict> extract(const std::string& output) const = 0;
};

// ─── Regex Summary ─────────────────────────────────────────────
// First line matching one aggregate pattern, converted by a callback.

class RegexSummaryStrategy : public ExtractionStrategy {
public:
    using Converter = std::function<Verdict(const std::smatch&)>;

    RegexSummaryStrategy(std::string name, const std::string& pattern, Converter convert,
                         bool icase = false);

    std::string name() const override { return name_; }
    StrategyTier tier() const override { return StrategyTier::Summary; }
    std::optional<Verdict> extract(const std::string& output) const override;

private:
    std::string name_;
    std::regex pattern_;
    Converter convert_;
};

// ─── Marker Count ──────────────────────────────────────────────
// Counts every occurrence of per-test pass and fail markers, line
// by line.
// Matches nothing when no marker of either kind is present.

class MarkerCountStrategy : public ExtractionStrategy {
public:
    MarkerCountStrategy(std::string name,
                        const std::vector<std::string>& pass_patterns,
                        const std::vector<std::string>& fail_patterns,
                        bool icase = false);

    std::string name() const override { return name_; }
    StrategyTier tier() const override { return StrategyTier::Markers; }
    std::optional<Verdict> extract(const std::string& output) const override;

private:
    std::string name_;
    std::vector<std::regex> pass_;
    std::vector<std::regex> fail_;

    static int countAll(const std::vector<std::regex>& patterns,
                        const std::vector<std::string>& lines);
};

// ─── Overall Status ────────────────────────────────────────────
// Coarse fallback: an overall PASS/FAIL line with no breakdown.
// A pass line counts as one passing test only if some evidence
// string shows tests actually ran (or no evidence is required);
// otherwise a fail line counts as one failing test.

class OverallStatusStrategy : public ExtractionStrategy {
public:
    OverallStatusStrategy(std::string name,
                          const std::vector<std::string>& pass_lines,
                          const std::vector<std::string>& fail_lines,
                          std::vector<std::string> ran_evidence = {});

    std::string name() const override { return name_; }
    StrategyTier tier() const override { return StrategyTier::Fallback; }
    std::optional<Verdict> extract(const std::string& output) const override;

private:
    std::string name_;
    std::vector<std::regex> pass_lines_;
    std::vector<std::regex> fail_lines_;
    std::vector<std::string> ran_evidence_;

    static bool anyLineMatches(const std::vector<std::regex>& patterns,
                               const std::vector<std::string>& lines);
};

// ─── Minitest Progress ─────────────────────────────────────────
// The dot line Minitest prints under "# Running:".
//   ..F.E.
// '.' passes, 'F' and 'E' fail, 'S' is skipped.

class MinitestProgressStrategy : public ExtractionStrategy {
public:
    std::string name() const override { return "minitest_progress"; }
    StrategyTier tier() const override { return StrategyTier::Markers; }
    std::optional<Verdict> extract(const std::string& output) const override;
};

// ─── testthat Reporter Table ───────────────────────────────────
// Rows of the testthat progress reporter:
//   ✔ | F W S  OK | Context
//   ✖ | 1        2 | arith
// Zero columns are printed blank, so cells are aligned to the
// header by right edge when a header is present.

class TestthatTableStrategy : public ExtractionStrategy {
public:
    std::string name() const override { return "testthat_table"; }
    StrategyTier tier() const override { return StrategyTier::Summary; }
    std::optional<Verdict> extract(const std::string& output) const override;
};

// ─── Julia Test Summary ────────────────────────────────────────
//   Test Summary: | Pass  Fail  Error  Broken  Total  Time
//   arith         |    2     1      1              4  0.1s
// Any subset of columns may be printed. The first row under each
// header is the top-level testset; several tables are summed.

class JuliaSummaryTableStrategy : public ExtractionStrategy {
public:
    std::string name() const override { return "julia_summary_table"; }
    StrategyTier tier() const override { return StrategyTier::Summary; }
    std::optional<Verdict> extract(const std::string& output) const override;
};

// ─── Helpers ───────────────────────────────────────────────────

/// Split into lines, dropping a trailing '\r' from each.
std::vector<std::string> splitLines(const std::string& text);

/// splitLines() without the lines longer than MAX_MATCH_LINE.
std::vector<std::string> matchableLines(const std::string& text);

/// A whitespace-delimited token and the offset one past its end.
struct Cell {
    std::string text;
    std::size_t end = 0;
};

std::vector<Cell> tokenize(const std::string& segment);

/// Assign each row cell to the header column whose right edge is
/// closest. Cells are matched positionally when counts agree.
/// Returns one entry per header column (empty string if unfilled).
std::vector<std::string> alignToHeader(const std::vector<Cell>& header,
                                       const std::vector<Cell>& row);

/// Parse a non-negative integer token; nullopt if not all digits.
/// Values past INT_MAX saturate.
std::optional<int> parseCount(const std::string& token);

/// Count captured by group i of m, 0 if the group is not a number.
int matchCount(const std::smatch& m, std::size_t i);

} // namespace codegym

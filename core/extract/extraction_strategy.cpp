#include "extract/extraction_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <iterator>
#include <limits>

namespace codegym {

const char* tierName(StrategyTier tier) {
    switch (tier) {
        case StrategyTier::Summary:  return "summary";
        case StrategyTier::Markers:  return "markers";
        case StrategyTier::Fallback: return "fallback";
    }
    return "unknown";
}

namespace {

std::regex compile(const std::string& pattern, bool icase) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    return std::regex(pattern, flags);
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

} // namespace

// ─── Helpers ───────────────────────────────────────────────────

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        std::size_t end = (nl == std::string::npos) ? text.size() : nl;
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::vector<std::string> matchableLines(const std::string& text) {
    std::vector<std::string> lines = splitLines(text);
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [](const std::string& l) { return l.size() > MAX_MATCH_LINE; }),
                lines.end());
    return lines;
}

std::vector<Cell> tokenize(const std::string& segment) {
    std::vector<Cell> cells;
    std::size_t i = 0;
    while (i < segment.size()) {
        while (i < segment.size() && std::isspace(static_cast<unsigned char>(segment[i]))) i++;
        if (i >= segment.size()) break;
        std::size_t b = i;
        while (i < segment.size() && !std::isspace(static_cast<unsigned char>(segment[i]))) i++;
        cells.push_back({segment.substr(b, i - b), i});
    }
    return cells;
}

std::vector<std::string> alignToHeader(const std::vector<Cell>& header,
                                       const std::vector<Cell>& row) {
    std::vector<std::string> values(header.size());
    if (header.empty()) return values;

    if (header.size() == row.size()) {
        for (std::size_t i = 0; i < row.size(); i++) values[i] = row[i].text;
        return values;
    }

    for (const auto& cell : row) {
        std::size_t best = 0;
        long best_dist = std::numeric_limits<long>::max();
        for (std::size_t h = 0; h < header.size(); h++) {
            long dist = std::labs(static_cast<long>(header[h].end) - static_cast<long>(cell.end));
            if (dist < best_dist) {
                best_dist = dist;
                best = h;
            }
        }
        if (values[best].empty()) values[best] = cell.text;
    }
    return values;
}

std::optional<int> parseCount(const std::string& token) {
    if (token.empty()) return std::nullopt;
    int value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        int digit = c - '0';
        value = value > (INT_MAX - digit) / 10 ? INT_MAX : value * 10 + digit;
    }
    return value;
}

int matchCount(const std::smatch& m, std::size_t i) {
    if (i >= m.size() || !m[i].matched) return 0;
    return parseCount(m[i].str()).value_or(0);
}

// ─── Regex Summary ─────────────────────────────────────────────

RegexSummaryStrategy::RegexSummaryStrategy(std::string name, const std::string& pattern,
                                           Converter convert, bool icase)
    : name_(std::move(name)), pattern_(compile(pattern, icase)), convert_(std::move(convert)) {}

std::optional<Verdict> RegexSummaryStrategy::extract(const std::string& output) const {
    for (const auto& line : matchableLines(output)) {
        std::smatch m;
        if (std::regex_search(line, m, pattern_)) return convert_(m);
    }
    return std::nullopt;
}

// ─── Marker Count ──────────────────────────────────────────────

MarkerCountStrategy::MarkerCountStrategy(std::string name,
                                         const std::vector<std::string>& pass_patterns,
                                         const std::vector<std::string>& fail_patterns,
                                         bool icase)
    : name_(std::move(name)) {
    for (const auto& p : pass_patterns) pass_.push_back(compile(p, icase));
    for (const auto& p : fail_patterns) fail_.push_back(compile(p, icase));
}

int MarkerCountStrategy::countAll(const std::vector<std::regex>& patterns,
                                  const std::vector<std::string>& lines) {
    int count = 0;
    for (const auto& line : lines) {
        for (const auto& re : patterns) {
            auto begin = std::sregex_iterator(line.begin(), line.end(), re);
            int hits = static_cast<int>(std::distance(begin, std::sregex_iterator()));
            count = saturatingAdd(count, hits);
        }
    }
    return count;
}

std::optional<Verdict> MarkerCountStrategy::extract(const std::string& output) const {
    auto lines = matchableLines(output);
    int passed = countAll(pass_, lines);
    int failed = countAll(fail_, lines);
    if (passed == 0 && failed == 0) return std::nullopt;
    return Verdict(passed, failed);
}

// ─── Overall Status ────────────────────────────────────────────

OverallStatusStrategy::OverallStatusStrategy(std::string name,
                                             const std::vector<std::string>& pass_lines,
                                             const std::vector<std::string>& fail_lines,
                                             std::vector<std::string> ran_evidence)
    : name_(std::move(name)), ran_evidence_(std::move(ran_evidence)) {
    for (const auto& p : pass_lines) pass_lines_.push_back(compile(p, false));
    for (const auto& p : fail_lines) fail_lines_.push_back(compile(p, false));
}

bool OverallStatusStrategy::anyLineMatches(const std::vector<std::regex>& patterns,
                                           const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        for (const auto& re : patterns) {
            if (std::regex_search(line, re)) return true;
        }
    }
    return false;
}

std::optional<Verdict> OverallStatusStrategy::extract(const std::string& output) const {
    auto lines = matchableLines(output);

    if (anyLineMatches(pass_lines_, lines)) {
        bool ran = ran_evidence_.empty();
        for (const auto& ev : ran_evidence_) {
            if (output.find(ev) != std::string::npos) {
                ran = true;
                break;
            }
        }
        if (ran) return Verdict(1, 0);
    }

    if (anyLineMatches(fail_lines_, lines)) return Verdict(0, 1);
    return std::nullopt;
}

// ─── Minitest Progress ─────────────────────────────────────────

std::optional<Verdict> MinitestProgressStrategy::extract(const std::string& output) const {
    auto lines = splitLines(output);
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (trim(lines[i]) != "# Running:") continue;

        std::size_t j = i + 1;
        while (j < lines.size() && trim(lines[j]).empty()) j++;
        if (j >= lines.size()) return std::nullopt;

        std::string progress = trim(lines[j]);
        int passed = 0;
        int failed = 0;
        for (char c : progress) {
            switch (c) {
                case '.': passed++; break;
                case 'F':
                case 'E': failed++; break;
                case 'S': break;
                default: return std::nullopt;
            }
        }
        if (passed == 0 && failed == 0) return std::nullopt;
        return Verdict(passed, failed);
    }
    return std::nullopt;
}

// ─── testthat Reporter Table ───────────────────────────────────

namespace {

const std::regex& testthatHeader() {
    static const std::regex re(R"(\|\s*F\s+W\s+S\s+OK\s*\|)");
    return re;
}

const std::regex& testthatRow() {
    static const std::regex re("^\\s*(✔|✓|✖|✗|❌|⚠)\\s*\\|");
    return re;
}

bool isFailSymbol(const std::string& sym) {
    return sym == "✖" || sym == "✗" || sym == "❌";
}

/// Text between the first and second '|' of a line, or "" if absent.
std::string cellSegment(const std::string& line) {
    std::size_t a = line.find('|');
    if (a == std::string::npos) return "";
    std::size_t b = line.find('|', a + 1);
    if (b == std::string::npos) return "";
    return line.substr(a + 1, b - a - 1);
}

} // namespace

std::optional<Verdict> TestthatTableStrategy::extract(const std::string& output) const {
    std::vector<Cell> header;
    bool have_header = false;
    bool any_row = false;
    int passed = 0;
    int failed = 0;

    for (const auto& line : matchableLines(output)) {
        if (std::regex_search(line, testthatHeader())) {
            header = tokenize(cellSegment(line));
            have_header = true;
            continue;
        }

        std::smatch m;
        if (!std::regex_search(line, m, testthatRow())) continue;

        std::vector<Cell> cells = tokenize(cellSegment(line));
        int f = 0;
        int ok = 0;
        if (have_header && header.size() == 4) {
            auto values = alignToHeader(header, cells);
            f = parseCount(values[0]).value_or(0);
            ok = parseCount(values[3]).value_or(0);
        } else if (cells.size() == 1) {
            int n = parseCount(cells[0].text).value_or(0);
            (isFailSymbol(m[1].str()) ? f : ok) = n;
        } else if (cells.size() >= 2) {
            f = parseCount(cells.front().text).value_or(0);
            ok = parseCount(cells.back().text).value_or(0);
        } else {
            continue;
        }

        any_row = true;
        failed = saturatingAdd(failed, f);
        passed = saturatingAdd(passed, ok);
    }

    if (!any_row) return std::nullopt;
    return Verdict(passed, failed);
}

// ─── Julia Test Summary ────────────────────────────────────────

std::optional<Verdict> JuliaSummaryTableStrategy::extract(const std::string& output) const {
    auto lines = splitLines(output);
    bool any_table = false;
    int passed = 0;
    int failed = 0;

    for (std::size_t i = 0; i < lines.size(); i++) {
        const std::string& head = lines[i];
        if (head.find("Test Summary:") == std::string::npos) continue;
        std::size_t hp = head.find('|');
        if (hp == std::string::npos) continue;

        std::vector<Cell> header = tokenize(head.substr(hp + 1));
        if (header.empty()) continue;

        std::size_t j = i + 1;
        while (j < lines.size() && lines[j].find('|') == std::string::npos) j++;
        if (j >= lines.size()) break;

        const std::string& row = lines[j];
        std::size_t rp = row.find('|');
        auto values = alignToHeader(header, tokenize(row.substr(rp + 1)));

        int pass = 0, fail = 0, error = 0;
        for (std::size_t c = 0; c < header.size(); c++) {
            int v = parseCount(values[c]).value_or(0);
            const std::string& col = header[c].text;
            if (col == "Pass") pass = v;
            else if (col == "Fail") fail = v;
            else if (col == "Error") error = v;
        }

        any_table = true;
        passed = saturatingAdd(passed, pass);
        failed = saturatingAdd(failed, saturatingAdd(fail, error));
        i = j;
    }

    if (!any_table) return std::nullopt;
    return Verdict(passed, failed);
}

} // namespace codegym

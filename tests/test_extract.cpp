#include <gtest/gtest.h>
#include "extract/extraction_strategy.hpp"
#include "extract/test_result_extractor.hpp"

#include <climits>

using namespace codegym;

namespace {

const TestResultExtractor& extractor() {
    static const TestResultExtractor instance = makeDefaultExtractor();
    return instance;
}

Verdict verdictFor(const std::string& lang, const std::string& out, const std::string& err = "") {
    return extractor().extract(lang, out, err);
}

std::string strategyFor(const std::string& lang, const std::string& out, const std::string& err = "") {
    return extractor().extractDetailed(lang, out, err).strategy;
}

} // namespace

// ─── Helpers ──────────────────────────────────────────────────

TEST(ExtractHelperTest, SplitLinesHandlesCrlf) {
    auto lines = splitLines("a\r\nb\nc");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
}

TEST(ExtractHelperTest, TokenizeRecordsRightEdges) {
    auto cells = tokenize(" Pass  Total");
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0].text, "Pass");
    EXPECT_EQ(cells[0].end, 5u);
    EXPECT_EQ(cells[1].text, "Total");
    EXPECT_EQ(cells[1].end, 12u);
}

TEST(ExtractHelperTest, AlignToHeaderByRightEdge) {
    auto header = tokenize(" Pass  Fail  Total");
    auto row = tokenize("    3            3");
    auto values = alignToHeader(header, row);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], "3");
    EXPECT_EQ(values[1], "");
    EXPECT_EQ(values[2], "3");
}

TEST(ExtractHelperTest, ParseCountRejectsNonDigits) {
    EXPECT_EQ(parseCount("12").value_or(-1), 12);
    EXPECT_FALSE(parseCount("0.0s").has_value());
    EXPECT_FALSE(parseCount("").has_value());
    EXPECT_FALSE(parseCount("-1").has_value());
}

TEST(ExtractHelperTest, ParseCountSaturates) {
    EXPECT_EQ(parseCount("2147483647").value_or(-1), INT_MAX);
    EXPECT_EQ(parseCount("2147483648").value_or(-1), INT_MAX);
    EXPECT_EQ(parseCount("99999999999999999999").value_or(-1), INT_MAX);
    EXPECT_EQ(parseCount("000000000000000000007").value_or(-1), 7);
}

TEST(ExtractHelperTest, SaturatingAdd) {
    EXPECT_EQ(saturatingAdd(2, 3), 5);
    EXPECT_EQ(saturatingAdd(2000000000, 2000000000), INT_MAX);
    EXPECT_EQ(saturatingAdd(INT_MAX, 0), INT_MAX);
    EXPECT_EQ(Verdict(INT_MAX, INT_MAX).total(), INT_MAX);
}

TEST(ExtractHelperTest, MatchableLinesDropsLongLines) {
    std::string text = "short\n" + std::string(MAX_MATCH_LINE + 1, 'x') + "\n" +
                       std::string(MAX_MATCH_LINE, 'y');
    auto lines = matchableLines(text);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "short");
    EXPECT_EQ(lines[1].size(), MAX_MATCH_LINE);
}

TEST(ExtractHelperTest, StripAnsiRemovesColorCodes) {
    EXPECT_EQ(stripAnsi("\x1b[32mok\x1b[0m done"), "ok done");
    EXPECT_EQ(stripAnsi("plain"), "plain");
}

TEST(ExtractHelperTest, VerdictClampsNegatives) {
    Verdict v(-2, 3);
    EXPECT_EQ(v.passed, 0);
    EXPECT_EQ(v.failed, 3);
    EXPECT_EQ(v.total(), 3);
    EXPECT_TRUE(Verdict().empty());
}

// ─── Registry ─────────────────────────────────────────────────

TEST(ExtractorTest, DefaultLanguages) {
    auto langs = extractor().languages();
    std::vector<std::string> expected = {"go", "julia", "r", "ruby", "zig"};
    EXPECT_EQ(langs, expected);
}

TEST(ExtractorTest, UnknownLanguageGivesEmptyVerdict) {
    Extraction ex = extractor().extractDetailed("cobol", "3 runs, 3 assertions, 0 failures, 0 errors, 0 skips", "");
    EXPECT_TRUE(ex.verdict.empty());
    EXPECT_TRUE(ex.strategy.empty());
}

TEST(ExtractorTest, NoMatchGivesEmptyVerdict) {
    for (const auto& lang : extractor().languages()) {
        Extraction ex = extractor().extractDetailed(lang, "hello world\n", "");
        EXPECT_TRUE(ex.verdict.empty()) << lang;
        EXPECT_TRUE(ex.strategy.empty()) << lang;
    }
}

TEST(ExtractorTest, ExtractionIsIdempotent) {
    std::string out = "=== RUN   TestAdd\n--- PASS: TestAdd (0.00s)\n--- FAIL: TestSub (0.00s)\nFAIL\n";
    Verdict a = verdictFor("go", out);
    Verdict b = verdictFor("go", out);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, Verdict(1, 1));
}

TEST(ExtractorTest, CustomCascadeReplacesBuiltIn) {
    TestResultExtractor ex;
    Cascade c;
    c.push_back(std::make_unique<MarkerCountStrategy>(
        "ticks", std::vector<std::string>{"OK"}, std::vector<std::string>{"NO"}));
    ex.registerCascade("toy", std::move(c));
    EXPECT_TRUE(ex.hasLanguage("toy"));
    EXPECT_EQ(ex.extract("toy", "OK OK NO", ""), Verdict(2, 1));
}

// ─── Ruby ─────────────────────────────────────────────────────

TEST(RubyExtractTest, MinitestSummaryAllPass) {
    std::string out =
        "Run options: --seed 1234\n\n# Running:\n\n...\n\n"
        "Finished in 0.001s, 3000.0 runs/s.\n\n"
        "3 runs, 3 assertions, 0 failures, 0 errors, 0 skips\n";
    EXPECT_EQ(verdictFor("ruby", out), Verdict(3, 0));
    EXPECT_EQ(strategyFor("ruby", out), "minitest_summary");
}

TEST(RubyExtractTest, MinitestErrorsCountAsFailures) {
    std::string out = "5 runs, 7 assertions, 1 failures, 1 errors, 0 skips\n";
    EXPECT_EQ(verdictFor("ruby", out), Verdict(3, 2));
}

TEST(RubyExtractTest, MinitestSingularForms) {
    EXPECT_EQ(verdictFor("ruby", "1 run, 1 assertion, 1 failure, 0 errors, 0 skips"), Verdict(0, 1));
}

TEST(RubyExtractTest, ProgressLineFallback) {
    std::string out = "Run options: --seed 42\n\n# Running:\n\n..F.\n";
    EXPECT_EQ(verdictFor("ruby", out), Verdict(3, 1));
    EXPECT_EQ(strategyFor("ruby", out), "minitest_progress");
}

TEST(RubyExtractTest, SummaryOnStderrIsFound) {
    EXPECT_EQ(verdictFor("ruby", "", "2 runs, 2 assertions, 0 failures, 0 errors, 0 skips\n"),
              Verdict(2, 0));
}

TEST(RubyExtractTest, ColoredSummary) {
    std::string out = "\x1b[32m4 runs, 4 assertions, 0 failures, 0 errors, 0 skips\x1b[0m\n";
    EXPECT_EQ(verdictFor("ruby", out), Verdict(4, 0));
}

// ─── Go ───────────────────────────────────────────────────────

TEST(GoExtractTest, CountsPassAndFailMarkers) {
    std::string out =
        "=== RUN   TestAdd\n"
        "--- PASS: TestAdd (0.00s)\n"
        "=== RUN   TestSub\n"
        "    main_test.go:12: Expected 1\n"
        "--- FAIL: TestSub (0.00s)\n"
        "FAIL\n"
        "exit status 1\n"
        "FAIL\ttempmodule\t0.002s\n";
    EXPECT_EQ(verdictFor("go", out), Verdict(1, 1));
    EXPECT_EQ(strategyFor("go", out), "go_test_markers");
}

TEST(GoExtractTest, SubtestsAreCounted) {
    std::string out =
        "=== RUN   TestMath\n"
        "=== RUN   TestMath/add\n"
        "=== RUN   TestMath/sub\n"
        "--- PASS: TestMath (0.00s)\n"
        "    --- PASS: TestMath/add (0.00s)\n"
        "    --- PASS: TestMath/sub (0.00s)\n"
        "PASS\n"
        "ok  \ttempmodule\t0.001s\n";
    EXPECT_EQ(verdictFor("go", out), Verdict(3, 0));
}

TEST(GoExtractTest, OverallPassWithEvidence) {
    std::string out = "=== RUN   TestX\nPASS\nok  \ttempmodule\t0.001s\n";
    EXPECT_EQ(verdictFor("go", out), Verdict(1, 0));
    EXPECT_EQ(strategyFor("go", out), "go_overall_status");
}

TEST(GoExtractTest, OverallPassWithoutEvidenceIsIgnored) {
    EXPECT_TRUE(verdictFor("go", "PASS\n").empty());
}

TEST(GoExtractTest, BuildFailureIsOneFailure) {
    std::string err =
        "# tempmodule [tempmodule.test]\n"
        "./main_test.go:5:2: undefined: Foo\n"
        "FAIL\ttempmodule [build failed]\n";
    EXPECT_EQ(verdictFor("go", "", err), Verdict(0, 1));
}

// ─── R ────────────────────────────────────────────────────────

TEST(RExtractTest, SummaryBox) {
    std::string out = "══ Results ═══\n[ FAIL 2 | WARN 0 | SKIP 0 | PASS 2 ]\n";
    EXPECT_EQ(verdictFor("r", out), Verdict(2, 2));
    EXPECT_EQ(strategyFor("r", out), "testthat_summary");
}

TEST(RExtractTest, ReporterTableRowsAreSummed) {
    std::string out =
        "✔ | F W S  OK | Context\n"
        "✔ |          3 | math\n"
        "✖ | 1        2 | strings\n";
    EXPECT_EQ(verdictFor("r", out), Verdict(5, 1));
    EXPECT_EQ(strategyFor("r", out), "testthat_table");
}

TEST(RExtractTest, ReporterRowWithoutHeader) {
    EXPECT_EQ(verdictFor("r", "✔ | 4 | math\n"), Verdict(4, 0));
    EXPECT_EQ(verdictFor("r", "✖ | 2 | math\n"), Verdict(0, 2));
}

TEST(RExtractTest, MessageMarkersFallback) {
    std::string out = "Test passed 🎉\nTest passed 🥇\nError (test.R:4:3): it breaks\n";
    EXPECT_EQ(verdictFor("r", out), Verdict(2, 1));
    EXPECT_EQ(strategyFor("r", out), "testthat_messages");
}

TEST(RExtractTest, MessageMarkersAreCaseInsensitive) {
    EXPECT_EQ(verdictFor("r", "test PASSED\n"), Verdict(1, 0));
}

// ─── Julia ────────────────────────────────────────────────────

TEST(JuliaExtractTest, SummaryWithoutFailColumn) {
    std::string out =
        "Test Summary: | Pass  Total  Time\n"
        "MyTests       |    1      1  0.0s\n";
    EXPECT_EQ(verdictFor("julia", out), Verdict(1, 0));
    EXPECT_EQ(strategyFor("julia", out), "julia_summary_table");
}

TEST(JuliaExtractTest, FailAndErrorColumns) {
    std::string out =
        "Test Summary: | Pass  Fail  Error  Total  Time\n"
        "MyTests       |    2     1      1      4  0.1s\n"
        "ERROR: LoadError: Some tests did not pass: 2 passed, 1 failed, 1 errored, 0 broken.\n";
    EXPECT_EQ(verdictFor("julia", out), Verdict(2, 2));
}

TEST(JuliaExtractTest, BlankColumnAlignedByRightEdge) {
    std::string out =
        "Test Summary: | Pass  Fail  Total  Time\n"
        "MyTests       |    3            3  0.0s\n";
    EXPECT_EQ(verdictFor("julia", out), Verdict(3, 0));
}

TEST(JuliaExtractTest, MultipleTopLevelTablesSum) {
    std::string out =
        "Test Summary: | Pass  Total  Time\n"
        "First         |    2      2  0.0s\n"
        "Test Summary: | Pass  Fail  Total  Time\n"
        "Second        |    1     1      2  0.0s\n";
    EXPECT_EQ(verdictFor("julia", out), Verdict(3, 1));
}

TEST(JuliaExtractTest, DidNotPassSummary) {
    std::string err = "ERROR: LoadError: Some tests did not pass: 1 passed, 2 failed, 1 errored, 0 broken.\n";
    EXPECT_EQ(verdictFor("julia", "", err), Verdict(1, 3));
    EXPECT_EQ(strategyFor("julia", "", err), "julia_did_not_pass");
}

TEST(JuliaExtractTest, FailureMarkersFallback) {
    std::string err =
        "Test Failed at /tmp/code.jl:5\n  Expression: add(1, 1) == 3\n"
        "Error During Test at /tmp/code.jl:6\n";
    EXPECT_EQ(verdictFor("julia", "", err), Verdict(0, 2));
}

// ─── Zig ──────────────────────────────────────────────────────

TEST(ZigExtractTest, AllPassed) {
    EXPECT_EQ(verdictFor("zig", "", "All 3 tests passed.\n"), Verdict(3, 0));
    EXPECT_EQ(verdictFor("zig", "", "All 1 test passed.\n"), Verdict(1, 0));
}

TEST(ZigExtractTest, PassedFailedSummary) {
    std::string err = "1 passed; 0 skipped; 2 failed.\n";
    EXPECT_EQ(verdictFor("zig", "", err), Verdict(1, 2));
    EXPECT_EQ(strategyFor("zig", "", err), "zig_summary");
}

TEST(ZigExtractTest, CommaSeparatedSummary) {
    EXPECT_EQ(verdictFor("zig", "", "1 passed, 1 failed.\n"), Verdict(1, 1));
    EXPECT_EQ(strategyFor("zig", "", "1 passed, 1 failed.\n"), "zig_summary");
    EXPECT_EQ(verdictFor("zig", "", "3 passed, 1 skipped, 2 failed.\n"), Verdict(3, 2));
}

TEST(ZigExtractTest, PerTestMarkers) {
    std::string err = "1/2 test.add...OK\n2/2 test.sub...FAIL (TestUnexpectedResult)\n";
    EXPECT_EQ(verdictFor("zig", "", err), Verdict(1, 1));
    EXPECT_EQ(strategyFor("zig", "", err), "zig_test_markers");
}

TEST(ZigExtractTest, OlderMarkerFormat) {
    std::string err = "Test [1/2] test \"add\"... PASS\nTest [2/2] test \"sub\"... FAIL\n";
    EXPECT_EQ(verdictFor("zig", "", err), Verdict(1, 1));
}

// ─── Untrusted Output ─────────────────────────────────────────

TEST(HostileOutputTest, HugeCountsSaturate) {
    EXPECT_EQ(verdictFor("ruby", "99999999999 runs, 1 assertions, 0 failures, 0 errors, 0 skips\n"),
              Verdict(INT_MAX, 0));
    EXPECT_EQ(verdictFor("ruby",
                         "3 runs, 3 assertions, 2000000000 failures, 2000000000 errors, 0 skips\n"),
              Verdict(0, INT_MAX));
    EXPECT_EQ(verdictFor("r", "[ FAIL 99999999999 | WARN 0 | SKIP 0 | PASS 99999999999 ]\n"),
              Verdict(INT_MAX, INT_MAX));
    EXPECT_EQ(verdictFor("julia", "",
                         "Some tests did not pass: 99999999999 passed, 2000000000 failed, "
                         "2000000000 errored, 0 broken.\n"),
              Verdict(INT_MAX, INT_MAX));
    EXPECT_EQ(verdictFor("zig", "", "All 99999999999 tests passed.\n"), Verdict(INT_MAX, 0));
    EXPECT_EQ(verdictFor("zig", "", "99999999999 passed; 0 skipped; 99999999999 failed.\n"),
              Verdict(INT_MAX, INT_MAX));
}

TEST(HostileOutputTest, TableSumsSaturate) {
    std::string table =
        "Test Summary: | Pass  Fail  Total\n"
        "a             | 2000000000 2000000000 4000000000\n";
    EXPECT_EQ(verdictFor("julia", table + table), Verdict(INT_MAX, INT_MAX));

    std::string rows =
        "✔ | F W S  OK | Context\n"
        "✖ | 2000000000 0 0 2000000000 | a\n"
        "✖ | 2000000000 0 0 2000000000 | b\n";
    EXPECT_EQ(verdictFor("r", rows), Verdict(INT_MAX, INT_MAX));
}

TEST(HostileOutputTest, MegabyteLineDoesNotCrash) {
    const std::string digits(1 << 20, '7');
    const std::string prefixes[] = {"", "--- PASS: ", "--- FAIL: ", "1/2 test.a", "Test [1/2] ",
                                    "✔ | ", "[ FAIL ", "Test passed "};
    for (const auto& lang : extractor().languages()) {
        for (const auto& prefix : prefixes) {
            Verdict v;
            EXPECT_NO_THROW(v = verdictFor(lang, prefix + digits, prefix + digits)) << lang;
            EXPECT_TRUE(v.empty()) << lang << " prefix '" << prefix << "'";
        }
    }
}

TEST(HostileOutputTest, VerdictAfterLongLineIsStillFound) {
    const std::string noise(1 << 20, '9');
    EXPECT_EQ(verdictFor("ruby", noise + "\n3 runs, 3 assertions, 1 failures, 0 errors, 0 skips\n"),
              Verdict(2, 1));
    EXPECT_EQ(verdictFor("go", noise + "\n--- PASS: TestA (0.00s)\n--- FAIL: TestB (0.00s)\n"),
              Verdict(1, 1));
    EXPECT_EQ(verdictFor("r", noise + "\n[ FAIL 0 | WARN 0 | SKIP 0 | PASS 4 ]\n"), Verdict(4, 0));
    EXPECT_EQ(verdictFor("julia", "", noise + "\nSome tests did not pass: 1 passed, 1 failed, "
                                               "0 errored, 0 broken.\n"),
              Verdict(1, 1));
    EXPECT_EQ(verdictFor("zig", "", noise + "\nAll 2 tests passed.\n"), Verdict(2, 0));
}

TEST(HostileOutputTest, ManyShortLinesAtOutputCap) {
    std::string out;
    while (out.size() < (1u << 20)) out += "--- PASS: TestX (0.00s)\n";
    Verdict v = verdictFor("go", out, out);
    EXPECT_GT(v.passed, 0);
    EXPECT_EQ(v.failed, 0);
}

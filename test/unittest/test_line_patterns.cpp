#include "parsers/gotest/line_patterns.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using duckdb::go_report::Benchmark;
using duckdb::go_report::ClassifyLine;
using duckdb::go_report::LineKind;
using duckdb::go_report::LineKindToString;
using duckdb::go_report::MatchBenchmarkLine;
using duckdb::go_report::MatchCoverageLine;
using duckdb::go_report::MatchPackageResult;
using duckdb::go_report::MatchStatusLine;
using duckdb::go_report::MatchSummaryLine;
using duckdb::go_report::PackageResultMatch;
using duckdb::go_report::ReduceTestName;
using duckdb::go_report::StatusLineMatch;
using duckdb::go_report::TestResult;
using std::pair;
using std::string;
using std::vector;

TEST(LinePatterns, package_result_with_duration) {
	PackageResultMatch match;
	ASSERT_TRUE(MatchPackageResult("ok  \texample.com/calc\t0.012s", match));
	EXPECT_EQ(match.status, "ok");
	EXPECT_EQ(match.package, "example.com/calc");
	EXPECT_EQ(match.duration, "0.012");
	EXPECT_EQ(match.build_failure, "");
	EXPECT_EQ(match.coverage, "");
}

TEST(LinePatterns, package_result_cached_with_coverage) {
	PackageResultMatch match;
	ASSERT_TRUE(MatchPackageResult("ok  \texample.com/calc\t(cached)\tcoverage: 50.0% of statements", match));
	EXPECT_EQ(match.package, "example.com/calc");
	EXPECT_EQ(match.duration, "");
	EXPECT_EQ(match.coverage, "50.0");

	ASSERT_TRUE(MatchPackageResult("ok pkgA 0.5s coverage: 87.5% of statements in ./...", match));
	EXPECT_EQ(match.duration, "0.5");
	EXPECT_EQ(match.coverage, "87.5");
}

TEST(LinePatterns, package_result_build_failed) {
	PackageResultMatch match;
	ASSERT_TRUE(MatchPackageResult("FAIL\texample.com/broken [build failed]", match));
	EXPECT_EQ(match.status, "FAIL");
	EXPECT_EQ(match.package, "example.com/broken");
	EXPECT_EQ(match.duration, "");
	EXPECT_EQ(match.build_failure, "[build failed]");
}

TEST(LinePatterns, package_result_rejects) {
	vector<string> cases {
		"ok",
		"FAIL",
		"ok pkgA",
		"ok pkgA 1s",
		"okay pkgA 0.1s",
		" ok pkgA 0.1s",
		"ok pkgA 0.1s trailing",
		"--- FAIL: TestFoo (0.01s)",
	};

	PackageResultMatch match;
	for (const auto &line : cases) {
		EXPECT_FALSE(MatchPackageResult(line, match)) << "line: " << line;
	}
}

TEST(LinePatterns, status_line) {
	StatusLineMatch match;
	ASSERT_TRUE(MatchStatusLine("--- PASS: TestFoo (0.01s)", match));
	EXPECT_EQ(match.result, TestResult::PASS);
	EXPECT_EQ(match.name, "TestFoo");
	EXPECT_EQ(match.duration, "0.01");
	EXPECT_EQ(match.indent, "");

	ASSERT_TRUE(MatchStatusLine("    --- SKIP: TestOuter/inner (1.20 seconds)", match));
	EXPECT_EQ(match.result, TestResult::SKIP);
	EXPECT_EQ(match.name, "TestOuter/inner");
	EXPECT_EQ(match.duration, "1.20");
	EXPECT_EQ(match.indent, "    ");

	ASSERT_TRUE(MatchStatusLine("\t--- FAIL: Test with spaces (0.00s)", match));
	EXPECT_EQ(match.result, TestResult::FAIL);
	EXPECT_EQ(match.name, "Test with spaces");
	EXPECT_EQ(match.indent, "\t");

	EXPECT_FALSE(MatchStatusLine("--- PASS: TestFoo (1s)", match));
	EXPECT_FALSE(MatchStatusLine("--- BENCH: BenchmarkFoo (0.01s)", match));
	EXPECT_FALSE(MatchStatusLine("=== RUN   TestFoo", match));
}

TEST(LinePatterns, benchmark_line) {
	Benchmark benchmark;
	ASSERT_TRUE(MatchBenchmarkLine("BenchmarkParse-4 \t  200000\t      7523 ns/op\t    2048 B/op\t      12 allocs/op",
	                               benchmark));
	EXPECT_EQ(benchmark.name, "BenchmarkParse");
	EXPECT_EQ(benchmark.duration.count(), 7523);
	EXPECT_EQ(benchmark.bytes, 2048);
	EXPECT_EQ(benchmark.allocs, 12);

	ASSERT_TRUE(MatchBenchmarkLine("BenchmarkFoo 5000 1234.5 ns/op", benchmark));
	EXPECT_EQ(benchmark.name, "BenchmarkFoo");
	EXPECT_EQ(benchmark.duration.count(), 1234);
	EXPECT_EQ(benchmark.bytes, 0);
	EXPECT_EQ(benchmark.allocs, 0);

	EXPECT_FALSE(MatchBenchmarkLine("BenchmarkFoo", benchmark));
	EXPECT_FALSE(MatchBenchmarkLine("--- BENCH: BenchmarkFoo-8", benchmark));
	EXPECT_FALSE(MatchBenchmarkLine("goos: linux", benchmark));
}

TEST(LinePatterns, coverage_and_summary) {
	std::string coverage;
	ASSERT_TRUE(MatchCoverageLine("coverage: 75.0% of statements", coverage));
	EXPECT_EQ(coverage, "75.0");
	ASSERT_TRUE(MatchCoverageLine("coverage: 12.5% of statements in ./...", coverage));
	EXPECT_EQ(coverage, "12.5");
	EXPECT_FALSE(MatchCoverageLine("coverage: [no statements]", coverage));

	TestResult result = TestResult::PASS;
	ASSERT_TRUE(MatchSummaryLine("FAIL", result));
	EXPECT_EQ(result, TestResult::FAIL);
	ASSERT_TRUE(MatchSummaryLine("SKIP", result));
	EXPECT_EQ(result, TestResult::SKIP);
	EXPECT_FALSE(MatchSummaryLine("PASS ", result));
	EXPECT_FALSE(MatchSummaryLine("ok", result));
}

TEST(LinePatterns, reduce_test_name) {
	// (input, output)
	vector<pair<string, string>> cases {
		{"TestFoo", "TestFoo"},
		{"TestOuter/inner", "inner"},
		{"TestOuter/inner/leaf", "leaf"},
		{"TestOuter/", "TestOuter"},
		{"a/b//", "b"},
		{"", "."},
		{"///", "/"},
	};

	for (const auto &test_case : cases) {
		EXPECT_EQ(ReduceTestName(test_case.first), test_case.second) << "input: " << test_case.first;
	}
}

TEST(LinePatterns, classify_line) {
	// (input, output)
	vector<pair<string, LineKind>> cases {
		{"ok  \tpkgA\t0.010s", LineKind::PACKAGE_RESULT},
		{"FAIL\tpkgA\t[build failed]", LineKind::PACKAGE_RESULT},
		{"--- PASS: TestFoo (0.01s)", LineKind::STATUS},
		{"    --- FAIL: TestFoo/sub (0.00s)", LineKind::STATUS},
		{R"({"Suite":"pkgA","Test":"TestFoo","Msg":"hello\n"})", LineKind::STRUCTURED_OUTPUT},
		{R"({"Action":"run","Package":"pkgA","Test":"TestFoo"})", LineKind::STRUCTURED_OUTPUT},
		{"BenchmarkAdd-8   \t 5000000\t       250 ns/op", LineKind::BENCHMARK},
		{"coverage: 75.0% of statements", LineKind::COVERAGE},
		{"PASS", LineKind::SUMMARY},
		{"FAIL", LineKind::SUMMARY},
		{"=== RUN   TestFoo", LineKind::OTHER},
		{R"({"Test": 5})", LineKind::OTHER},
		{"[1, 2]", LineKind::OTHER},
		{"", LineKind::OTHER},
	};

	for (const auto &test_case : cases) {
		EXPECT_EQ(LineKindToString(ClassifyLine(test_case.first)), LineKindToString(test_case.second))
		    << "input: " << test_case.first;
	}
}

static string CoveredPackageList(size_t count) {
	string list;
	for (size_t i = 0; i < count; i++) {
		if (i > 0) {
			list += ", ";
		}
		list += "example.com/mono/pkg" + std::to_string(i);
	}
	return list;
}

TEST(LinePatterns, long_package_result_line) {
	string line = "ok  \texample.com/mono/svc\t0.412s\tcoverage: 12.5% of statements in " + CoveredPackageList(100);
	ASSERT_GT(line.size(), 2000u);

	PackageResultMatch match;
	ASSERT_TRUE(MatchPackageResult(line, match));
	EXPECT_EQ(match.status, "ok");
	EXPECT_EQ(match.package, "example.com/mono/svc");
	EXPECT_EQ(match.duration, "0.412");
	EXPECT_EQ(match.coverage, "12.5");
	EXPECT_EQ(ClassifyLine(line), LineKind::PACKAGE_RESULT);

	string coverage;
	ASSERT_TRUE(MatchCoverageLine("coverage: 40.0% of statements in " + CoveredPackageList(100), coverage));
	EXPECT_EQ(coverage, "40.0");

	EXPECT_FALSE(MatchPackageResult("ok pkgA 0.1s coverage: 1.0% of statements in", match));
	EXPECT_FALSE(MatchPackageResult("ok pkgA 0.1s coverage: 1.0% of statements inside", match));
}

TEST(LinePatterns, long_status_line) {
	string name = "TestTable/" + string(2100, 'x');
	StatusLineMatch match;
	ASSERT_TRUE(MatchStatusLine("    --- FAIL: " + name + " (0.01s)", match));
	EXPECT_EQ(match.result, TestResult::FAIL);
	EXPECT_EQ(match.name, name);
	EXPECT_EQ(match.duration, "0.01");
	EXPECT_EQ(match.indent, "    ");
	EXPECT_EQ(ClassifyLine("--- PASS: " + name + " (2.5 seconds)"), LineKind::STATUS);
}

TEST(LinePatterns, status_name_extends_to_last_elapsed) {
	struct Case {
		string line;
		string name;
		string duration;
	};
	vector<Case> cases {
		{"--- PASS: TestA (0.1s) (0.2s)", "TestA (0.1s)", "0.2"},
		{"--- PASS: TestA (x) (0.30s) trailing", "TestA (x)", "0.30"},
		{"prefix --- SKIP: TestB (1.0 seconds)", "TestB", "1.0"},
		{"--- BAD: X (1.0s) --- PASS: TestC (0.5s)", "TestC", "0.5"},
	};

	for (const auto &test_case : cases) {
		StatusLineMatch match;
		ASSERT_TRUE(MatchStatusLine(test_case.line, match)) << "input: " << test_case.line;
		EXPECT_EQ(match.name, test_case.name) << "input: " << test_case.line;
		EXPECT_EQ(match.duration, test_case.duration) << "input: " << test_case.line;
	}

	StatusLineMatch match;
	EXPECT_FALSE(MatchStatusLine("--- PASS:  (0.1s)", match));
	EXPECT_FALSE(MatchStatusLine("--- PASS: TestA (.5s)", match));
	EXPECT_FALSE(MatchStatusLine("--- PASS: TestA (0.5ms)", match));
}

TEST(LinePatterns, long_benchmark_name) {
	string name = "BenchmarkDecode/" + string(2100, 'y');
	Benchmark benchmark;
	ASSERT_TRUE(MatchBenchmarkLine(name + "-8   \t  300\t  4100 ns/op\t  64 B/op\t  2 allocs/op", benchmark));
	EXPECT_EQ(benchmark.name, name);
	EXPECT_EQ(benchmark.duration.count(), 4100);
	EXPECT_EQ(benchmark.bytes, 64);
	EXPECT_EQ(benchmark.allocs, 2);

	ASSERT_TRUE(MatchBenchmarkLine("BenchmarkTabbed\t500\t12 ns/op", benchmark));
	EXPECT_EQ(benchmark.name, "BenchmarkTabbed");
	EXPECT_EQ(benchmark.duration.count(), 12);
}

#pragma once

#include "include/go_test_report_types.hpp"
#include <string>

namespace duckdb {
namespace go_report {

/**
 * Line shapes recognized in `go test` output.
 *
 * Example stream:
 * {"Suite":"example.com/calc","Test":"TestAdd","Msg":"=== RUN   TestAdd\n"}
 * --- FAIL: TestAdd (0.00s)
 *     calc_test.go:12: got 3, want 4
 * BenchmarkAdd-8   	1000000000	         0.2900 ns/op	       0 B/op	       0 allocs/op
 * FAIL
 * coverage: 87.5% of statements
 * FAIL	example.com/calc	0.012s
 *
 * All matchers are stateless; the compiled patterns are built once and
 * shared by every caller.
 */

// "ok  pkg 0.010s", "FAIL pkg [build failed]", "ok pkg (cached) coverage: 50.0% of statements"
struct PackageResultMatch {
	std::string status;        // "ok" or "FAIL"
	std::string package;
	std::string duration;      // Seconds literal, empty when cached or build failed
	std::string build_failure; // e.g. "[build failed]", empty otherwise
	std::string coverage;      // Percentage literal, empty when absent
};

// "--- PASS: TestName (0.01s)", "    --- SKIP: TestName/sub (1.20 seconds)"
struct StatusLineMatch {
	TestResult result;
	std::string name;     // As printed, not reduced
	std::string duration; // Seconds literal
	std::string indent;   // Leading whitespace before "---"

	StatusLineMatch() : result(TestResult::PASS) {}
};

// Classification of a single line, independent of parser state
enum class LineKind : uint8_t {
	OTHER = 0,
	PACKAGE_RESULT = 1,
	STATUS = 2,
	STRUCTURED_OUTPUT = 3,
	BENCHMARK = 4,
	COVERAGE = 5,
	SUMMARY = 6
};

bool MatchPackageResult(const std::string &line, PackageResultMatch &match);
bool MatchStatusLine(const std::string &line, StatusLineMatch &match);
bool MatchBenchmarkLine(const std::string &line, Benchmark &benchmark);

// "coverage: 87.5% of statements[ in ./...]", yields "87.5"
bool MatchCoverageLine(const std::string &line, std::string &coverage_pct);

// Bare "PASS" / "FAIL" / "SKIP"
bool MatchSummaryLine(const std::string &line, TestResult &result);

// Last slash-separated element of a test name, "TestA/sub" -> "sub"
std::string ReduceTestName(const std::string &name);

LineKind ClassifyLine(const std::string &line);
std::string LineKindToString(LineKind kind);

} // namespace go_report
} // namespace duckdb

#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace duckdb {
namespace go_report {

// Per-test and per-package timings, integral nanoseconds
using Duration = std::chrono::nanoseconds;

// Test outcome. PASS is the zero value: a test never resolved by a status line reports PASS.
enum class TestResult : uint8_t {
	PASS = 0,
	FAIL = 1,
	SKIP = 2
};

// One test case, possibly a subtest
struct Test {
	std::string name;
	Duration duration;
	TestResult result;
	std::vector<std::string> output;       // Captured before a final status is known
	std::vector<std::string> failure;      // Captured after a FAIL status
	std::vector<std::string> skip_message; // Captured after a SKIP status
	std::string subtest_indent;            // Leading whitespace of the resolving "--- STATUS:" line

	Test() : duration(0), result(TestResult::PASS) {}
	explicit Test(std::string name_p) : name(std::move(name_p)), duration(0), result(TestResult::PASS) {}
};

// One benchmark case, populated from a single line
struct Benchmark {
	std::string name;
	Duration duration; // Per operation
	int64_t bytes;     // B/op, 0 if unreported
	int64_t allocs;    // allocs/op, 0 if unreported

	Benchmark() : duration(0), bytes(0), allocs(0) {}
};

// Results of a single test binary
struct Package {
	std::string name;
	Duration duration;
	std::vector<Test> tests;
	std::vector<Benchmark> benchmarks;
	std::string coverage_pct; // Empty means not reported

	// Deprecated: milliseconds, always duration / 1ms. Use duration instead.
	int64_t time;

	Package() : duration(0), time(0) {}
};

struct Report {
	std::vector<Package> packages;

	// Number of tests with result FAIL across all packages
	idx_t Failures() const;
};

// Helper functions for enum conversions
std::string TestResultToString(TestResult result);
TestResult StringToTestResult(const std::string &str);

// Seconds as a double, for SQL output
double DurationToSeconds(Duration duration);

} // namespace go_report
} // namespace duckdb

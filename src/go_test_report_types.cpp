#include "include/go_test_report_types.hpp"

namespace duckdb {
namespace go_report {

idx_t Report::Failures() const {
	idx_t count = 0;
	for (const auto &package : packages) {
		for (const auto &test : package.tests) {
			if (test.result == TestResult::FAIL) {
				count++;
			}
		}
	}
	return count;
}

std::string TestResultToString(TestResult result) {
	switch (result) {
	case TestResult::PASS:
		return "PASS";
	case TestResult::FAIL:
		return "FAIL";
	case TestResult::SKIP:
		return "SKIP";
	default:
		return "UNKNOWN";
	}
}

TestResult StringToTestResult(const std::string &str) {
	if (str == "FAIL") {
		return TestResult::FAIL;
	}
	if (str == "SKIP") {
		return TestResult::SKIP;
	}
	return TestResult::PASS;
}

double DurationToSeconds(Duration duration) {
	return std::chrono::duration_cast<std::chrono::duration<double>>(duration).count();
}

} // namespace go_report
} // namespace duckdb

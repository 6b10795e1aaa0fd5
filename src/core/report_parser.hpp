#pragma once

#include "include/go_test_report_types.hpp"
#include "core/line_source.hpp"
#include "parsers/gotest/line_patterns.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {
namespace go_report {

struct ReportParserOptions {
	// Copy the coverage of a package-result line (or of a preceding
	// "coverage: N% of statements" line) into the flushed package of the same
	// name. Off by default: flushed packages carry only test-derived data.
	bool apply_result_coverage;

	ReportParserOptions() : apply_result_coverage(false) {
	}
};

/**
 * Line classifier and report builder for `go test` output.
 *
 * Feed lines in order with ProcessLine() and collect the Report with
 * Finish(). Each line is classified by the first matching rule:
 *
 *   1. package-result line  flush every open suite into the report
 *   2. status line          resolve a test created earlier, make it current
 *   3. structured record    append Msg to the output of (Suite, Test)
 *   4. benchmark line       hold until the next flush
 *   5. anything else        failure / skip text of the current test
 *
 * Tests are only emitted when a package-result line closes their suite;
 * whatever is still open at Finish() is dropped. Malformed lines never
 * raise, they just contribute nothing.
 */
class ReportParser {
public:
	explicit ReportParser(ReportParserOptions options = ReportParserOptions());

	void ProcessLine(const std::string &line);

	// Return the accumulated report and reset the parser
	Report Finish();

private:
	// In-progress tests of one package, kept in creation order
	struct SuiteBuffer {
		std::string name;
		std::vector<Test> tests;
		std::unordered_map<std::string, idx_t> test_index;
	};

	// Non-owning reference to the current test, valid across a flush
	struct TestHandle {
		enum class Location : uint8_t { NONE, PENDING, EMITTED };

		Location location;
		idx_t container; // Suite index when PENDING, package index when EMITTED
		idx_t test;

		TestHandle() : location(Location::NONE), container(0), test(0) {}
	};

	void FlushSuites(const PackageResultMatch &match);
	void ResolveStatus(const StatusLineMatch &match);
	void AppendOutput(const std::string &suite_name, const std::string &test_name, const std::string &msg);
	void AppendFreeText(const std::string &line);

	SuiteBuffer &GetOrCreateSuite(const std::string &name);
	Test *CurrentTest();

	ReportParserOptions options_;
	Report report_;
	std::vector<SuiteBuffer> suites_;
	std::unordered_map<std::string, idx_t> suite_index_;
	std::vector<Benchmark> pending_benchmarks_;
	std::string pending_coverage_;
	TestHandle current_;
};

/**
 * Parse a full stream of test output.
 *
 * @param source Line source, read until end of input
 * @param fallback_package_name Package name known out-of-band. Accepted for
 *        callers that have one; tests of a package that never gets a
 *        package-result line are still discarded.
 * @param options Parser options
 * @return The report; throws IOException if the source fails to read
 */
Report ParseReport(LineSource &source, const std::string &fallback_package_name,
                   const ReportParserOptions &options = ReportParserOptions());

Report ParseReportFromString(const std::string &content, const std::string &fallback_package_name = "",
                             const ReportParserOptions &options = ReportParserOptions());

} // namespace go_report
} // namespace duckdb

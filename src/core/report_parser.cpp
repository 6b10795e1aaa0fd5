#include "report_parser.hpp"
#include "duration_parsing.hpp"
#include "parsers/gotest/structured_record.hpp"
#include <iostream>

// Debug tracing for suite flushes - disabled for release
// #define REPORT_TRACE(msg) std::cerr << "[ReportParser] " << msg << std::endl
#define REPORT_TRACE(msg) do {} while(0)

namespace duckdb {
namespace go_report {

ReportParser::ReportParser(ReportParserOptions options) : options_(std::move(options)) {
}

void ReportParser::ProcessLine(const std::string &line) {
	PackageResultMatch result_match;
	if (MatchPackageResult(line, result_match)) {
		FlushSuites(result_match);
		return;
	}

	StatusLineMatch status_match;
	if (MatchStatusLine(line, status_match)) {
		ResolveStatus(status_match);
		return;
	}

	StructuredRecord record;
	if (DecodeStructuredRecord(line, record)) {
		AppendOutput(record.suite, record.test, record.msg);
		return;
	}

	Benchmark benchmark;
	if (MatchBenchmarkLine(line, benchmark)) {
		pending_benchmarks_.push_back(std::move(benchmark));
		return;
	}

	if (options_.apply_result_coverage) {
		std::string coverage_pct;
		if (MatchCoverageLine(line, coverage_pct)) {
			pending_coverage_ = coverage_pct;
			return;
		}
	}

	AppendFreeText(line);
}

void ReportParser::FlushSuites(const PackageResultMatch &match) {
	REPORT_TRACE("Flushing " << suites_.size() << " suite(s) on result line for " << match.package);
	idx_t first_package = report_.packages.size();

	for (auto &suite : suites_) {
		Package package;
		package.name = suite.name;
		for (const auto &test : suite.tests) {
			package.duration += test.duration;
		}
		package.time = std::chrono::duration_cast<std::chrono::milliseconds>(package.duration).count();
		package.tests = std::move(suite.tests);
		report_.packages.push_back(std::move(package));
	}

	// The current test now lives in the report
	if (current_.location == TestHandle::Location::PENDING) {
		current_.location = TestHandle::Location::EMITTED;
		current_.container += first_package;
	}

	Package *target = nullptr;
	for (idx_t i = first_package; i < report_.packages.size(); i++) {
		if (report_.packages[i].name == match.package) {
			target = &report_.packages[i];
			break;
		}
	}

	if (!pending_benchmarks_.empty()) {
		if (!target) {
			Package package;
			package.name = match.package;
			report_.packages.push_back(std::move(package));
			target = &report_.packages.back();
		}
		for (auto &benchmark : pending_benchmarks_) {
			target->benchmarks.push_back(std::move(benchmark));
		}
		pending_benchmarks_.clear();
	}

	if (options_.apply_result_coverage) {
		const std::string &coverage = match.coverage.empty() ? pending_coverage_ : match.coverage;
		if (target && !coverage.empty()) {
			target->coverage_pct = coverage;
		}
		pending_coverage_.clear();
	}

	suites_.clear();
	suite_index_.clear();
}

void ReportParser::ResolveStatus(const StatusLineMatch &match) {
	std::string name = ReduceTestName(match.name);

	for (idx_t suite_idx = 0; suite_idx < suites_.size(); suite_idx++) {
		auto &suite = suites_[suite_idx];
		auto entry = suite.test_index.find(name);
		if (entry == suite.test_index.end()) {
			continue;
		}

		auto &test = suite.tests[entry->second];
		test.result = match.result;
		test.duration = ParseSeconds(match.duration);
		test.subtest_indent = match.indent;

		current_.location = TestHandle::Location::PENDING;
		current_.container = suite_idx;
		current_.test = entry->second;
		return;
	}

	// Status for a test we never saw output for
	current_ = TestHandle();
}

void ReportParser::AppendOutput(const std::string &suite_name, const std::string &test_name, const std::string &msg) {
	auto &suite = GetOrCreateSuite(suite_name);
	auto entry = suite.test_index.find(test_name);
	if (entry == suite.test_index.end()) {
		suite.test_index[test_name] = suite.tests.size();
		suite.tests.emplace_back(test_name);
		suite.tests.back().output.push_back(msg);
		return;
	}
	suite.tests[entry->second].output.push_back(msg);
}

void ReportParser::AppendFreeText(const std::string &line) {
	auto test = CurrentTest();
	if (!test) {
		return;
	}
	if (test->result == TestResult::FAIL) {
		test->failure.push_back(line);
	} else if (test->result == TestResult::SKIP) {
		test->skip_message.push_back(line);
	}
}

ReportParser::SuiteBuffer &ReportParser::GetOrCreateSuite(const std::string &name) {
	auto entry = suite_index_.find(name);
	if (entry != suite_index_.end()) {
		return suites_[entry->second];
	}
	suite_index_[name] = suites_.size();
	suites_.emplace_back();
	suites_.back().name = name;
	return suites_.back();
}

Test *ReportParser::CurrentTest() {
	switch (current_.location) {
	case TestHandle::Location::PENDING:
		return &suites_[current_.container].tests[current_.test];
	case TestHandle::Location::EMITTED:
		return &report_.packages[current_.container].tests[current_.test];
	default:
		return nullptr;
	}
}

Report ReportParser::Finish() {
	if (!suites_.empty()) {
		REPORT_TRACE("Discarding " << suites_.size() << " suite(s) without a package-result line");
	}
	Report result = std::move(report_);

	report_ = Report();
	suites_.clear();
	suite_index_.clear();
	pending_benchmarks_.clear();
	pending_coverage_.clear();
	current_ = TestHandle();
	return result;
}

Report ParseReport(LineSource &source, const std::string &fallback_package_name, const ReportParserOptions &options) {
	// fallback_package_name is not consulted: unclosed suites are dropped either way
	ReportParser parser(options);
	std::string line;
	while (source.NextLine(line)) {
		parser.ProcessLine(line);
	}
	return parser.Finish();
}

Report ParseReportFromString(const std::string &content, const std::string &fallback_package_name,
                             const ReportParserOptions &options) {
	StringLineSource source(content);
	return ParseReport(source, fallback_package_name, options);
}

} // namespace go_report
} // namespace duckdb

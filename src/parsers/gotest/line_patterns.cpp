#include "line_patterns.hpp"
#include "structured_record.hpp"
#include "parsers/base/safe_parsing.hpp"
#include "core/duration_parsing.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>

namespace duckdb {
namespace go_report {

namespace {

// The free-form tails of a line (a -coverpkg package list, a subtest name) are
// located with string searches; only the bounded head of a line reaches a regex.
struct GoTestPatterns {
	std::regex package_result;
	std::regex coverage;
	std::regex benchmark_columns;
	std::regex summary;

	GoTestPatterns()
	    : package_result(R"(^(ok|FAIL)\s+([^ ]+)\s+(?:(\d+\.\d+)s|\(cached\)|(\[\w+ failed\]))(?:\s+coverage:\s+(\d+\.\d+)%\sof\sstatements)?$)"),
	      coverage(R"(^coverage:\s+(\d+\.\d+)%\s+of\s+statements$)"),
	      // after the name: optional -N core suffix, iterations, ns/op (integer or decimal), optional B/op, optional allocs/op
	      benchmark_columns(R"(^(?:-\d+\s+|\s+)(\d+)\s+(\d+|\d+\.\d+)\sns/op(?:\s+(\d+)\sB/op)?(?:\s+(\d+)\sallocs/op)?)"),
	      summary(R"(^(PASS|FAIL|SKIP)$)") {
	}
};

const GoTestPatterns &GetPatterns() {
	static const GoTestPatterns patterns;
	return patterns;
}

bool IsSpace(char c) {
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
	return c >= '0' && c <= '9';
}

bool HasAt(const std::string &line, size_t pos, const char *text) {
	return pos <= line.size() && line.compare(pos, std::strlen(text), text) == 0;
}

// " in <packages>" following "of statements", up to the end of the line
bool IsCoveredPackageList(const std::string &line, size_t pos) {
	if (line.size() < pos + 5) {
		return false;
	}
	if (!IsSpace(line[pos]) || !HasAt(line, pos + 1, "in") || !IsSpace(line[pos + 3])) {
		return false;
	}
	return line.find_first_of("\r\n", pos + 4) == std::string::npos;
}

/**
 * Match a pattern ending in "of statements$" against the line, or against the
 * line cut right after "statements" when a covered package list follows.
 * subject holds the text the match refers to.
 */
bool SearchCoverageHead(const std::string &line, const std::regex &pattern, std::string &subject, std::smatch &m) {
	subject = line;
	if (SafeParsing::SafeRegexSearch(subject, m, pattern)) {
		return true;
	}
	static const std::string marker = "statements";
	for (auto pos = line.find(marker); pos != std::string::npos; pos = line.find(marker, pos + 1)) {
		auto end = pos + marker.size();
		if (!IsCoveredPackageList(line, end)) {
			continue;
		}
		subject = line.substr(0, end);
		if (SafeParsing::SafeRegexSearch(subject, m, pattern)) {
			return true;
		}
	}
	return false;
}

// "(0.01s)" or "(1.20 seconds)" starting at pos; duration receives "0.01"
bool MatchElapsed(const std::string &line, size_t pos, std::string &duration) {
	if (pos >= line.size() || line[pos] != '(') {
		return false;
	}
	size_t i = pos + 1;
	size_t digits_begin = i;
	while (i < line.size() && IsDigit(line[i])) {
		i++;
	}
	if (i == digits_begin || i >= line.size() || line[i] != '.') {
		return false;
	}
	i++;
	size_t fraction_begin = i;
	while (i < line.size() && IsDigit(line[i])) {
		i++;
	}
	if (i == fraction_begin) {
		return false;
	}
	if (!HasAt(line, i, "s)") && !HasAt(line, i, " seconds)")) {
		return false;
	}
	duration = line.substr(digits_begin, i - digits_begin);
	return true;
}

// Leading spaces and tabs of a line starting "<indent>---", empty otherwise
std::string StatusIndent(const std::string &line) {
	auto first = line.find_first_not_of(" \t");
	if (first == std::string::npos || first == 0 || !HasAt(line, first, "---")) {
		return std::string();
	}
	return line.substr(0, first);
}

// Digits-only counter from a benchmark column; 0 when absent or out of range
int64_t ParseCount(const std::string &value) {
	if (value.empty()) {
		return 0;
	}
	errno = 0;
	char *end = nullptr;
	long long parsed = std::strtoll(value.c_str(), &end, 10);
	if (errno == ERANGE || end == value.c_str() || *end != '\0') {
		return 0;
	}
	return static_cast<int64_t>(parsed);
}

} // namespace

bool MatchPackageResult(const std::string &line, PackageResultMatch &match) {
	if (!HasAt(line, 0, "ok") && !HasAt(line, 0, "FAIL")) {
		return false;
	}
	std::string subject;
	std::smatch m;
	if (!SearchCoverageHead(line, GetPatterns().package_result, subject, m)) {
		return false;
	}
	match.status = m[1].str();
	match.package = m[2].str();
	match.duration = m[3].str();
	match.build_failure = m[4].str();
	match.coverage = m[5].str();
	return true;
}

bool MatchStatusLine(const std::string &line, StatusLineMatch &match) {
	static const std::string marker = "--- ";
	for (auto start = line.find(marker); start != std::string::npos; start = line.find(marker, start + 1)) {
		auto keyword = start + marker.size();
		TestResult result;
		if (HasAt(line, keyword, "PASS: ")) {
			result = TestResult::PASS;
		} else if (HasAt(line, keyword, "FAIL: ")) {
			result = TestResult::FAIL;
		} else if (HasAt(line, keyword, "SKIP: ")) {
			result = TestResult::SKIP;
		} else {
			continue;
		}

		// The name runs to the last " (<elapsed>)" on the line and never spans a line break
		auto name_begin = keyword + 6;
		auto limit = line.find_first_of("\r\n", name_begin);
		if (limit == std::string::npos) {
			limit = line.size();
		}
		auto search_end = limit;
		while (search_end > name_begin + 1) {
			auto paren = line.rfind(" (", search_end - 1);
			if (paren == std::string::npos || paren <= name_begin) {
				break;
			}
			std::string duration;
			if (paren + 1 < limit && MatchElapsed(line, paren + 1, duration)) {
				match.result = result;
				match.name = line.substr(name_begin, paren - name_begin);
				match.duration = duration;
				match.indent = StatusIndent(line);
				return true;
			}
			search_end = paren;
		}
	}
	return false;
}

bool MatchBenchmarkLine(const std::string &line, Benchmark &benchmark) {
	static const size_t prefix_length = std::strlen("Benchmark");
	if (!HasAt(line, 0, "Benchmark") || line.size() <= prefix_length) {
		return false;
	}

	// The name stops at the first space or '-'; earlier tabs are tried as the end too, longest name first
	auto name_limit = line.find_first_of(" -", prefix_length);
	if (name_limit == std::string::npos) {
		name_limit = line.size();
	}
	for (auto name_end = name_limit; name_end > prefix_length; name_end--) {
		if (name_end < line.size() && line[name_end] != '-' && !IsSpace(line[name_end])) {
			continue;
		}
		auto columns = line.substr(name_end, SafeParsing::MAX_REGEX_LINE_LENGTH);
		std::smatch m;
		if (!SafeParsing::SafeRegexSearch(columns, m, GetPatterns().benchmark_columns)) {
			continue;
		}
		benchmark.name = line.substr(0, name_end);
		benchmark.duration = ParseNanoseconds(m[2].str());
		benchmark.bytes = ParseCount(m[3].str());
		benchmark.allocs = ParseCount(m[4].str());
		return true;
	}
	return false;
}

bool MatchCoverageLine(const std::string &line, std::string &coverage_pct) {
	if (!HasAt(line, 0, "coverage:")) {
		return false;
	}
	std::string subject;
	std::smatch m;
	if (!SearchCoverageHead(line, GetPatterns().coverage, subject, m)) {
		return false;
	}
	coverage_pct = m[1].str();
	return true;
}

bool MatchSummaryLine(const std::string &line, TestResult &result) {
	std::smatch m;
	if (!SafeParsing::SafeRegexSearch(line, m, GetPatterns().summary)) {
		return false;
	}
	result = StringToTestResult(m[1].str());
	return true;
}

std::string ReduceTestName(const std::string &name) {
	if (name.empty()) {
		return ".";
	}
	auto last = name.find_last_not_of('/');
	if (last == std::string::npos) {
		return "/";
	}
	auto trimmed = name.substr(0, last + 1);
	auto slash = trimmed.rfind('/');
	if (slash == std::string::npos) {
		return trimmed;
	}
	return trimmed.substr(slash + 1);
}

LineKind ClassifyLine(const std::string &line) {
	PackageResultMatch result_match;
	if (MatchPackageResult(line, result_match)) {
		return LineKind::PACKAGE_RESULT;
	}
	StatusLineMatch status_match;
	if (MatchStatusLine(line, status_match)) {
		return LineKind::STATUS;
	}
	StructuredRecord record;
	if (DecodeStructuredRecord(line, record)) {
		return LineKind::STRUCTURED_OUTPUT;
	}
	Benchmark benchmark;
	if (MatchBenchmarkLine(line, benchmark)) {
		return LineKind::BENCHMARK;
	}
	std::string coverage_pct;
	if (MatchCoverageLine(line, coverage_pct)) {
		return LineKind::COVERAGE;
	}
	TestResult summary;
	if (MatchSummaryLine(line, summary)) {
		return LineKind::SUMMARY;
	}
	return LineKind::OTHER;
}

std::string LineKindToString(LineKind kind) {
	switch (kind) {
	case LineKind::PACKAGE_RESULT:
		return "package_result";
	case LineKind::STATUS:
		return "status";
	case LineKind::STRUCTURED_OUTPUT:
		return "structured_output";
	case LineKind::BENCHMARK:
		return "benchmark";
	case LineKind::COVERAGE:
		return "coverage";
	case LineKind::SUMMARY:
		return "summary";
	default:
		return "other";
	}
}

} // namespace go_report
} // namespace duckdb

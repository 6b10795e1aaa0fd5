#include "include/go_test_scalar_functions.hpp"
#include "core/report_parser.hpp"
#include "parsers/gotest/line_patterns.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"

namespace duckdb {

// Parses the whole string as test output and counts FAIL tests in closed packages
static void GoTestFailuresFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &content_vector = args.data[0];
	auto count = args.size();

	UnaryExecutor::Execute<string_t, int64_t>(content_vector, result, count, [&](string_t content) {
		auto report = go_report::ParseReportFromString(content.GetString());
		return static_cast<int64_t>(report.Failures());
	});
}

// Shape of a single line, without any parser state
static void GoTestLineKindFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &line_vector = args.data[0];
	auto count = args.size();

	UnaryExecutor::Execute<string_t, string_t>(line_vector, result, count, [&](string_t line) {
		auto kind = go_report::ClassifyLine(line.GetString());
		return StringVector::AddString(result, go_report::LineKindToString(kind));
	});
}

ScalarFunction GetGoTestFailuresFunction() {
	return ScalarFunction("go_test_failures", {LogicalType::VARCHAR}, LogicalType::BIGINT, GoTestFailuresFunction);
}

ScalarFunction GetGoTestLineKindFunction() {
	return ScalarFunction("go_test_line_kind", {LogicalType::VARCHAR}, LogicalType::VARCHAR, GoTestLineKindFunction);
}

} // namespace duckdb

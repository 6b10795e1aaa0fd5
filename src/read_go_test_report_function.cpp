#include "include/read_go_test_report_function.hpp"
#include "core/line_source.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/parser/parsed_data/create_table_function_info.hpp"

namespace duckdb {

using go_report::Benchmark;
using go_report::Package;
using go_report::Report;
using go_report::Test;

go_report::Report ParseBoundSource(ClientContext &context, const GoTestReportBindData &bind_data) {
	if (bind_data.source_kind == GoTestSourceKind::CONTENT) {
		return go_report::ParseReportFromString(bind_data.source, bind_data.package_name, bind_data.options);
	}
	go_report::FileLineSource source(context, bind_data.source);
	return go_report::ParseReport(source, bind_data.package_name, bind_data.options);
}

static unique_ptr<GoTestReportBindData> BindSource(TableFunctionBindInput &input, const std::string &function_name,
                                                   GoTestSourceKind source_kind) {
	auto bind_data = make_uniq<GoTestReportBindData>();
	bind_data->source_kind = source_kind;

	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException(function_name + " requires a non-NULL " +
		                      (source_kind == GoTestSourceKind::PATH ? "file path" : "content") + " argument");
	}
	bind_data->source = input.inputs[0].ToString();

	// Handle package_name named parameter
	auto package_name_param = input.named_parameters.find("package_name");
	if (package_name_param != input.named_parameters.end() && !package_name_param->second.IsNull()) {
		bind_data->package_name = package_name_param->second.ToString();
	}

	// Handle apply_result_coverage named parameter
	auto coverage_param = input.named_parameters.find("apply_result_coverage");
	if (coverage_param != input.named_parameters.end() && !coverage_param->second.IsNull()) {
		bind_data->options.apply_result_coverage = coverage_param->second.GetValue<bool>();
	}

	return bind_data;
}

// ============================================================================
// Test rows
// ============================================================================

static void DefineTestSchema(vector<LogicalType> &return_types, vector<string> &names) {
	return_types = {
	    LogicalType::VARCHAR,                     // package
	    LogicalType::DOUBLE,                      // package_duration (seconds)
	    LogicalType::BIGINT,                      // package_time_ms (deprecated)
	    LogicalType::VARCHAR,                     // coverage_pct
	    LogicalType::VARCHAR,                     // test_name
	    LogicalType::VARCHAR,                     // status
	    LogicalType::DOUBLE,                      // duration (seconds)
	    LogicalType::LIST(LogicalType::VARCHAR), // output
	    LogicalType::LIST(LogicalType::VARCHAR), // failure
	    LogicalType::LIST(LogicalType::VARCHAR), // skip_message
	    LogicalType::VARCHAR                      // subtest_indent
	};

	names = {"package", "package_duration", "package_time_ms", "coverage_pct", "test_name", "status",
	         "duration", "output", "failure", "skip_message", "subtest_indent"};
}

static unique_ptr<FunctionData> ReadGoTestReportBind(ClientContext &context, TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindSource(input, "read_go_test_report", GoTestSourceKind::PATH);
	DefineTestSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<FunctionData> ParseGoTestReportBind(ClientContext &context, TableFunctionBindInput &input,
                                                      vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindSource(input, "parse_go_test_report", GoTestSourceKind::CONTENT);
	DefineTestSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> GoTestReportInitGlobal(ClientContext &context,
                                                                    TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<GoTestReportBindData>();
	auto global_state = make_uniq<GoTestReportGlobalState>();
	global_state->report = ParseBoundSource(context, bind_data);
	return std::move(global_state);
}

static Value LinesToList(const std::vector<std::string> &lines) {
	vector<Value> values;
	values.reserve(lines.size());
	for (const auto &line : lines) {
		values.emplace_back(line);
	}
	return Value::LIST(LogicalType::VARCHAR, std::move(values));
}

static void GoTestReportFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<GoTestReportGlobalState>();
	auto &packages = state.report.packages;

	idx_t count = 0;
	while (state.package_offset < packages.size() && count < STANDARD_VECTOR_SIZE) {
		const Package &package = packages[state.package_offset];
		if (state.item_offset >= package.tests.size()) {
			state.package_offset++;
			state.item_offset = 0;
			continue;
		}
		const Test &test = package.tests[state.item_offset];

		output.SetValue(0, count, Value(package.name));
		output.SetValue(1, count, Value::DOUBLE(go_report::DurationToSeconds(package.duration)));
		output.SetValue(2, count, Value::BIGINT(package.time));
		output.SetValue(3, count, package.coverage_pct.empty() ? Value() : Value(package.coverage_pct));
		output.SetValue(4, count, Value(test.name));
		output.SetValue(5, count, Value(go_report::TestResultToString(test.result)));
		output.SetValue(6, count, Value::DOUBLE(go_report::DurationToSeconds(test.duration)));
		output.SetValue(7, count, LinesToList(test.output));
		output.SetValue(8, count, LinesToList(test.failure));
		output.SetValue(9, count, LinesToList(test.skip_message));
		output.SetValue(10, count, Value(test.subtest_indent));

		state.item_offset++;
		count++;
	}

	output.SetCardinality(count);
}

// ============================================================================
// Benchmark rows
// ============================================================================

static void DefineBenchmarkSchema(vector<LogicalType> &return_types, vector<string> &names) {
	return_types = {
	    LogicalType::VARCHAR, // package
	    LogicalType::VARCHAR, // benchmark_name
	    LogicalType::DOUBLE,  // ns_per_op
	    LogicalType::BIGINT,  // bytes_per_op
	    LogicalType::BIGINT   // allocs_per_op
	};

	names = {"package", "benchmark_name", "ns_per_op", "bytes_per_op", "allocs_per_op"};
}

static unique_ptr<FunctionData> ReadGoBenchmarksBind(ClientContext &context, TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindSource(input, "read_go_benchmarks", GoTestSourceKind::PATH);
	DefineBenchmarkSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<FunctionData> ParseGoBenchmarksBind(ClientContext &context, TableFunctionBindInput &input,
                                                      vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = BindSource(input, "parse_go_benchmarks", GoTestSourceKind::CONTENT);
	DefineBenchmarkSchema(return_types, names);
	return std::move(bind_data);
}

static void GoBenchmarksFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<GoTestReportGlobalState>();
	auto &packages = state.report.packages;

	idx_t count = 0;
	while (state.package_offset < packages.size() && count < STANDARD_VECTOR_SIZE) {
		const Package &package = packages[state.package_offset];
		if (state.item_offset >= package.benchmarks.size()) {
			state.package_offset++;
			state.item_offset = 0;
			continue;
		}
		const Benchmark &benchmark = package.benchmarks[state.item_offset];

		output.SetValue(0, count, Value(package.name));
		output.SetValue(1, count, Value(benchmark.name));
		output.SetValue(2, count, Value::DOUBLE(static_cast<double>(benchmark.duration.count())));
		output.SetValue(3, count, Value::BIGINT(benchmark.bytes));
		output.SetValue(4, count, Value::BIGINT(benchmark.allocs));

		state.item_offset++;
		count++;
	}

	output.SetCardinality(count);
}

// ============================================================================
// Registration
// ============================================================================

static TableFunction MakeGoTestFunction(const std::string &name, table_function_t function, table_function_bind_t bind) {
	TableFunction result(name, {LogicalType::VARCHAR}, function, bind, GoTestReportInitGlobal);
	result.named_parameters["package_name"] = LogicalType::VARCHAR;
	result.named_parameters["apply_result_coverage"] = LogicalType::BOOLEAN;
	return result;
}

TableFunction GetReadGoTestReportFunction() {
	return MakeGoTestFunction("read_go_test_report", GoTestReportFunction, ReadGoTestReportBind);
}

TableFunction GetParseGoTestReportFunction() {
	return MakeGoTestFunction("parse_go_test_report", GoTestReportFunction, ParseGoTestReportBind);
}

TableFunction GetReadGoBenchmarksFunction() {
	return MakeGoTestFunction("read_go_benchmarks", GoBenchmarksFunction, ReadGoBenchmarksBind);
}

TableFunction GetParseGoBenchmarksFunction() {
	return MakeGoTestFunction("parse_go_benchmarks", GoBenchmarksFunction, ParseGoBenchmarksBind);
}

} // namespace duckdb

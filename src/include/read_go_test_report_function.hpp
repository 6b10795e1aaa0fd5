#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "go_test_report_types.hpp"
#include "core/report_parser.hpp"

namespace duckdb {

// Where the bound source string comes from
enum class GoTestSourceKind : uint8_t {
    PATH = 0,    // read_go_* : source is a file path
    CONTENT = 1  // parse_go_* : source is the test output itself
};

// Bind data shared by the report and benchmark table functions
struct GoTestReportBindData : public TableFunctionData {
    std::string source;
    GoTestSourceKind source_kind;
    std::string package_name;  // Fallback package name (package_name := ...)
    go_report::ReportParserOptions options;

    GoTestReportBindData() : source_kind(GoTestSourceKind::PATH) {}
};

// Global state: the parsed report plus a cursor over its rows
struct GoTestReportGlobalState : public GlobalTableFunctionState {
    go_report::Report report;
    idx_t package_offset;
    idx_t item_offset;  // Test or benchmark index within the current package

    GoTestReportGlobalState() : package_offset(0), item_offset(0) {}
};

// Parse the bound source into a report (file read through DuckDB's FileSystem)
go_report::Report ParseBoundSource(ClientContext &context, const GoTestReportBindData &bind_data);

// One row per test: read_go_test_report(path), parse_go_test_report(content)
TableFunction GetReadGoTestReportFunction();
TableFunction GetParseGoTestReportFunction();

// One row per benchmark: read_go_benchmarks(path), parse_go_benchmarks(content)
TableFunction GetReadGoBenchmarksFunction();
TableFunction GetParseGoBenchmarksFunction();

} // namespace duckdb

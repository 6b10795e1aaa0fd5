#define DUCKDB_EXTENSION_MAIN

#include "include/go_report_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "include/read_go_test_report_function.hpp"
#include "include/go_test_scalar_functions.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	// Table functions: one row per test / per benchmark
	loader.RegisterFunction(GetReadGoTestReportFunction());
	loader.RegisterFunction(GetParseGoTestReportFunction());
	loader.RegisterFunction(GetReadGoBenchmarksFunction());
	loader.RegisterFunction(GetParseGoBenchmarksFunction());

	// Scalar helpers
	loader.RegisterFunction(GetGoTestFailuresFunction());
	loader.RegisterFunction(GetGoTestLineKindFunction());
}

void GoReportExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string GoReportExtension::Name() {
	return "go_report";
}

std::string GoReportExtension::Version() const {
#ifdef EXT_VERSION_GO_REPORT
	return EXT_VERSION_GO_REPORT;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(go_report, loader) {
	duckdb::LoadInternal(loader);
}

DUCKDB_EXTENSION_API const char *go_report_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif

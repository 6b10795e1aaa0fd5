#pragma once

#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"

namespace duckdb {

// go_test_failures(content VARCHAR) -> BIGINT
ScalarFunction GetGoTestFailuresFunction();

// go_test_line_kind(line VARCHAR) -> VARCHAR
ScalarFunction GetGoTestLineKindFunction();

} // namespace duckdb

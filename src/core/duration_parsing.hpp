#pragma once

#include "include/go_test_report_types.hpp"
#include <string>

namespace duckdb {
namespace go_report {

/**
 * Duration helpers for numeric literals found in test output.
 *
 * Both accept a plain decimal literal ("0.010", "12", "-1.5", ".5") and
 * compute the result in integer nanoseconds, truncating anything below 1ns.
 * An empty string, trailing garbage or an out-of-range value yields a zero
 * duration. They never throw, so they cannot be used to validate input.
 */

// "0.010" -> 10ms
Duration ParseSeconds(const std::string &value);

// "1234.5" -> 1234ns
Duration ParseNanoseconds(const std::string &value);

} // namespace go_report
} // namespace duckdb

#pragma once

#include <string>

namespace duckdb {
namespace go_report {

// One line of captured output tagged with its package and test
struct StructuredRecord {
	std::string suite;
	std::string test;
	std::string msg;
};

/**
 * Decode a whole line as {"Suite": ..., "Test": ..., "Msg": ...}.
 *
 * Member names match case-insensitively, with a later duplicate overriding
 * an earlier one. Missing or null members decode as empty strings and
 * unrelated members are ignored. Returns false when the line is not a JSON
 * object or one of the three members holds a non-string value.
 */
bool DecodeStructuredRecord(const std::string &line, StructuredRecord &record);

} // namespace go_report
} // namespace duckdb

#pragma once

#include <string>
#include <regex>

namespace duckdb {

/**
 * Regex guards for test-runner output.
 *
 * Test output carries arbitrary program output: captured payloads, dumped
 * structs, minified JSON. std::regex backtracks recursively, so a pattern
 * such as `(.+) \(` run over a multi-megabyte line can exhaust the stack.
 * Matchers cut a line down to its fixed-shape head before calling these;
 * the length limit only stops input that has no such head.
 */
namespace SafeParsing {

// Maximum subject length handed to a regex
constexpr size_t MAX_REGEX_LINE_LENGTH = 2000;

/**
 * Safe wrapper for std::regex_search that skips long lines.
 *
 * @param line The line to search
 * @param match Output match results
 * @param pattern The regex pattern
 * @param max_length Maximum line length to attempt searching (default: MAX_REGEX_LINE_LENGTH)
 * @return true if found, false if line too long or not found
 */
inline bool SafeRegexSearch(const std::string &line, std::smatch &match, const std::regex &pattern,
                            size_t max_length = MAX_REGEX_LINE_LENGTH) {
	if (line.length() > max_length) {
		return false;
	}
	return std::regex_search(line, match, pattern);
}

} // namespace SafeParsing
} // namespace duckdb

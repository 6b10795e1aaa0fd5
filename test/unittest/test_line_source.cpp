#include "core/line_source.hpp"
#include "duckdb/common/exception.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using duckdb::go_report::LineSource;
using duckdb::go_report::StreamLineSource;
using duckdb::go_report::StringLineSource;
using std::string;
using std::vector;

static vector<string> ReadAll(LineSource &source) {
	vector<string> lines;
	string line;
	while (source.NextLine(line)) {
		lines.push_back(line);
	}
	return lines;
}

TEST(LineSource, string_splits_on_newline) {
	StringLineSource source("first\nsecond\n\nfourth");
	EXPECT_EQ(ReadAll(source), (vector<string> {"first", "second", "", "fourth"}));
}

TEST(LineSource, string_strips_carriage_return) {
	StringLineSource source("ok  \tpkgA\t0.01s\r\n--- PASS: TestFoo (0.00s)\r\n");
	EXPECT_EQ(ReadAll(source), (vector<string> {"ok  \tpkgA\t0.01s", "--- PASS: TestFoo (0.00s)"}));
}

TEST(LineSource, string_empty_input) {
	StringLineSource empty("");
	EXPECT_TRUE(ReadAll(empty).empty());

	StringLineSource single_newline("\n");
	EXPECT_EQ(ReadAll(single_newline), (vector<string> {""}));
}

TEST(LineSource, stream_reads_until_eof) {
	std::istringstream input("PASS\r\nok pkgA 0.1s");
	StreamLineSource source(input);
	EXPECT_EQ(ReadAll(source), (vector<string> {"PASS", "ok pkgA 0.1s"}));
}

TEST(LineSource, stream_error_raises) {
	std::istringstream input("PASS\n");
	StreamLineSource source(input);
	string line;
	ASSERT_TRUE(source.NextLine(line));
	input.setstate(std::ios::badbit);
	EXPECT_THROW(source.NextLine(line), duckdb::IOException);
}

TEST(LineSource, stream_unopened_file_raises) {
	std::ifstream missing("/nonexistent/go_report/test_output.txt");
	StreamLineSource source(missing);
	string line;
	EXPECT_THROW(source.NextLine(line), duckdb::IOException);
}

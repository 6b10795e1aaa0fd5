#include "parsers/gotest/structured_record.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using duckdb::go_report::DecodeStructuredRecord;
using duckdb::go_report::StructuredRecord;
using std::string;
using std::vector;

TEST(StructuredRecord, decodes_all_members) {
	StructuredRecord record;
	ASSERT_TRUE(DecodeStructuredRecord(R"({"Suite":"example.com/calc","Test":"TestAdd","Msg":"=== RUN   TestAdd\n"})",
	                                   record));
	EXPECT_EQ(record.suite, "example.com/calc");
	EXPECT_EQ(record.test, "TestAdd");
	EXPECT_EQ(record.msg, "=== RUN   TestAdd\n");
}

TEST(StructuredRecord, member_names_ignore_case) {
	StructuredRecord record;
	ASSERT_TRUE(DecodeStructuredRecord(R"({"suite":"pkgA","TEST":"TestFoo","mSg":"hi"})", record));
	EXPECT_EQ(record.suite, "pkgA");
	EXPECT_EQ(record.test, "TestFoo");
	EXPECT_EQ(record.msg, "hi");
}

TEST(StructuredRecord, later_duplicate_wins) {
	StructuredRecord record;
	ASSERT_TRUE(DecodeStructuredRecord(R"({"Test":"first","test":"second"})", record));
	EXPECT_EQ(record.test, "second");
}

TEST(StructuredRecord, missing_and_null_members_are_empty) {
	StructuredRecord record;
	ASSERT_TRUE(DecodeStructuredRecord(R"({"Test":"TestFoo","Msg":null,"Elapsed":0.5})", record));
	EXPECT_EQ(record.suite, "");
	EXPECT_EQ(record.test, "TestFoo");
	EXPECT_EQ(record.msg, "");

	ASSERT_TRUE(DecodeStructuredRecord("  {}  ", record));
	EXPECT_EQ(record.suite, "");
	EXPECT_EQ(record.test, "");
	EXPECT_EQ(record.msg, "");
}

TEST(StructuredRecord, rejects) {
	vector<string> cases {
		"",
		"=== RUN   TestFoo",
		"null",
		"[]",
		"\"text\"",
		"{",
		R"({"Test":"TestFoo"} trailing)",
		R"({"Test":5})",
		R"({"Suite":["pkgA"]})",
		R"({"Msg":true})",
	};

	for (const auto &line : cases) {
		StructuredRecord record;
		record.test = "untouched";
		EXPECT_FALSE(DecodeStructuredRecord(line, record)) << "line: " << line;
		EXPECT_EQ(record.test, "untouched") << "line: " << line;
	}
}

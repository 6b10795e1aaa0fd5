#include "structured_record.hpp"
#include "duckdb/common/string_util.hpp"
#include "yyjson.hpp"

namespace duckdb {
namespace go_report {

using namespace duckdb_yyjson;

enum class RecordField : uint8_t { NONE, SUITE, TEST, MSG };

static RecordField LookupField(yyjson_val *key) {
	std::string name(yyjson_get_str(key), yyjson_get_len(key));
	if (StringUtil::CIEquals(name, "Suite")) {
		return RecordField::SUITE;
	}
	if (StringUtil::CIEquals(name, "Test")) {
		return RecordField::TEST;
	}
	if (StringUtil::CIEquals(name, "Msg")) {
		return RecordField::MSG;
	}
	return RecordField::NONE;
}

// Copies a string member into target. Null leaves target untouched, any other type fails.
static bool AssignStringMember(yyjson_val *val, std::string &target) {
	if (yyjson_is_null(val)) {
		return true;
	}
	if (!yyjson_is_str(val)) {
		return false;
	}
	target.assign(yyjson_get_str(val), yyjson_get_len(val));
	return true;
}

bool DecodeStructuredRecord(const std::string &line, StructuredRecord &record) {
	// Cheap reject: test output is mostly plain text. Only objects are records, so a bare "null" is free text
	auto first = line.find_first_not_of(" \t\r\n");
	if (first == std::string::npos || line[first] != '{') {
		return false;
	}

	yyjson_doc *doc = yyjson_read(line.c_str(), line.length(), YYJSON_READ_ALLOW_INVALID_UNICODE);
	if (!doc) {
		return false;
	}

	yyjson_val *root = yyjson_doc_get_root(doc);
	if (!yyjson_is_obj(root)) {
		yyjson_doc_free(doc);
		return false;
	}

	StructuredRecord decoded;
	bool valid = true;
	size_t idx, max;
	yyjson_val *key, *val;
	yyjson_obj_foreach(root, idx, max, key, val) {
		switch (LookupField(key)) {
		case RecordField::SUITE:
			valid = AssignStringMember(val, decoded.suite);
			break;
		case RecordField::TEST:
			valid = AssignStringMember(val, decoded.test);
			break;
		case RecordField::MSG:
			valid = AssignStringMember(val, decoded.msg);
			break;
		default:
			break;
		}
		if (!valid) {
			break;
		}
	}

	yyjson_doc_free(doc);
	if (!valid) {
		return false;
	}
	record = std::move(decoded);
	return true;
}

} // namespace go_report
} // namespace duckdb

#include "duration_parsing.hpp"
#include <cstdint>
#include <limits>

namespace duckdb {
namespace go_report {

static constexpr int64_t NANOS_PER_SECOND = 1000000000;

// Parses [+-]digits[.digits] scaled by unit_nanos. Returns false on any malformed input or overflow.
static bool TryParseDecimalDuration(const std::string &value, int64_t unit_nanos, int64_t &result) {
	size_t pos = 0;
	bool negative = false;
	if (pos < value.size() && (value[pos] == '+' || value[pos] == '-')) {
		negative = value[pos] == '-';
		pos++;
	}

	const int64_t max_value = std::numeric_limits<int64_t>::max();
	int64_t whole = 0;
	bool has_digits = false;
	while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
		int64_t digit = value[pos] - '0';
		if (whole > (max_value - digit) / 10) {
			return false;
		}
		whole = whole * 10 + digit;
		has_digits = true;
		pos++;
	}

	int64_t fraction_nanos = 0;
	if (pos < value.size() && value[pos] == '.') {
		pos++;
		int64_t place = unit_nanos;
		while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
			place /= 10;
			fraction_nanos += (value[pos] - '0') * place;
			has_digits = true;
			pos++;
		}
	}

	if (!has_digits || pos != value.size()) {
		return false;
	}
	if (whole > (max_value - fraction_nanos) / unit_nanos) {
		return false;
	}

	result = whole * unit_nanos + fraction_nanos;
	if (negative) {
		result = -result;
	}
	return true;
}

Duration ParseSeconds(const std::string &value) {
	if (value.empty()) {
		return Duration(0);
	}
	int64_t nanos = 0;
	if (!TryParseDecimalDuration(value, NANOS_PER_SECOND, nanos)) {
		return Duration(0);
	}
	return Duration(nanos);
}

Duration ParseNanoseconds(const std::string &value) {
	if (value.empty()) {
		return Duration(0);
	}
	int64_t nanos = 0;
	if (!TryParseDecimalDuration(value, 1, nanos)) {
		return Duration(0);
	}
	return Duration(nanos);
}

} // namespace go_report
} // namespace duckdb

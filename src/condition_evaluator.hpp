#pragma once

#include "flag_model.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace flageval {

// Microsecond resolution covers every four-digit year without overflow
using date_point = std::chrono::sys_time<std::chrono::microseconds>;

// Evaluate one property condition against a subject's attributes.
//
// Returns inconclusive when the attribute is missing (except for is_set /
// is_not_set), when the operator is unknown, or when a date operand cannot
// be parsed. A malformed regex is a non-match for `regex` and a match for
// `not_regex`. Ordering operators compare numerically when both sides parse
// as numbers and fall back to byte-wise string comparison otherwise.
outcome<bool> match_condition(const property_condition& condition,
                              const attribute_map& attributes);

// Same as above with an explicit "now" for relative date operands.
outcome<bool> match_condition(const property_condition& condition,
                              const attribute_map& attributes,
                              std::chrono::system_clock::time_point now);

// String form used by the substring, regex and fallback ordering operators.
// Strings are taken verbatim, everything else is serialized as JSON.
std::string value_to_string(const nlohmann::json& value);

// Parse an ISO date, an RFC 3339 date-time or a relative date ("-7d", "-24h",
// "-2w", "-3m", "-1y") into a point in time. Returns nullopt for anything else,
// including relative spans too large to represent.
std::optional<date_point> parse_date_value(const nlohmann::json& value, date_point now);

} // namespace flageval

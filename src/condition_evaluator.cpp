#include "condition_evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <regex>
#include <string_view>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace flageval {

namespace {

using sys_clock = std::chrono::system_clock;

// Relative date spans beyond this are rejected; date_point holds roughly twice as much
constexpr int64_t k_max_span_hours =
    std::chrono::duration_cast<std::chrono::hours>(date_point::duration::max()).count() / 2;

// Full Unicode lowercasing of UTF-8 text, locale independent
std::string unicode_lower(const std::string& s) {
    auto u = icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
    u.toLower(icu::Locale::getRoot());
    std::string out;
    u.toUTF8String(out);
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Strings compare case-insensitively, everything else by JSON equality
bool values_equal(const nlohmann::json& expected, const nlohmann::json& actual) {
    if (expected.is_string() && actual.is_string()) {
        return iequals(expected.get_ref<const std::string&>(),
                       actual.get_ref<const std::string&>());
    }
    return expected == actual;
}

bool matches_any(const nlohmann::json& expected, const nlohmann::json& actual) {
    if (expected.is_array()) {
        return std::any_of(expected.begin(), expected.end(),
                           [&](const nlohmann::json& e) { return values_equal(e, actual); });
    }
    return values_equal(expected, actual);
}

std::optional<double> parse_number(std::string_view s) {
    // from_chars does not take an explicit plus sign
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || s.front() == '-') return std::nullopt;
    }
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return out;
}

std::optional<double> as_number(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parse_number(v.get_ref<const std::string&>());
    return std::nullopt;
}

bool compare_ordered(condition_operator op, const nlohmann::json& expected,
                     const nlohmann::json& actual) {
    auto lhs = as_number(actual);
    auto rhs = as_number(expected);
    if (lhs && rhs) {
        switch (op) {
            case condition_operator::gt:  return *lhs > *rhs;
            case condition_operator::gte: return *lhs >= *rhs;
            case condition_operator::lt:  return *lhs < *rhs;
            case condition_operator::lte: return *lhs <= *rhs;
            default: return false;
        }
    }

    // Not both numeric: the server compares the string forms, so do we
    auto a = value_to_string(actual);
    auto e = value_to_string(expected);
    switch (op) {
        case condition_operator::gt:  return a > e;
        case condition_operator::gte: return a >= e;
        case condition_operator::lt:  return a < e;
        case condition_operator::lte: return a <= e;
        default: return false;
    }
}

// Returns nullopt if the pattern does not compile
std::optional<bool> search_pattern(const std::string& pattern, const std::string& text) {
    try {
        std::regex re(pattern, std::regex::ECMAScript);
        return std::regex_search(text, re);
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

template <typename Int>
bool parse_int(std::string_view s, Int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

std::optional<date_point> parse_relative_date(std::string_view s, date_point now) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);

    // "-" + digits + unit
    if (s.size() < 3 || s.front() != '-') return std::nullopt;

    int64_t n = 0;
    if (!parse_int(s.substr(1, s.size() - 2), n)) return std::nullopt;

    int64_t unit_hours = 0;
    switch (s.back()) {
        case 'h': unit_hours = 1; break;
        case 'd': unit_hours = 24; break;
        case 'w': unit_hours = 24 * 7; break;
        case 'm': unit_hours = 24 * 30; break;
        case 'y': unit_hours = 24 * 365; break;
        default: return std::nullopt;
    }
    if (n > k_max_span_hours / unit_hours || n < -k_max_span_hours / unit_hours) {
        return std::nullopt;
    }
    return now - std::chrono::hours(n * unit_hours);
}

std::optional<std::chrono::sys_days> parse_ymd(std::string_view s) {
    // YYYY-MM-DD
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    int y = 0;
    unsigned m = 0, d = 0;
    if (!parse_int(s.substr(0, 4), y) || !parse_int(s.substr(5, 2), m) ||
        !parse_int(s.substr(8, 2), d)) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                    std::chrono::day{d}};
    if (!ymd.ok()) return std::nullopt;
    return std::chrono::sys_days{ymd};
}

std::optional<date_point> parse_rfc3339(std::string_view s) {
    // YYYY-MM-DDTHH:MM:SS[.fff...](Z|+hh:mm|-hh:mm)
    if (s.size() < 20) return std::nullopt;
    auto date = parse_ymd(s.substr(0, 10));
    if (!date) return std::nullopt;

    char sep = s[10];
    if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
    if (s[13] != ':' || s[16] != ':') return std::nullopt;

    int hh = 0, mm = 0, ss = 0;
    if (!parse_int(s.substr(11, 2), hh) || !parse_int(s.substr(14, 2), mm) ||
        !parse_int(s.substr(17, 2), ss)) {
        return std::nullopt;
    }
    if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;

    std::size_t pos = 19;
    std::chrono::microseconds frac{0};
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        std::size_t start = pos;
        int64_t micros = 0;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
        frac = std::chrono::microseconds(micros);
    }

    if (pos >= s.size()) return std::nullopt;
    std::chrono::minutes offset{0};
    auto zone = s.substr(pos);
    if (zone == "Z" || zone == "z") {
        // UTC
    } else if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
        int oh = 0, om = 0;
        if (!parse_int(zone.substr(1, 2), oh) || !parse_int(zone.substr(4, 2), om)) {
            return std::nullopt;
        }
        offset = std::chrono::hours(oh) + std::chrono::minutes(om);
        if (zone[0] == '-') offset = -offset;
    } else {
        return std::nullopt;
    }

    auto local = date_point(*date) + std::chrono::hours(hh) +
                 std::chrono::minutes(mm) + std::chrono::seconds(ss) + frac;
    return local - offset;
}

outcome<bool> match_date(const property_condition& condition, const nlohmann::json& actual,
                         date_point now) {
    auto target = parse_date_value(condition.value, now);
    if (!target) {
        return inconclusive{"unable to parse target date value " + condition.value.dump()};
    }
    auto value = parse_date_value(actual, now);
    if (!value) {
        return inconclusive{"unable to parse date value of property '" + condition.key + "': " +
                            actual.dump()};
    }
    if (condition.op == condition_operator::is_date_before) return *value < *target;
    return *value > *target;
}

} // anonymous namespace

std::string value_to_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::optional<date_point> parse_date_value(const nlohmann::json& value, date_point now) {
    if (!value.is_string()) return std::nullopt;
    std::string_view s = value.get_ref<const std::string&>();

    // Only the relative form tolerates surrounding whitespace
    if (s.size() > 1 && s.front() == '-') {
        if (auto rel = parse_relative_date(s, now)) return rel;
    }
    if (auto dt = parse_rfc3339(s)) return dt;
    if (auto d = parse_ymd(s)) return date_point(*d);
    return std::nullopt;
}

outcome<bool> match_condition(const property_condition& condition,
                              const attribute_map& attributes) {
    return match_condition(condition, attributes, sys_clock::now());
}

outcome<bool> match_condition(const property_condition& condition,
                              const attribute_map& attributes,
                              sys_clock::time_point now) {
    auto it = attributes.find(condition.key);
    if (it == attributes.end()) {
        if (condition.op == condition_operator::is_not_set) return true;
        if (condition.op == condition_operator::is_set) return false;
        return inconclusive{"property '" + condition.key + "' not found in provided properties"};
    }
    const auto& actual = it->second;

    switch (condition.op) {
        case condition_operator::exact:
            return matches_any(condition.value, actual);
        case condition_operator::is_not:
            return !matches_any(condition.value, actual);
        case condition_operator::is_set:
            return true;
        case condition_operator::is_not_set:
            return false;
        case condition_operator::icontains:
        case condition_operator::not_icontains: {
            bool found = unicode_lower(value_to_string(actual))
                             .find(unicode_lower(value_to_string(condition.value))) != std::string::npos;
            return condition.op == condition_operator::icontains ? found : !found;
        }
        case condition_operator::regex:
        case condition_operator::not_regex: {
            auto matched = search_pattern(value_to_string(condition.value), value_to_string(actual));
            // An invalid pattern matches nothing
            if (condition.op == condition_operator::regex) return matched.value_or(false);
            return !matched.value_or(false);
        }
        case condition_operator::gt:
        case condition_operator::gte:
        case condition_operator::lt:
        case condition_operator::lte:
            return compare_ordered(condition.op, condition.value, actual);
        case condition_operator::is_date_before:
        case condition_operator::is_date_after:
            return match_date(condition, actual,
                              std::chrono::time_point_cast<date_point::duration>(now));
        case condition_operator::unknown:
            break;
    }
    return inconclusive{"unknown operator: " + condition.op_name};
}

} // namespace flageval

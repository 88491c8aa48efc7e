#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace flageval {

enum class condition_operator {
    exact,
    is_not,
    is_set,
    is_not_set,
    icontains,
    not_icontains,
    regex,
    not_regex,
    gt,
    gte,
    lt,
    lte,
    is_date_before,
    is_date_after,
    unknown
};

struct property_condition {
    std::string key;
    condition_operator op = condition_operator::exact;
    nlohmann::json value;
    // Raw operator name as received, kept for diagnostics on unknown operators
    std::string op_name = "exact";
    // Condition type, e.g. "person" or "cohort"
    std::optional<std::string> type;
};

struct rule_group {
    std::vector<property_condition> properties;
    std::optional<double> rollout_percentage;
    std::optional<std::string> variant;
};

struct multivariate_variant {
    std::string key;
    double rollout_percentage = 0.0;
};

struct multivariate_spec {
    std::vector<multivariate_variant> variants;

    bool has_variant(const std::string& key) const;
};

struct feature_flag {
    std::string key;
    bool active = false;
    std::vector<rule_group> groups;
    std::optional<multivariate_spec> multivariate;
    // variant key (or "true") -> arbitrary JSON payload
    std::unordered_map<std::string, nlohmann::json> payloads;
};

// Complete set of definitions published by the remote service.
// Immutable once handed to the flag_cache.
struct definitions_snapshot {
    std::unordered_map<std::string, feature_flag> flags;
    std::unordered_map<std::string, std::string> group_type_mapping;
    std::unordered_map<std::string, nlohmann::json> cohorts;
};

using attribute_map = std::unordered_map<std::string, nlohmann::json>;

// Result of a flag evaluation: either enabled/disabled or a variant key.
class flag_value {
public:
    enum class kind { boolean, variant };

    static flag_value boolean(bool enabled) { return flag_value(enabled); }
    static flag_value variant(std::string key) { return flag_value(std::move(key)); }

    kind type() const { return m_kind; }
    bool is_boolean() const { return m_kind == kind::boolean; }
    bool is_variant() const { return m_kind == kind::variant; }

    // A variant always counts as enabled
    bool enabled() const { return m_kind == kind::variant || m_enabled; }
    const std::string& variant_key() const { return m_variant; }

    nlohmann::json to_json() const;

    bool operator==(const flag_value& other) const = default;

    friend std::ostream& operator<<(std::ostream& os, const flag_value& v);

private:
    explicit flag_value(bool enabled) : m_kind(kind::boolean), m_enabled(enabled) {}
    explicit flag_value(std::string key) : m_kind(kind::variant), m_variant(std::move(key)) {}

    kind m_kind;
    bool m_enabled = false;
    std::string m_variant;
};

// The evaluation could not be decided from locally available data.
struct inconclusive {
    std::string reason;
};

template <typename T>
using outcome = std::variant<T, inconclusive>;

template <typename T>
bool is_inconclusive(const outcome<T>& o) {
    return std::holds_alternative<inconclusive>(o);
}

class definitions_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parse an operator name. Unrecognized names map to condition_operator::unknown.
condition_operator parse_operator(const std::string& s);

const char* operator_name(condition_operator op);

// Decode a single flag definition. Throws definitions_error on structural problems.
feature_flag parse_flag(const nlohmann::json& j);

// Decode the local evaluation document ({flags, group_type_mapping, cohorts}).
// Throws definitions_error on structural problems.
definitions_snapshot parse_definitions(const nlohmann::json& doc);

definitions_snapshot parse_definitions(const std::string& text);

} // namespace flageval

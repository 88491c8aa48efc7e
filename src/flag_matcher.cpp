#include "flag_matcher.hpp"
#include "condition_evaluator.hpp"
#include "hash_bucketing.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace flageval {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

// Compare the value of a dependency flag against the expected JSON value
bool dependency_value_matches(const flag_value& value, const nlohmann::json& expected) {
    if (value.is_boolean()) {
        if (expected.is_boolean()) return value.enabled() == expected.get<bool>();
        if (expected.is_string()) {
            const auto& s = expected.get_ref<const std::string&>();
            return s.empty() || s == (value.enabled() ? "true" : "false");
        }
        return false;
    }

    if (expected.is_string()) return iequals(value.variant_key(), expected.get<std::string>());
    if (expected.is_boolean()) return expected.get<bool>() && !value.variant_key().empty();
    return false;
}

outcome<bool> match_flag_dependency(const property_condition& condition,
                                    std::string_view subject_id,
                                    const definitions_snapshot& definitions) {
    auto dep_key = condition.key.substr(flag_dependency_prefix.size());
    auto it = definitions.flags.find(dep_key);
    if (it == definitions.flags.end()) {
        return inconclusive{"flag '" + dep_key + "' not found in local cache"};
    }

    // Dependencies are evaluated without attributes, and without further dependency resolution
    auto result = match_flag(it->second, subject_id, attribute_map{});
    if (auto* inc = std::get_if<inconclusive>(&result)) {
        return inconclusive{"dependency '" + dep_key + "': " + inc->reason};
    }

    bool matches = dependency_value_matches(std::get<flag_value>(result), condition.value);
    switch (condition.op) {
        case condition_operator::exact:  return matches;
        case condition_operator::is_not: return !matches;
        default:
            return inconclusive{"unknown flag dependency operator: " + condition.op_name};
    }
}

outcome<bool> match_one(const property_condition& condition,
                        std::string_view subject_id,
                        const attribute_map& attributes,
                        const definitions_snapshot* definitions) {
    if (condition.type && *condition.type == "cohort") {
        return inconclusive{"cohort condition '" + condition.key + "' cannot be evaluated locally"};
    }
    if (definitions && condition.key.starts_with(flag_dependency_prefix)) {
        return match_flag_dependency(condition, subject_id, *definitions);
    }
    return match_condition(condition, attributes);
}

// All conditions must hold, then the subject must fall inside the rollout
outcome<bool> match_group(const feature_flag& flag,
                          const rule_group& group,
                          std::string_view subject_id,
                          const attribute_map& attributes,
                          const definitions_snapshot* definitions) {
    for (const auto& condition : group.properties) {
        auto r = match_one(condition, subject_id, attributes, definitions);
        if (is_inconclusive(r)) return r;
        if (!std::get<bool>(r)) return false;
    }

    if (group.rollout_percentage) {
        double hash = bucket(flag.key, subject_id, rollout_salt);
        if (hash > *group.rollout_percentage / 100.0) return false;
    }
    return true;
}

outcome<flag_value> evaluate(const feature_flag& flag,
                             std::string_view subject_id,
                             const attribute_map& attributes,
                             const definitions_snapshot* definitions) {
    if (!flag.active) return flag_value::boolean(false);

    // Overrides first, otherwise declaration order
    std::vector<const rule_group*> ordered;
    ordered.reserve(flag.groups.size());
    for (const auto& g : flag.groups) ordered.push_back(&g);
    std::stable_partition(ordered.begin(), ordered.end(),
                          [](const rule_group* g) { return g->variant.has_value(); });

    std::optional<inconclusive> undecided;
    for (const auto* group : ordered) {
        auto r = match_group(flag, *group, subject_id, attributes, definitions);
        if (auto* inc = std::get_if<inconclusive>(&r)) {
            if (!undecided) undecided = std::move(*inc);
            continue;
        }
        if (!std::get<bool>(r)) continue;

        // An override naming an unknown variant falls through to normal assignment
        if (group->variant && flag.multivariate &&
            flag.multivariate->has_variant(*group->variant)) {
            return flag_value::variant(*group->variant);
        }
        if (auto variant = matching_variant(flag, subject_id)) {
            return flag_value::variant(std::move(*variant));
        }
        return flag_value::boolean(true);
    }

    if (undecided) {
        return inconclusive{"can't determine if feature flag '" + flag.key +
                            "' is enabled with given properties: " + undecided->reason};
    }
    return flag_value::boolean(false);
}

} // anonymous namespace

std::optional<std::string> matching_variant(const feature_flag& flag,
                                            std::string_view subject_id) {
    if (!flag.multivariate) return std::nullopt;

    double hash = bucket(flag.key, subject_id, variant_salt);
    double low = 0.0;
    for (const auto& v : flag.multivariate->variants) {
        double high = low + v.rollout_percentage / 100.0;
        if (hash >= low && hash < high) return v.key;
        low = high;
    }
    return std::nullopt;
}

outcome<flag_value> match_flag(const feature_flag& flag,
                               std::string_view subject_id,
                               const attribute_map& attributes) {
    return evaluate(flag, subject_id, attributes, nullptr);
}

outcome<flag_value> match_flag(const feature_flag& flag,
                               std::string_view subject_id,
                               const attribute_map& attributes,
                               const definitions_snapshot& definitions) {
    return evaluate(flag, subject_id, attributes, &definitions);
}

} // namespace flageval

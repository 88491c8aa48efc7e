#include "flag_model.hpp"
#include <algorithm>

namespace flageval {

namespace {

struct operator_entry {
    const char* name;
    condition_operator op;
};

constexpr operator_entry k_operators[] = {
    {"exact",          condition_operator::exact},
    {"is_not",         condition_operator::is_not},
    {"is_set",         condition_operator::is_set},
    {"is_not_set",     condition_operator::is_not_set},
    {"icontains",      condition_operator::icontains},
    {"not_icontains",  condition_operator::not_icontains},
    {"regex",          condition_operator::regex},
    {"not_regex",      condition_operator::not_regex},
    {"gt",             condition_operator::gt},
    {"gte",            condition_operator::gte},
    {"lt",             condition_operator::lt},
    {"lte",            condition_operator::lte},
    {"is_date_before", condition_operator::is_date_before},
    {"is_date_after",  condition_operator::is_date_after},
};

std::optional<double> optional_number(const nlohmann::json& obj, const char* field,
                                      const std::string& flag_key) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) {
        throw definitions_error("flag '" + flag_key + "': '" + field + "' must be a number");
    }
    return it->get<double>();
}

std::optional<std::string> optional_string(const nlohmann::json& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

property_condition parse_condition(const nlohmann::json& j, const std::string& flag_key) {
    if (!j.is_object()) {
        throw definitions_error("flag '" + flag_key + "': property must be an object");
    }
    auto key = j.find("key");
    if (key == j.end() || !key->is_string()) {
        throw definitions_error("flag '" + flag_key + "': property without 'key'");
    }

    property_condition cond;
    cond.key = key->get<std::string>();
    if (auto v = j.find("value"); v != j.end()) cond.value = *v;
    if (auto op = optional_string(j, "operator")) cond.op_name = *op;
    cond.op = parse_operator(cond.op_name);
    cond.type = optional_string(j, "type");
    return cond;
}

rule_group parse_group(const nlohmann::json& j, const std::string& flag_key) {
    if (!j.is_object()) {
        throw definitions_error("flag '" + flag_key + "': condition group must be an object");
    }

    rule_group group;
    if (auto props = j.find("properties"); props != j.end() && !props->is_null()) {
        if (!props->is_array()) {
            throw definitions_error("flag '" + flag_key + "': 'properties' must be a list");
        }
        for (const auto& p : *props) {
            group.properties.push_back(parse_condition(p, flag_key));
        }
    }
    group.rollout_percentage = optional_number(j, "rollout_percentage", flag_key);
    group.variant = optional_string(j, "variant");
    return group;
}

std::optional<multivariate_spec> parse_multivariate(const nlohmann::json& filters,
                                                    const std::string& flag_key) {
    auto mv = filters.find("multivariate");
    if (mv == filters.end() || mv->is_null()) return std::nullopt;

    auto variants = mv->find("variants");
    if (variants == mv->end() || !variants->is_array()) {
        throw definitions_error("flag '" + flag_key + "': multivariate without 'variants'");
    }

    multivariate_spec spec;
    for (const auto& v : *variants) {
        multivariate_variant var;
        var.key = v.at("key").get<std::string>();
        var.rollout_percentage = v.at("rollout_percentage").get<double>();
        spec.variants.push_back(std::move(var));
    }
    return spec;
}

} // anonymous namespace

bool multivariate_spec::has_variant(const std::string& key) const {
    return std::any_of(variants.begin(), variants.end(),
                       [&](const multivariate_variant& v) { return v.key == key; });
}

nlohmann::json flag_value::to_json() const {
    if (m_kind == kind::variant) return m_variant;
    return m_enabled;
}

std::ostream& operator<<(std::ostream& os, const flag_value& v) {
    return os << v.to_json().dump();
}

condition_operator parse_operator(const std::string& s) {
    for (const auto& e : k_operators) {
        if (s == e.name) return e.op;
    }
    return condition_operator::unknown;
}

const char* operator_name(condition_operator op) {
    for (const auto& e : k_operators) {
        if (e.op == op) return e.name;
    }
    return "unknown";
}

feature_flag parse_flag(const nlohmann::json& j) {
    if (!j.is_object()) throw definitions_error("flag definition must be an object");

    auto key = j.find("key");
    if (key == j.end() || !key->is_string()) {
        throw definitions_error("flag definition without 'key'");
    }

    feature_flag flag;
    flag.key = key->get<std::string>();

    auto active = j.find("active");
    if (active == j.end() || !active->is_boolean()) {
        throw definitions_error("flag '" + flag.key + "': 'active' must be a boolean");
    }
    flag.active = active->get<bool>();

    auto filters = j.find("filters");
    if (filters == j.end() || filters->is_null()) return flag;
    if (!filters->is_object()) {
        throw definitions_error("flag '" + flag.key + "': 'filters' must be an object");
    }

    try {
        if (auto groups = filters->find("groups"); groups != filters->end() && !groups->is_null()) {
            if (!groups->is_array()) {
                throw definitions_error("flag '" + flag.key + "': 'groups' must be a list");
            }
            for (const auto& g : *groups) {
                flag.groups.push_back(parse_group(g, flag.key));
            }
        }

        flag.multivariate = parse_multivariate(*filters, flag.key);

        if (auto payloads = filters->find("payloads"); payloads != filters->end() && payloads->is_object()) {
            for (const auto& [k, v] : payloads->items()) {
                flag.payloads[k] = v;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw definitions_error("flag '" + flag.key + "': " + e.what());
    }

    return flag;
}

definitions_snapshot parse_definitions(const nlohmann::json& doc) {
    if (!doc.is_object()) throw definitions_error("definitions document must be an object");

    auto flags = doc.find("flags");
    if (flags == doc.end() || !flags->is_array()) {
        throw definitions_error("definitions document without 'flags' list");
    }

    definitions_snapshot snap;
    for (const auto& f : *flags) {
        auto flag = parse_flag(f);
        auto key = flag.key;
        snap.flags.insert_or_assign(std::move(key), std::move(flag));
    }

    if (auto m = doc.find("group_type_mapping"); m != doc.end() && m->is_object()) {
        for (const auto& [k, v] : m->items()) {
            snap.group_type_mapping[k] = v.is_string() ? v.get<std::string>() : v.dump();
        }
    }

    if (auto c = doc.find("cohorts"); c != doc.end() && c->is_object()) {
        for (const auto& [k, v] : c->items()) {
            snap.cohorts[k] = v;
        }
    }

    return snap;
}

definitions_snapshot parse_definitions(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw definitions_error(std::string("invalid definitions JSON: ") + e.what());
    }
    return parse_definitions(doc);
}

} // namespace flageval

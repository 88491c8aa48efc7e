#include "local_evaluator.hpp"
#include "flag_matcher.hpp"

namespace flageval {

local_evaluator::local_evaluator(const flag_cache& cache, std::shared_ptr<spdlog::logger> log)
    : m_cache(cache), m_log(std::move(log))
{}

outcome<std::optional<flag_value>> local_evaluator::evaluate_one(
    const std::string& key,
    std::string_view subject_id,
    const attribute_map& attributes) const
{
    auto snap = m_cache.snapshot();
    const auto& defs = snap->definitions;

    auto it = defs.flags.find(key);
    if (it == defs.flags.end()) {
        if (m_log) m_log->trace("Flag '{}' not found in local cache", key);
        return std::optional<flag_value>{};
    }

    auto result = match_flag(it->second, subject_id, attributes, defs);
    if (auto* inc = std::get_if<inconclusive>(&result)) {
        if (m_log) m_log->debug("Inconclusive local evaluation of '{}': {}", key, inc->reason);
        return std::move(*inc);
    }
    return std::optional<flag_value>(std::move(std::get<flag_value>(result)));
}

std::unordered_map<std::string, outcome<flag_value>> local_evaluator::evaluate_all(
    std::string_view subject_id,
    const attribute_map& attributes) const
{
    auto snap = m_cache.snapshot();
    const auto& defs = snap->definitions;

    std::unordered_map<std::string, outcome<flag_value>> results;
    results.reserve(defs.flags.size());
    for (const auto& [key, flag] : defs.flags) {
        results.emplace(key, match_flag(flag, subject_id, attributes, defs));
    }

    if (m_log) m_log->debug("Evaluated {} local flags for '{}'", results.size(), subject_id);
    return results;
}

std::optional<nlohmann::json> local_evaluator::payload(const std::string& key,
                                                       const flag_value& value) const {
    if (!value.enabled()) return std::nullopt;

    auto snap = m_cache.snapshot();
    auto it = snap->definitions.flags.find(key);
    if (it == snap->definitions.flags.end()) return std::nullopt;

    const auto& payloads = it->second.payloads;
    auto p = payloads.find(value.is_variant() ? value.variant_key() : std::string("true"));
    if (p == payloads.end()) return std::nullopt;
    return p->second;
}

} // namespace flageval

#include "flag_cache.hpp"

namespace flageval {

flag_cache::flag_cache(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{
    // Publish an initial empty snapshot
    std::atomic_store(&m_snapshot,
                      std::shared_ptr<const cache_snapshot>(std::make_shared<cache_snapshot>()));
}

void flag_cache::publish(definitions_snapshot definitions) {
    auto snap = std::make_shared<cache_snapshot>();
    snap->version = std::atomic_load(&m_snapshot)->version + 1;
    snap->definitions = std::move(definitions);

    std::atomic_store(&m_snapshot,
                      std::shared_ptr<const cache_snapshot>(std::move(snap)));
}

void flag_cache::replace(definitions_snapshot definitions) {
    std::size_t flag_count = definitions.flags.size();
    std::size_t cohort_count = definitions.cohorts.size();

    std::lock_guard<std::mutex> lock(m_write_mutex);
    publish(std::move(definitions));

    if (m_log) {
        m_log->debug("flag_cache: published version {} ({} flags, {} cohorts)",
                     version(), flag_count, cohort_count);
    }
}

void flag_cache::clear() {
    std::lock_guard<std::mutex> lock(m_write_mutex);
    publish(definitions_snapshot{});
    if (m_log) m_log->debug("flag_cache: cleared (version {})", version());
}

std::optional<feature_flag> flag_cache::get(const std::string& key) const {
    auto snap = snapshot();
    auto it = snap->definitions.flags.find(key);
    if (it != snap->definitions.flags.end()) return it->second;
    return std::nullopt;
}

std::vector<feature_flag> flag_cache::get_all() const {
    auto snap = snapshot();
    std::vector<feature_flag> out;
    out.reserve(snap->definitions.flags.size());
    for (const auto& [key, flag] : snap->definitions.flags) {
        out.push_back(flag);
    }
    return out;
}

std::unordered_map<std::string, std::string> flag_cache::group_type_mapping() const {
    return snapshot()->definitions.group_type_mapping;
}

std::optional<nlohmann::json> flag_cache::cohort(const std::string& id) const {
    auto snap = snapshot();
    auto it = snap->definitions.cohorts.find(id);
    if (it != snap->definitions.cohorts.end()) return it->second;
    return std::nullopt;
}

std::unordered_map<std::string, nlohmann::json> flag_cache::cohorts() const {
    return snapshot()->definitions.cohorts;
}

std::shared_ptr<const cache_snapshot> flag_cache::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

std::size_t flag_cache::size() const {
    return snapshot()->definitions.flags.size();
}

uint64_t flag_cache::version() const {
    return snapshot()->version;
}

} // namespace flageval

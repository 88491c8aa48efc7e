#pragma once

#include "cache_snapshot.hpp"
#include "flag_model.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flageval {

// In-memory store of flag definitions, group type mapping and cohorts.
// Uses RCU-style snapshot swapping: readers get a lock-free shared_ptr<const cache_snapshot>,
// writers serialize via mutex and atomically publish whole new snapshots.
// Readers therefore observe either the old or the new definitions, never a mix.
class flag_cache {
public:
    explicit flag_cache(std::shared_ptr<spdlog::logger> log = nullptr);

    // Discard the current contents and publish `definitions` in their place.
    void replace(definitions_snapshot definitions);

    // Publish an empty snapshot.
    void clear();

    std::optional<feature_flag> get(const std::string& key) const;

    // Copy of all flags; safe to iterate without holding anything.
    std::vector<feature_flag> get_all() const;

    std::unordered_map<std::string, std::string> group_type_mapping() const;

    // Cohort data is opaque and returned as received.
    std::optional<nlohmann::json> cohort(const std::string& id) const;
    std::unordered_map<std::string, nlohmann::json> cohorts() const;

    // Current immutable snapshot, for consistent multi-flag reads.
    std::shared_ptr<const cache_snapshot> snapshot() const;

    std::size_t size() const;
    uint64_t version() const;

private:
    void publish(definitions_snapshot definitions);

    std::shared_ptr<spdlog::logger> m_log;

    // Serializes writers (replace/clear). Never held while fetching.
    std::mutex m_write_mutex;

    // Current snapshot: atomic load/store for lock-free reader access.
    std::shared_ptr<const cache_snapshot> m_snapshot;
};

} // namespace flageval

#pragma once

#include "flag_cache.hpp"
#include "flag_model.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace flageval {

// Answers flag questions from the cache alone, without network access.
// Each call works on one consistent cache snapshot.
class local_evaluator {
public:
    explicit local_evaluator(const flag_cache& cache,
                             std::shared_ptr<spdlog::logger> log = nullptr);

    // nullopt when the flag is not in the cache, which is distinct from false.
    outcome<std::optional<flag_value>> evaluate_one(const std::string& key,
                                                    std::string_view subject_id,
                                                    const attribute_map& attributes) const;

    // Every cached flag, each evaluated independently.
    std::unordered_map<std::string, outcome<flag_value>> evaluate_all(
        std::string_view subject_id,
        const attribute_map& attributes) const;

    // Payload attached to the variant key, or to "true" for an enabled boolean flag.
    std::optional<nlohmann::json> payload(const std::string& key, const flag_value& value) const;

private:
    const flag_cache& m_cache;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace flageval

#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <stdexcept>

namespace flageval {

namespace {

local_evaluation_config from_yaml(const YAML::Node& root) {
    local_evaluation_config cfg;

    // Remote service
    if (auto n = root["api_host"])         cfg.api_host = n.as<std::string>();
    if (auto n = root["project_api_key"])  cfg.project_api_key = n.as<std::string>();
    if (auto n = root["personal_api_key"]) cfg.personal_api_key = n.as<std::string>();
    if (auto n = root["definitions_file"]) cfg.definitions_file = n.as<std::string>();

    // Polling
    if (auto n = root["poll_interval_seconds"]) {
        cfg.poll_interval = std::chrono::seconds(n.as<int64_t>());
    }
    if (auto n = root["request_timeout_ms"]) {
        cfg.request_timeout = std::chrono::milliseconds(n.as<int64_t>());
    }

    // Operational
    if (auto n = root["log_level"]) {
        auto level = parse_log_level(n.as<std::string>());
        if (!level) throw std::runtime_error("config: invalid 'log_level': " + n.as<std::string>());
        cfg.log_level = *level;
    }

    validate_config(cfg);
    return cfg;
}

} // anonymous namespace

std::optional<std::string> parse_log_level(const std::string& s) {
    if (s == "trace" || s == "debug" || s == "info" || s == "error") return s;
    if (s == "warn" || s == "warning") return std::string("warn");
    return std::nullopt;
}

void validate_config(const local_evaluation_config& cfg) {
    if (cfg.project_api_key.empty()) {
        throw std::runtime_error("config: 'project_api_key' is required");
    }
    if (cfg.definitions_file.empty() && cfg.personal_api_key.empty()) {
        throw std::runtime_error("config: 'personal_api_key' is required unless 'definitions_file' is set");
    }
    if (cfg.definitions_file.empty() && cfg.api_host.empty()) {
        throw std::runtime_error("config: 'api_host' must not be empty");
    }
    if (cfg.poll_interval.count() <= 0) {
        throw std::runtime_error("config: 'poll_interval_seconds' must be positive");
    }
    if (cfg.request_timeout.count() <= 0) {
        throw std::runtime_error("config: 'request_timeout_ms' must be positive");
    }
}

local_evaluation_config load_config(const std::string& path) {
    return from_yaml(YAML::LoadFile(path));
}

local_evaluation_config parse_config(const std::string& yaml) {
    return from_yaml(YAML::Load(yaml));
}

} // namespace flageval

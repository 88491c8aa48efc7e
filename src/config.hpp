#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace flageval {

struct local_evaluation_config {
    // Remote service
    std::string api_host = "https://us.posthog.com";
    std::string project_api_key;
    std::string personal_api_key;

    // Offline source; when set, definitions are read from this file instead of the API
    std::string definitions_file;

    // Polling
    std::chrono::milliseconds poll_interval = std::chrono::seconds(30);
    std::chrono::milliseconds request_timeout = std::chrono::seconds(10);

    // Operational
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
local_evaluation_config load_config(const std::string& path);

// Parse config from YAML text. Throws on error.
local_evaluation_config parse_config(const std::string& yaml);

// Check required fields and value ranges. Throws std::runtime_error.
void validate_config(const local_evaluation_config& cfg);

// Parse a log level name. Returns nullopt if invalid.
std::optional<std::string> parse_log_level(const std::string& s);

} // namespace flageval

#include "config.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(config_parsing, defaults) {
    auto cfg = flageval::parse_config(R"(
project_api_key: phc_project
personal_api_key: phx_personal
)");

    EXPECT_EQ(cfg.api_host, "https://us.posthog.com");
    EXPECT_EQ(cfg.project_api_key, "phc_project");
    EXPECT_EQ(cfg.personal_api_key, "phx_personal");
    EXPECT_TRUE(cfg.definitions_file.empty());
    EXPECT_EQ(cfg.poll_interval, std::chrono::seconds(30));
    EXPECT_EQ(cfg.request_timeout, std::chrono::seconds(10));
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(config_parsing, all_fields) {
    auto cfg = flageval::parse_config(R"(
api_host: https://eu.posthog.com/
project_api_key: phc_project
personal_api_key: phx_personal
poll_interval_seconds: 5
request_timeout_ms: 1500
log_level: warning
)");

    EXPECT_EQ(cfg.api_host, "https://eu.posthog.com/");
    EXPECT_EQ(cfg.poll_interval, std::chrono::seconds(5));
    EXPECT_EQ(cfg.request_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(cfg.log_level, "warn");
}

TEST(config_parsing, definitions_file_replaces_personal_key) {
    auto cfg = flageval::parse_config(R"(
project_api_key: phc_project
definitions_file: /tmp/flags.json
)");
    EXPECT_EQ(cfg.definitions_file, "/tmp/flags.json");
    EXPECT_TRUE(cfg.personal_api_key.empty());
}

TEST(config_parsing, missing_required_keys) {
    EXPECT_THROW(flageval::parse_config("personal_api_key: phx_personal\n"), std::runtime_error);
    EXPECT_THROW(flageval::parse_config("project_api_key: phc_project\n"), std::runtime_error);
}

TEST(config_parsing, invalid_values) {
    EXPECT_THROW(flageval::parse_config(R"(
project_api_key: phc_project
personal_api_key: phx_personal
poll_interval_seconds: 0
)"), std::runtime_error);

    EXPECT_THROW(flageval::parse_config(R"(
project_api_key: phc_project
personal_api_key: phx_personal
request_timeout_ms: -1
)"), std::runtime_error);

    EXPECT_THROW(flageval::parse_config(R"(
project_api_key: phc_project
personal_api_key: phx_personal
log_level: loud
)"), std::runtime_error);
}

TEST(config_parsing, error_message_prefix) {
    try {
        flageval::parse_config("personal_api_key: phx_personal\n");
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("config:", 0), 0u) << e.what();
    }
}

TEST(config_parsing, missing_file_throws) {
    EXPECT_ANY_THROW(flageval::load_config("/nonexistent/flageval.yaml"));
}

TEST(config_parsing, parse_log_level) {
    EXPECT_EQ(flageval::parse_log_level("debug"), std::optional<std::string>("debug"));
    EXPECT_EQ(flageval::parse_log_level("warn"), std::optional<std::string>("warn"));
    EXPECT_EQ(flageval::parse_log_level("warning"), std::optional<std::string>("warn"));
    EXPECT_EQ(flageval::parse_log_level("error"), std::optional<std::string>("error"));
    EXPECT_FALSE(flageval::parse_log_level("INFO").has_value());
    EXPECT_FALSE(flageval::parse_log_level("").has_value());
}

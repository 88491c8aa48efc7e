#include "definitions_fetcher.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace {

class temp_file {
public:
    explicit temp_file(const std::string& content) {
        m_path = std::filesystem::temp_directory_path() /
                 ("flageval_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        std::ofstream out(m_path);
        out << content;
    }
    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST(http_definitions_fetcher, endpoint_url) {
    EXPECT_EQ(flageval::http_definitions_fetcher::endpoint_url("https://us.posthog.com"),
              "https://us.posthog.com/api/feature_flag/local_evaluation/?send_cohorts");
    EXPECT_EQ(flageval::http_definitions_fetcher::endpoint_url("https://eu.posthog.com//"),
              "https://eu.posthog.com/api/feature_flag/local_evaluation/?send_cohorts");
    EXPECT_EQ(flageval::http_definitions_fetcher::endpoint_url("http://localhost:8000/"),
              "http://localhost:8000/api/feature_flag/local_evaluation/?send_cohorts");
}

TEST(http_definitions_fetcher, unreachable_host_throws) {
    // Port 9 (discard) on loopback is not expected to serve HTTP
    flageval::http_definitions_fetcher fetcher("http://127.0.0.1:9", "phc_project", "phx_personal");
    EXPECT_THROW(fetcher.fetch(std::chrono::milliseconds(500)), flageval::fetch_error);
}

TEST(file_definitions_fetcher, reads_document) {
    temp_file file(R"({"flags": [{"key": "f", "active": true}], "cohorts": {"1": {}}})");
    flageval::file_definitions_fetcher fetcher(file.path());

    auto defs = fetcher.fetch(std::chrono::milliseconds(100));
    EXPECT_EQ(defs.flags.size(), 1u);
    EXPECT_EQ(defs.cohorts.size(), 1u);
    EXPECT_EQ(fetcher.describe(), "file:" + file.path());
}

TEST(file_definitions_fetcher, missing_file_throws) {
    flageval::file_definitions_fetcher fetcher("/nonexistent/flags.json");
    EXPECT_THROW(fetcher.fetch(std::chrono::milliseconds(100)), flageval::fetch_error);
}

TEST(file_definitions_fetcher, malformed_document_throws) {
    temp_file file(R"({"flags": "nope"})");
    flageval::file_definitions_fetcher fetcher(file.path());
    EXPECT_THROW(fetcher.fetch(std::chrono::milliseconds(100)), flageval::fetch_error);
}

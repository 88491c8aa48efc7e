#pragma once

#include "flag_model.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace flageval {

// Network, HTTP status or decoding failure while fetching definitions.
class fetch_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source of complete definitions snapshots.
// fetch() either returns a whole snapshot or throws fetch_error.
class definitions_fetcher {
public:
    virtual ~definitions_fetcher() = default;

    virtual definitions_snapshot fetch(std::chrono::milliseconds timeout) = 0;

    // Short description for log messages
    virtual std::string describe() const = 0;
};

using definitions_fetcher_sptr = std::shared_ptr<definitions_fetcher>;

// GET <api_host>/api/feature_flag/local_evaluation/?send_cohorts
class http_definitions_fetcher : public definitions_fetcher {
public:
    http_definitions_fetcher(std::string api_host,
                             std::string project_api_key,
                             std::string personal_api_key);

    definitions_snapshot fetch(std::chrono::milliseconds timeout) override;
    std::string describe() const override { return m_url; }

    // Build the endpoint URL from a host, ignoring trailing slashes.
    static std::string endpoint_url(const std::string& api_host);

private:
    std::string m_url;
    std::string m_project_api_key;
    std::string m_personal_api_key;
};

// Reads the same JSON document from a local file. Used for offline mode.
class file_definitions_fetcher : public definitions_fetcher {
public:
    explicit file_definitions_fetcher(std::string path);

    definitions_snapshot fetch(std::chrono::milliseconds timeout) override;
    std::string describe() const override { return "file:" + m_path; }

private:
    std::string m_path;
};

} // namespace flageval

#include "definitions_fetcher.hpp"
#include <curl/curl.h>
#include <fstream>
#include <mutex>
#include <sstream>

namespace flageval {

namespace {

constexpr const char* k_local_evaluation_path = "/api/feature_flag/local_evaluation/?send_cohorts";

// Callback for libcurl to collect the response body
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

struct curl_deleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct slist_deleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

std::once_flag g_curl_init;

} // anonymous namespace

http_definitions_fetcher::http_definitions_fetcher(std::string api_host,
                                                   std::string project_api_key,
                                                   std::string personal_api_key)
    : m_url(endpoint_url(api_host)),
      m_project_api_key(std::move(project_api_key)),
      m_personal_api_key(std::move(personal_api_key))
{
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string http_definitions_fetcher::endpoint_url(const std::string& api_host) {
    auto end = api_host.find_last_not_of('/');
    std::string host = end == std::string::npos ? std::string() : api_host.substr(0, end + 1);
    return host + k_local_evaluation_path;
}

definitions_snapshot http_definitions_fetcher::fetch(std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
    if (!curl) throw fetch_error("curl_easy_init failed");

    std::unique_ptr<curl_slist, slist_deleter> headers;
    auto append_header = [&headers](const std::string& h) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next) throw fetch_error("curl_slist_append failed");
        headers.release();
        headers.reset(next);
    };
    append_header("Authorization: Bearer " + m_personal_api_key);
    append_header("X-PostHog-Project-Api-Key: " + m_project_api_key);
    append_header("Accept: application/json");

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, m_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw fetch_error(std::string("request to ") + m_url + " failed: " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw fetch_error("HTTP " + std::to_string(status) + " from " + m_url);
    }

    try {
        return parse_definitions(body);
    } catch (const definitions_error& e) {
        throw fetch_error(std::string("failed to parse flag response: ") + e.what());
    }
}

file_definitions_fetcher::file_definitions_fetcher(std::string path)
    : m_path(std::move(path))
{}

definitions_snapshot file_definitions_fetcher::fetch(std::chrono::milliseconds /*timeout*/) {
    std::ifstream file(m_path);
    if (!file) throw fetch_error("cannot open file: " + m_path);

    std::ostringstream ss;
    ss << file.rdbuf();

    try {
        return parse_definitions(ss.str());
    } catch (const definitions_error& e) {
        throw fetch_error(m_path + ": " + e.what());
    }
}

} // namespace flageval

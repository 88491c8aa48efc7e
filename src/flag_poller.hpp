#pragma once

#include "definitions_fetcher.hpp"
#include "flag_cache.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace flageval {

// Refreshes a flag_cache from a definitions_fetcher on a dedicated thread.
//
// Lifecycle is idle -> running -> stopped; stopped is terminal. A failed fetch
// is logged and leaves the previously published definitions in place.
// The cache must outlive the poller.
class flag_poller {
public:
    struct stats {
        uint64_t successes = 0;
        uint64_t failures = 0;
    };

    flag_poller(flag_cache& cache,
                definitions_fetcher_sptr fetcher,
                std::chrono::milliseconds poll_interval,
                std::chrono::milliseconds request_timeout,
                std::shared_ptr<spdlog::logger> log);
    ~flag_poller();

    flag_poller(const flag_poller&) = delete;
    flag_poller& operator=(const flag_poller&) = delete;

    // Load once synchronously, then keep polling in the background.
    // No-op unless idle.
    void start();

    // Wake and join the polling thread. No cache writes happen after return.
    void stop();

    bool is_running() const;

    // Fetch and publish once. Returns false (and logs) on failure.
    bool load_flags();

    stats get_stats() const;

private:
    enum class state { idle, running, stopped };

    void poll_loop();

    flag_cache& m_cache;
    definitions_fetcher_sptr m_fetcher;
    std::chrono::milliseconds m_poll_interval;
    std::chrono::milliseconds m_request_timeout;
    std::shared_ptr<spdlog::logger> m_log;

    // Guards m_state, m_initial_load and m_thread
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    state m_state = state::idle;
    bool m_initial_load = false;
    std::thread m_thread;

    std::atomic<uint64_t> m_successes{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace flageval

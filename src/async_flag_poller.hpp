#pragma once

#include "definitions_fetcher.hpp"
#include "flag_cache.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace flageval {

// Coroutine flavor of flag_poller. The polling loop runs as a task on the
// given io_context; fetches are offloaded to a private thread so the event
// loop never blocks on the network.
//
// Same lifecycle as flag_poller: idle -> running -> stopped (terminal).
// The cache must outlive the poller.
class async_flag_poller {
public:
    async_flag_poller(asio::io_context& ioc,
                      flag_cache& cache,
                      definitions_fetcher_sptr fetcher,
                      std::chrono::milliseconds poll_interval,
                      std::chrono::milliseconds request_timeout,
                      std::shared_ptr<spdlog::logger> log);

    // Cancels the polling task if stop() was never awaited.
    ~async_flag_poller();

    async_flag_poller(const async_flag_poller&) = delete;
    async_flag_poller& operator=(const async_flag_poller&) = delete;

    // Load once, then spawn the polling task. No-op unless idle.
    asio::awaitable<void> start();

    // Cancel the polling task and wait until it has exited.
    asio::awaitable<void> stop();

    bool is_running() const;

    // Fetch and publish once. Returns false (and logs) on failure.
    asio::awaitable<bool> load_flags();

private:
    enum class state { idle, running, stopped };

    // State shared with the polling task, which may outlive a cancelled poller
    struct loop_state {
        loop_state(asio::io_context& ioc, flag_cache& c, asio::thread_pool::executor_type ex)
            : timer(ioc), cache(c), fetch_executor(std::move(ex)) {}

        asio::steady_timer timer;
        flag_cache& cache;
        definitions_fetcher_sptr fetcher;
        asio::thread_pool::executor_type fetch_executor;
        std::chrono::milliseconds poll_interval{0};
        std::chrono::milliseconds request_timeout{0};
        std::shared_ptr<spdlog::logger> log;

        std::atomic<bool> stop_requested{false};
        std::atomic<bool> finished{true};
    };

    static asio::awaitable<void> poll_loop(std::shared_ptr<loop_state> s);
    static asio::awaitable<bool> refresh(std::shared_ptr<loop_state> s);

    asio::io_context& m_ioc;
    asio::thread_pool m_fetch_pool{1};
    std::shared_ptr<loop_state> m_loop;
    std::atomic<state> m_state{state::idle};
};

} // namespace flageval

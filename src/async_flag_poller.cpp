#include "async_flag_poller.hpp"
#include <asio/co_spawn.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace flageval {

async_flag_poller::async_flag_poller(asio::io_context& ioc,
                                     flag_cache& cache,
                                     definitions_fetcher_sptr fetcher,
                                     std::chrono::milliseconds poll_interval,
                                     std::chrono::milliseconds request_timeout,
                                     std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc),
      m_loop(std::make_shared<loop_state>(ioc, cache, m_fetch_pool.get_executor()))
{
    m_loop->fetcher = std::move(fetcher);
    m_loop->poll_interval = poll_interval;
    m_loop->request_timeout = request_timeout;
    m_loop->log = std::move(log);
}

async_flag_poller::~async_flag_poller() {
    m_state = state::stopped;
    m_loop->stop_requested = true;
    // The task resumes on the io_context, sees the request and exits
    asio::post(m_ioc, [loop = m_loop] { loop->timer.cancel(); });
    m_fetch_pool.join();
}

asio::awaitable<void> async_flag_poller::start() {
    auto expected = state::idle;
    if (!m_state.compare_exchange_strong(expected, state::running)) {
        m_loop->log->debug("async_flag_poller: start ignored, poller is not idle");
        co_return;
    }

    m_loop->log->info("Starting async flag poller ({}, interval={}ms, timeout={}ms)",
                     m_loop->fetcher->describe(), m_loop->poll_interval.count(),
                     m_loop->request_timeout.count());

    // Initial load is best-effort: the loop retries on the next tick
    if (co_await refresh(m_loop)) {
        m_loop->log->info("Initial flag definitions loaded ({} flags)", m_loop->cache.size());
    } else {
        m_loop->log->warn("Failed to load initial flags, will retry on next poll");
    }

    // stop() may have run while the initial load was in flight
    if (m_state != state::running) co_return;

    m_loop->finished = false;
    asio::co_spawn(m_ioc, poll_loop(m_loop),
        [loop = m_loop](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    loop->log->error("async_flag_poller: polling task failed: {}", e.what());
                }
            }
            loop->finished = true;
        });
}

asio::awaitable<void> async_flag_poller::stop() {
    if (m_state.exchange(state::stopped) == state::stopped) co_return; // already stopped

    m_loop->stop_requested = true;
    m_loop->timer.cancel();

    // Wait for an in-flight fetch to land and the task to exit
    asio::steady_timer wait(co_await asio::this_coro::executor);
    while (!m_loop->finished) {
        wait.expires_after(std::chrono::milliseconds(10));
        co_await wait.async_wait(asio::use_awaitable);
    }
    m_loop->log->info("Async flag poller stopped");
}

bool async_flag_poller::is_running() const {
    return m_state == state::running;
}

asio::awaitable<bool> async_flag_poller::load_flags() {
    co_return co_await refresh(m_loop);
}

asio::awaitable<bool> async_flag_poller::refresh(std::shared_ptr<loop_state> s) {
    try {
        auto fetcher = s->fetcher;
        auto timeout = s->request_timeout;
        auto definitions = co_await asio::co_spawn(
            s->fetch_executor,
            [fetcher, timeout]() -> asio::awaitable<definitions_snapshot> {
                co_return fetcher->fetch(timeout);
            },
            asio::use_awaitable);

        // No cache writes once stop was requested, even for a fetch already in flight
        if (s->stop_requested) {
            s->log->debug("async_flag_poller: dropping definitions fetched after stop");
            co_return false;
        }

        s->cache.replace(std::move(definitions));
        co_return true;
    } catch (const std::exception& e) {
        s->log->warn("Failed to fetch flag definitions from {}: {}", s->fetcher->describe(), e.what());
        co_return false;
    }
}

asio::awaitable<void> async_flag_poller::poll_loop(std::shared_ptr<loop_state> s) {
    s->log->debug("async_flag_poller: polling task started");

    while (!s->stop_requested) {
        s->timer.expires_after(s->poll_interval);
        asio::error_code ec;
        co_await s->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || s->stop_requested) break;

        if (co_await refresh(s)) {
            s->log->debug("async_flag_poller: refreshed definitions (version {})", s->cache.version());
        }
    }

    s->log->debug("async_flag_poller: polling task stopped");
}

} // namespace flageval

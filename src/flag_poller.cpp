#include "flag_poller.hpp"

namespace flageval {

flag_poller::flag_poller(flag_cache& cache,
                         definitions_fetcher_sptr fetcher,
                         std::chrono::milliseconds poll_interval,
                         std::chrono::milliseconds request_timeout,
                         std::shared_ptr<spdlog::logger> log)
    : m_cache(cache), m_fetcher(std::move(fetcher)),
      m_poll_interval(poll_interval), m_request_timeout(request_timeout),
      m_log(std::move(log))
{}

flag_poller::~flag_poller() {
    stop();
}

void flag_poller::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != state::idle) {
            m_log->debug("flag_poller: start ignored, poller is not idle");
            return;
        }
        m_state = state::running;
        m_initial_load = true;
    }

    m_log->info("Starting flag poller ({}, interval={}ms, timeout={}ms)",
               m_fetcher->describe(), m_poll_interval.count(), m_request_timeout.count());

    // Initial load is best-effort: the loop retries on the next tick
    if (load_flags()) {
        m_log->info("Initial flag definitions loaded ({} flags)", m_cache.size());
    } else {
        m_log->warn("Failed to load initial flags, will retry on next poll");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_initial_load = false;
        if (m_state == state::running) {
            m_thread = std::thread(&flag_poller::poll_loop, this);
        }
    }
    m_cv.notify_all();
}

void flag_poller::stop() {
    std::thread thread;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_state == state::stopped) return; // already stopped
        m_state = state::stopped;
        m_cv.notify_all();

        // A concurrent start() may still be inside its initial load
        m_cv.wait(lock, [this] { return !m_initial_load; });
        thread = std::move(m_thread);
    }

    if (thread.joinable()) {
        thread.join();
        m_log->info("Flag poller stopped");
    }
}

bool flag_poller::is_running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == state::running;
}

bool flag_poller::load_flags() {
    try {
        // No lock held here: the fetch may take up to the request timeout
        auto definitions = m_fetcher->fetch(m_request_timeout);
        m_cache.replace(std::move(definitions));
        m_successes.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const std::exception& e) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("Failed to fetch flag definitions from {}: {}", m_fetcher->describe(), e.what());
        return false;
    }
}

flag_poller::stats flag_poller::get_stats() const {
    return {
        m_successes.load(std::memory_order_relaxed),
        m_failures.load(std::memory_order_relaxed)
    };
}

void flag_poller::poll_loop() {
    m_log->debug("flag_poller: polling thread started");

    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        // Wait out the interval, waking early on stop()
        bool stopping = m_cv.wait_for(lock, m_poll_interval,
                                      [this] { return m_state != state::running; });
        if (stopping) break;

        lock.unlock();
        if (load_flags()) {
            m_log->debug("flag_poller: refreshed definitions (version {})", m_cache.version());
        }
        lock.lock();
    }

    m_log->debug("flag_poller: polling thread stopped");
}

} // namespace flageval

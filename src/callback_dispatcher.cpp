#include "callback_dispatcher.hpp"
#include <chrono>
#include <exception>

namespace replicator {

callback_dispatcher::callback_dispatcher(unsigned int thread_count,
                                         std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_thread_count(thread_count > 0 ? thread_count
                                      : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

callback_dispatcher::~callback_dispatcher() {
    stop();
}

void callback_dispatcher::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&callback_dispatcher::worker_loop, this, i);
    }
    m_log->info("callback_dispatcher: started with {} threads", m_thread_count);
}

void callback_dispatcher::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pills (empty tasks), one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(task{});
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();

    // Anything that raced past the pills still runs exactly once
    task leftover;
    while (m_queue.try_dequeue(leftover)) {
        if (leftover) run_task(leftover);
    }
    m_log->info("callback_dispatcher: stopped");
}

void callback_dispatcher::post(task t) {
    if (!t) return;
    {
        std::lock_guard<std::mutex> lock(m_idle_mutex);
        ++m_outstanding;
    }
    m_queue.enqueue(std::move(t));
}

void callback_dispatcher::wait_idle() {
    std::unique_lock<std::mutex> lock(m_idle_mutex);
    m_idle_cv.wait(lock, [this] { return m_outstanding == 0; });
}

std::size_t callback_dispatcher::queue_depth() const {
    return m_queue.size_approx();
}

callback_dispatcher::stats callback_dispatcher::get_stats() const {
    return {
        m_executed.load(std::memory_order_relaxed),
        m_faults.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void callback_dispatcher::run_task(task& t) {
    try {
        t();
    } catch (const std::exception& e) {
        m_faults.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("callback_dispatcher: callback failed: {}", e.what());
    } catch (...) {
        m_faults.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("callback_dispatcher: callback failed with a non-standard exception");
    }
    finish_one();
}

void callback_dispatcher::finish_one() {
    m_executed.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(m_idle_mutex);
    if (--m_outstanding == 0) m_idle_cv.notify_all();
}

void callback_dispatcher::worker_loop(unsigned int worker_id) {
    m_log->debug("callback_dispatcher: worker {} started", worker_id);

    task t;
    while (true) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(t, std::chrono::milliseconds(100));
        if (!got) {
            if (!m_running.load(std::memory_order_relaxed)) break;
            continue;
        }

        // Empty task = poison pill
        if (!t) break;

        run_task(t);
        t = nullptr;
    }

    m_log->debug("callback_dispatcher: worker {} stopped", worker_id);
}

} // namespace replicator

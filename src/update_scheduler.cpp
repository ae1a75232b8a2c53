#include "update_scheduler.hpp"
#include <exception>

namespace replicator {

update_scheduler::update_scheduler(table& tree, std::recursive_mutex& tree_mutex,
                                   applied_handler on_applied,
                                   std::shared_ptr<spdlog::logger> log)
    : m_tree(tree), m_tree_mutex(tree_mutex),
      m_on_applied(std::move(on_applied)), m_log(std::move(log))
{}

bool update_scheduler::submit(mutation fn) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (m_running) {
            m_queue.push_back(std::move(fn));
            m_log->debug("update_scheduler: queued mutation behind running turn ({} pending)",
                         m_queue.size());
            return false;
        }
        m_running = true;
    }

    run_turn(fn);

    while (true) {
        mutation next;
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            if (m_queue.empty()) {
                m_running = false;
                return true;
            }
            next = std::move(m_queue.front());
            m_queue.pop_front();
        }
        run_turn(next);
    }
}

void update_scheduler::run_turn(mutation& fn) {
    std::lock_guard<std::recursive_mutex> lock(m_tree_mutex);

    table before = m_tree;

    try {
        fn(m_tree);
    } catch (const std::exception& e) {
        m_faults.fetch_add(1, std::memory_order_relaxed);
        m_log->error("update_scheduler: mutation failed: {}", e.what());
    } catch (...) {
        m_faults.fetch_add(1, std::memory_order_relaxed);
        m_log->error("update_scheduler: mutation failed with a non-standard exception");
    }
    m_executed.fetch_add(1, std::memory_order_relaxed);

    // A failed mutation may still have changed the tree; replicate whatever
    // it did so mirrors stay in step with the authoritative copy.
    auto d = diff(before, m_tree);
    if (d.empty()) return;

    m_diffs.fetch_add(1, std::memory_order_relaxed);
    if (!m_on_applied) return;

    try {
        m_on_applied(d);
    } catch (const std::exception& e) {
        m_log->error("update_scheduler: applied handler failed: {}", e.what());
    } catch (...) {
        m_log->error("update_scheduler: applied handler failed with a non-standard exception");
    }
}

bool update_scheduler::running() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_running;
}

std::size_t update_scheduler::pending() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

update_scheduler::stats update_scheduler::get_stats() const {
    return {
        m_executed.load(std::memory_order_relaxed),
        m_faults.load(std::memory_order_relaxed),
        m_diffs.load(std::memory_order_relaxed)
    };
}

} // namespace replicator

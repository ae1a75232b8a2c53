#pragma once

#include "tree_diff.hpp"
#include "value.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace replicator {

// Mutates the tree in place.
using mutation = std::function<void(table&)>;

// Serializes mutations of one tree.
//
// State machine: idle -> running -> (queue non-empty ? running : idle).
// The first submit() on an idle scheduler becomes the drainer: it runs its
// own mutation and then every mutation queued meanwhile, in submission order,
// before returning. submit() on a running scheduler (reentrant from inside a
// mutation, or from another thread) only appends to the queue.
//
// Each turn snapshots the tree, runs the mutation, diffs against the
// snapshot and hands non-empty diffs to the applied handler, all while
// holding `tree_mutex`.
class update_scheduler {
public:
    using applied_handler = std::function<void(const diff_pair&)>;

    struct stats {
        uint64_t executed = 0;
        uint64_t faults = 0;
        uint64_t diffs = 0;
    };

    update_scheduler(table& tree, std::recursive_mutex& tree_mutex,
                     applied_handler on_applied,
                     std::shared_ptr<spdlog::logger> log);

    // Returns true if the caller drained the queue, false if `fn` was queued
    // behind a turn already in flight.
    bool submit(mutation fn);

    bool running() const;

    // Mutations waiting behind the one in flight.
    std::size_t pending() const;

    stats get_stats() const;

private:
    void run_turn(mutation& fn);

    table& m_tree;
    std::recursive_mutex& m_tree_mutex;
    applied_handler m_on_applied;
    std::shared_ptr<spdlog::logger> m_log;

    // Protects m_running and m_queue. Never held while a mutation runs.
    mutable std::mutex m_queue_mutex;
    bool m_running = false;
    std::deque<mutation> m_queue;

    std::atomic<uint64_t> m_executed{0};
    std::atomic<uint64_t> m_faults{0};
    std::atomic<uint64_t> m_diffs{0};
};

} // namespace replicator

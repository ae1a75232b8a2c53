#pragma once

#include "callback_dispatcher.hpp"
#include "change_notifier.hpp"
#include "profile_store.hpp"
#include "session_error.hpp"
#include "transport.hpp"
#include "tree_diff.hpp"
#include "update_scheduler.hpp"
#include "value.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace replicator {

// Live state of one identity: its authoritative tree, its update queue and
// its subscriptions. The tree is only written from inside a scheduler turn.
class session {
public:
    using replicate_fn = std::function<void(const std::string& identity, const diff_pair& d)>;

    session(std::string identity, table data, callback_dispatcher& dispatcher,
            replicate_fn replicate, std::shared_ptr<spdlog::logger> log);

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    const std::string& identity() const { return m_identity; }

    // Consistent deep copy of the tree.
    table snapshot() const;

    // See update_scheduler::submit.
    bool update(mutation fn);

    disconnect_fn listen(path p, change_callback cb);

    // Held for a whole mutation turn; lets the owner publish initial state
    // before any update can run.
    std::recursive_mutex& tree_mutex() { return m_tree_mutex; }

    update_scheduler::stats update_stats() const { return m_scheduler.get_stats(); }
    std::size_t subscription_count() const { return m_notifier.active_count(); }

private:
    void on_applied(const diff_pair& d);

    std::string m_identity;
    replicate_fn m_replicate;

    mutable std::recursive_mutex m_tree_mutex;
    value m_data;

    change_notifier m_notifier;
    update_scheduler m_scheduler;
};

// Server side table of live sessions, keyed by identity.
class session_store {
public:
    // Called when an identity must be disconnected (load failure, forced
    // release). The reason is meant for the remote user.
    using terminate_handler = std::function<void(const std::string& identity, const std::string& reason)>;

    struct stats {
        std::size_t sessions = 0;
        uint64_t loads_failed = 0;
        uint64_t diffs_sent = 0;
    };

    session_store(profile_store& profiles, transport& out,
                  callback_dispatcher& dispatcher, table default_data,
                  std::shared_ptr<spdlog::logger> log);
    ~session_store();

    void set_terminate_handler(terminate_handler handler);

    // Load, reconcile and publish the session. A second call while a load is
    // in flight waits for the first and returns its outcome. Returns true if
    // the session is live afterwards.
    bool create_session(const std::string& identity);

    // Persist and drop the session once its queued mutations have run.
    // Returns false if there was no session. Idempotent.
    bool remove_session(const std::string& identity);

    // Block until the session exists. Throws session_error if the identity is
    // not connected or disconnects while waiting.
    std::shared_ptr<session> get(const std::string& identity);
    std::shared_ptr<session> get_for(const std::string& identity, std::chrono::milliseconds timeout);

    // Non-blocking; nullptr if there is no live session.
    std::shared_ptr<session> peek(const std::string& identity) const;

    // Waits like get(), then submits to the session's update queue.
    bool update(const std::string& identity, mutation fn);

    // Waits like get(), then subscribes on the session.
    disconnect_fn listen_to_value_changed(const std::string& identity, path p, change_callback cb);

    // Persist and drop every session (shutdown).
    void remove_all();

    std::size_t session_count() const;

    stats get_stats() const;

private:
    void replicate(const std::string& identity, const diff_pair& d);
    void on_forced_release(const std::string& identity);
    void terminate(const std::string& identity, const std::string& reason);
    bool finish_load(const std::string& identity, std::promise<bool>& done);

    profile_store& m_profiles;
    transport& m_transport;
    callback_dispatcher& m_dispatcher;
    table m_default_data;
    std::shared_ptr<spdlog::logger> m_log;

    std::mutex m_handler_mutex;
    terminate_handler m_terminate;

    // Session table. m_cv is signalled whenever a session appears, an
    // identity disconnects or a queued release finishes.
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::unordered_map<std::string, std::shared_ptr<session>> m_sessions;
    std::unordered_map<std::string, std::shared_future<bool>> m_loading;
    std::unordered_set<std::string> m_connected;
    std::size_t m_releases_pending = 0;

    std::atomic<uint64_t> m_loads_failed{0};
    std::atomic<uint64_t> m_diffs_sent{0};
};

} // namespace replicator

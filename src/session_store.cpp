#include "session_store.hpp"
#include "codec.hpp"
#include <exception>
#include <vector>

namespace replicator {

session::session(std::string identity, table data, callback_dispatcher& dispatcher,
                 replicate_fn replicate, std::shared_ptr<spdlog::logger> log)
    : m_identity(std::move(identity)),
      m_replicate(std::move(replicate)),
      m_data(std::move(data)),
      m_notifier(dispatcher, log),
      m_scheduler(m_data.as_table(), m_tree_mutex,
                  [this](const diff_pair& d) { on_applied(d); }, log)
{}

table session::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(m_tree_mutex);
    return m_data.as_table();
}

bool session::update(mutation fn) {
    return m_scheduler.submit(std::move(fn));
}

disconnect_fn session::listen(path p, change_callback cb) {
    std::lock_guard<std::recursive_mutex> lock(m_tree_mutex);
    return m_notifier.listen(std::move(p), std::move(cb), m_data);
}

void session::on_applied(const diff_pair& d) {
    // Runs inside the scheduler turn with m_tree_mutex held
    m_notifier.notify(d, m_data);
    if (m_replicate) m_replicate(m_identity, d);
}

session_store::session_store(profile_store& profiles, transport& out,
                             callback_dispatcher& dispatcher, table default_data,
                             std::shared_ptr<spdlog::logger> log)
    : m_profiles(profiles), m_transport(out), m_dispatcher(dispatcher),
      m_default_data(std::move(default_data)), m_log(std::move(log))
{}

session_store::~session_store() {
    remove_all();

    // Releases queued behind a running turn still refer to this store
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_releases_pending == 0; });
}

void session_store::set_terminate_handler(terminate_handler handler) {
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    m_terminate = std::move(handler);
}

bool session_store::create_session(const std::string& identity) {
    std::promise<bool> done;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_sessions.count(identity)) return true;

        auto loading = m_loading.find(identity);
        if (loading != m_loading.end()) {
            // Coalesce onto the load already in flight. A reconnect after a
            // disconnect during that load wants the session again.
            m_connected.insert(identity);
            auto pending = loading->second;
            lock.unlock();
            m_log->debug("session_store: waiting for in-flight load of '{}'", identity);
            return pending.get();
        }

        m_connected.insert(identity);
        m_loading.emplace(identity, done.get_future().share());
    }

    try {
        return finish_load(identity, done);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_loading.erase(identity);
            m_connected.erase(identity);
            m_sessions.erase(identity);
        }
        m_cv.notify_all();
        done.set_value(false);
        throw;
    }
}

bool session_store::finish_load(const std::string& identity, std::promise<bool>& done) {
    std::optional<table> loaded;
    try {
        loaded = m_profiles.load(identity);
    } catch (const std::exception& e) {
        m_log->error("session_store: profile load for '{}' threw: {}", identity, e.what());
    }

    if (!loaded) {
        m_loads_failed.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_loading.erase(identity);
            m_connected.erase(identity);
        }
        m_cv.notify_all();
        m_log->error("session_store: could not load data for '{}'", identity);
        terminate(identity, "Data couldn't be loaded, try rejoining!");
        done.set_value(false);
        return false;
    }

    if (reconcile(*loaded, m_default_data)) {
        m_log->debug("session_store: filled default keys for '{}'", identity);
    }

    m_profiles.on_force_release(identity, [this, identity]() {
        on_forced_release(identity);
    });

    auto s = std::make_shared<session>(
        identity, std::move(*loaded), m_dispatcher,
        [this](const std::string& id, const diff_pair& d) { replicate(id, d); },
        m_log);

    {
        // Hold the tree so no update can run before the initial state is out
        std::lock_guard<std::recursive_mutex> tree_lock(s->tree_mutex());

        bool still_connected;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_loading.erase(identity);
            still_connected = m_connected.count(identity) > 0;
            if (still_connected) m_sessions.emplace(identity, s);
        }
        m_cv.notify_all();

        if (!still_connected) {
            m_log->info("session_store: '{}' left while loading - releasing", identity);
            try {
                m_profiles.release(identity, s->snapshot());
            } catch (const std::exception& e) {
                m_log->error("session_store: release of '{}' failed: {}", identity, e.what());
            }
            done.set_value(false);
            return false;
        }

        diff_pair initial;
        initial.added = s->snapshot();
        replicate(identity, initial);
    }

    m_log->info("session_store: session '{}' created", identity);
    done.set_value(true);
    return true;
}

bool session_store::remove_session(const std::string& identity) {
    std::shared_ptr<session> s;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connected.erase(identity);

        auto it = m_sessions.find(identity);
        if (it != m_sessions.end()) {
            s = std::move(it->second);
            m_sessions.erase(it);
            ++m_releases_pending;
        }
    }
    m_cv.notify_all();

    if (!s) return false;

    // Release as the last queued turn so every accepted mutation is persisted.
    // The destructor waits for the count to drop back to zero.
    struct release_done {
        session_store& store;
        ~release_done() {
            std::lock_guard<std::mutex> lock(store.m_mutex);
            --store.m_releases_pending;
            store.m_cv.notify_all();
        }
    };
    s->update([this, identity](table& data) {
        release_done done{*this};
        try {
            m_profiles.release(identity, data);
            m_log->info("session_store: session '{}' released", identity);
        } catch (const std::exception& e) {
            m_log->error("session_store: release of '{}' failed: {}", identity, e.what());
        }
    });
    return true;
}

std::shared_ptr<session> session_store::get(const std::string& identity) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [&] {
        return m_sessions.count(identity) > 0 || m_connected.count(identity) == 0;
    });

    auto it = m_sessions.find(identity);
    if (it == m_sessions.end()) {
        throw session_error("session: '" + identity + "' is not connected");
    }
    return it->second;
}

std::shared_ptr<session> session_store::get_for(const std::string& identity,
                                                std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    bool ready = m_cv.wait_for(lock, timeout, [&] {
        return m_sessions.count(identity) > 0 || m_connected.count(identity) == 0;
    });
    if (!ready) {
        throw session_error("session: timed out waiting for '" + identity + "'");
    }

    auto it = m_sessions.find(identity);
    if (it == m_sessions.end()) {
        throw session_error("session: '" + identity + "' is not connected");
    }
    return it->second;
}

std::shared_ptr<session> session_store::peek(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(identity);
    if (it != m_sessions.end()) return it->second;
    return nullptr;
}

bool session_store::update(const std::string& identity, mutation fn) {
    return get(identity)->update(std::move(fn));
}

disconnect_fn session_store::listen_to_value_changed(const std::string& identity,
                                                     path p, change_callback cb) {
    return get(identity)->listen(std::move(p), std::move(cb));
}

void session_store::remove_all() {
    std::vector<std::string> identities;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        identities.reserve(m_sessions.size());
        for (const auto& [identity, s] : m_sessions) identities.push_back(identity);
    }
    for (const auto& identity : identities) remove_session(identity);
}

std::size_t session_store::session_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

session_store::stats session_store::get_stats() const {
    return {
        session_count(),
        m_loads_failed.load(std::memory_order_relaxed),
        m_diffs_sent.load(std::memory_order_relaxed)
    };
}

void session_store::replicate(const std::string& identity, const diff_pair& d) {
    m_transport.send(identity, encode(d.added), encode(d.removed));
    m_diffs_sent.fetch_add(1, std::memory_order_relaxed);
}

void session_store::on_forced_release(const std::string& identity) {
    bool had_session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        had_session = m_sessions.erase(identity) > 0;
        m_connected.erase(identity);
    }
    m_cv.notify_all();

    m_log->warn("session_store: '{}' was released by the profile store", identity);
    if (had_session) terminate(identity, "Data loaded on another server!");
}

void session_store::terminate(const std::string& identity, const std::string& reason) {
    terminate_handler handler;
    {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        handler = m_terminate;
    }
    if (handler) handler(identity, reason);
}

} // namespace replicator

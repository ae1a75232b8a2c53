#include "mirror_store.hpp"
#include "tree_diff.hpp"

namespace replicator {

mirror_store::mirror_store(callback_dispatcher& dispatcher, std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_notifier(dispatcher, m_log)
{}

bool mirror_store::on_receive(std::span<const std::uint8_t> encoded_added,
                              std::span<const std::uint8_t> encoded_removed) {
    diff_pair d;
    try {
        d.added = decode(encoded_added);
        d.removed = decode(encoded_removed);
    } catch (const codec_error& e) {
        m_log->warn("mirror_store: dropping undecodable diff: {}", e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        merge(m_data.as_table(), d);
        m_populated = true;
        m_notifier.notify(d, m_data);
    }
    m_cv.notify_all();

    m_received.fetch_add(1, std::memory_order_relaxed);
    m_log->debug("mirror_store: applied diff added={} removed={}",
                 to_string(d.added), to_string(d.removed));
    return true;
}

bool mirror_store::on_frame(std::span<const std::uint8_t> frame) {
    try {
        auto [added, removed] = unpack_frame(frame);
        return on_receive(added, removed);
    } catch (const codec_error& e) {
        m_log->warn("mirror_store: dropping malformed frame: {}", e.what());
        return false;
    }
}

table mirror_store::get() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_populated || m_closed; });
    return ready_copy();
}

table mirror_store::get_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [this] { return m_populated || m_closed; })) {
        throw session_error("mirror: timed out waiting for initial state");
    }
    return ready_copy();
}

// Caller holds m_mutex
table mirror_store::ready_copy() const {
    if (m_closed) throw session_error("mirror: closed");
    return m_data.as_table();
}

std::optional<table> mirror_store::peek() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_populated) return std::nullopt;
    return m_data.as_table();
}

disconnect_fn mirror_store::listen_to_value_changed(path p, change_callback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_notifier.listen(std::move(p), std::move(cb), m_data);
}

void mirror_store::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool mirror_store::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

} // namespace replicator

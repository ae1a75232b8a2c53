#pragma once

#include "callback_dispatcher.hpp"
#include "change_notifier.hpp"
#include "codec.hpp"
#include "session_error.hpp"
#include "value.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>

namespace replicator {

// Client side reconstruction of one identity's tree, built only from the
// diffs the server sends.
class mirror_store {
public:
    mirror_store(callback_dispatcher& dispatcher, std::shared_ptr<spdlog::logger> log);

    // Decode, merge, notify. A frame that fails to decode is logged and
    // dropped without touching the mirror. Returns false in that case.
    bool on_receive(std::span<const std::uint8_t> encoded_added,
                    std::span<const std::uint8_t> encoded_removed);

    // Same, for a packed [added, removed] frame.
    bool on_frame(std::span<const std::uint8_t> frame);

    // Block until the first diff (the initial full state) has arrived and
    // return a copy of the mirror. Throws session_error once closed.
    table get();
    table get_for(std::chrono::milliseconds timeout);

    // Copy of the mirror, std::nullopt before the first diff.
    std::optional<table> peek() const;

    disconnect_fn listen_to_value_changed(path p, change_callback cb);

    // Fail pending and future get() calls (kicked or shutting down).
    void close();
    bool closed() const;

    uint64_t diffs_received() const { return m_received.load(std::memory_order_relaxed); }

private:
    table ready_copy() const;

    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    value m_data;
    bool m_populated = false;
    bool m_closed = false;

    change_notifier m_notifier;

    std::atomic<uint64_t> m_received{0};
};

} // namespace replicator

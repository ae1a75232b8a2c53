#pragma once

#include "callback_dispatcher.hpp"
#include "config.hpp"
#include "nats_transport.hpp"
#include "profile_store.hpp"
#include "session_store.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace replicator {

class replication_server {
public:
    replication_server(asio::io_context& ioc, const config& cfg,
                       std::shared_ptr<spdlog::logger> log);

    // Called once the NATS connection is established.
    // Sets up the control subjects and starts the callback dispatcher.
    asio::awaitable<void> start(nats_asio::iconnection_sptr conn);

    // Persist every session and stop the dispatcher. Called during shutdown
    // before ioc cleanup.
    void stop();

    session_store& sessions() { return m_store; }

private:
    // Callback: an identity connected (request/reply)
    asio::awaitable<void> on_connect_request(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Callback: an identity disconnected
    asio::awaitable<void> on_disconnect_request(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Callback: mutate an identity's document
    asio::awaitable<void> on_update_request(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Callback: the document was opened elsewhere, drop our lock
    asio::awaitable<void> on_release_request(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    asio::awaitable<bool> listen(const std::string& subject,
                                 asio::awaitable<void> (replication_server::*handler)(
                                     std::string_view, std::optional<std::string_view>,
                                     std::span<const char>));

    asio::awaitable<void> reply(std::optional<std::string_view> reply_to, const std::string& body);

    void kick(const std::string& identity, const std::string& reason);

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    nats_asio::iconnection_sptr m_conn;
    callback_dispatcher m_dispatcher;
    file_profile_store m_profiles;
    nats_transport m_transport;
    session_store m_store;

    asio::steady_timer m_stats_timer;

    std::atomic<uint64_t> m_updates_received{0};
};

} // namespace replicator

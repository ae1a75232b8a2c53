#include "replication_server.hpp"
#include "codec.hpp"
#include "update_request.hpp"
#include <nlohmann/json.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

namespace replicator {

replication_server::replication_server(asio::io_context& ioc, const config& cfg,
                                       std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_dispatcher(cfg.callback_threads, m_log),
      m_profiles(cfg.data_dir, m_log),
      m_transport(ioc, cfg, m_log),
      m_store(m_profiles, m_transport, m_dispatcher, cfg.default_data, m_log),
      m_stats_timer(ioc)
{
    m_store.set_terminate_handler([this](const std::string& identity, const std::string& reason) {
        kick(identity, reason);
    });
}

asio::awaitable<bool> replication_server::listen(
    const std::string& subject,
    asio::awaitable<void> (replication_server::*handler)(
        std::string_view, std::optional<std::string_view>, std::span<const char>))
{
    auto [sub, status] = co_await m_conn->subscribe(
        subject,
        [this, handler](auto subj, auto reply_to, auto payload) {
            return (this->*handler)(subj, reply_to, payload);
        }
    );

    if (status.failed()) {
        m_log->error("Failed to subscribe to '{}': {}", subject, status.error());
        co_return false;
    }
    m_log->info("Listening on '{}'", subject);
    co_return true;
}

asio::awaitable<void> replication_server::start(nats_asio::iconnection_sptr conn) {
    m_conn = conn;
    m_transport.attach(std::move(conn));

    m_dispatcher.start();

    bool ok = co_await listen(m_cfg.connect_subject, &replication_server::on_connect_request)
           && co_await listen(m_cfg.disconnect_subject, &replication_server::on_disconnect_request)
           && co_await listen(m_cfg.update_subject, &replication_server::on_update_request)
           && co_await listen(m_cfg.release_subject, &replication_server::on_release_request);

    if (!ok) {
        m_ioc.stop();
        co_return;
    }

    // Start stats reporting
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Replication server started (data_dir={}, diffs={}.<identity>)",
               m_cfg.data_dir, m_cfg.diff_prefix);
}

void replication_server::stop() {
    m_stats_timer.cancel();
    m_store.remove_all();
    m_dispatcher.stop();
}

asio::awaitable<void> replication_server::reply(std::optional<std::string_view> reply_to,
                                                const std::string& body) {
    if (!reply_to) co_return;

    std::string reply_subject(*reply_to);
    auto s = co_await m_conn->publish(
        reply_subject,
        std::span<const char>(body.data(), body.size()),
        std::nullopt);

    if (s.failed()) {
        m_log->error("Failed to reply on '{}': {}", reply_subject, s.error());
    }
}

asio::awaitable<void> replication_server::on_connect_request(
    std::string_view /*subject*/,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    // Parse request: JSON { "identity": "..." }
    std::string reply_str;
    try {
        auto req = nlohmann::json::parse(
            std::string_view(payload.data(), payload.size()));
        std::string identity = req.at("identity").get<std::string>();

        if (!file_profile_store::valid_identity(identity)) {
            throw std::invalid_argument("invalid identity '" + identity + "'");
        }

        // The client subscribes to its diff subject before connecting, so the
        // initial full state published here is not lost
        bool live = m_store.create_session(identity);

        nlohmann::json body = {
            {"identity", identity},
            {"live", live},
            {"diff_subject", diff_subject(m_cfg, identity)},
            {"kick_subject", kick_subject(m_cfg, identity)}
        };
        reply_str = body.dump();

    } catch (const std::exception& e) {
        reply_str = nlohmann::json({{"error", std::string("Bad request: ") + e.what()}}).dump();
    }

    co_await reply(reply_to, reply_str);
}

asio::awaitable<void> replication_server::on_disconnect_request(
    std::string_view /*subject*/,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    std::string reply_str;
    try {
        auto req = nlohmann::json::parse(
            std::string_view(payload.data(), payload.size()));
        std::string identity = req.at("identity").get<std::string>();

        bool removed = m_store.remove_session(identity);
        reply_str = nlohmann::json({{"identity", identity}, {"removed", removed}}).dump();

    } catch (const std::exception& e) {
        reply_str = nlohmann::json({{"error", std::string("Bad request: ") + e.what()}}).dump();
    }

    co_await reply(reply_to, reply_str);
}

asio::awaitable<void> replication_server::on_update_request(
    std::string_view /*subject*/,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    m_updates_received++;

    std::string reply_str;
    try {
        auto req = parse_update_request(nlohmann::json::parse(
            std::string_view(payload.data(), payload.size())));

        auto identity = req.identity;
        bool drained = m_store.update(identity, [req = std::move(req)](table& data) {
            req.apply(data);
        });
        reply_str = nlohmann::json({{"identity", identity}, {"queued", !drained}}).dump();

    } catch (const session_error& e) {
        reply_str = nlohmann::json({{"error", e.what()}}).dump();
    } catch (const std::exception& e) {
        reply_str = nlohmann::json({{"error", std::string("Bad request: ") + e.what()}}).dump();
    }

    co_await reply(reply_to, reply_str);
}

asio::awaitable<void> replication_server::on_release_request(
    std::string_view /*subject*/,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    std::string reply_str;
    try {
        auto req = nlohmann::json::parse(
            std::string_view(payload.data(), payload.size()));
        std::string identity = req.at("identity").get<std::string>();

        bool released = m_profiles.force_release(identity);
        reply_str = nlohmann::json({{"identity", identity}, {"released", released}}).dump();

    } catch (const std::exception& e) {
        reply_str = nlohmann::json({{"error", std::string("Bad request: ") + e.what()}}).dump();
    }

    co_await reply(reply_to, reply_str);
}

void replication_server::kick(const std::string& identity, const std::string& reason) {
    m_log->warn("Kicking '{}': {}", identity, reason);
    m_transport.publish(kick_subject(m_cfg, identity),
                        nlohmann::json({{"identity", identity}, {"reason", reason}}).dump());
}

asio::awaitable<void> replication_server::stats_loop() {
    while (true) {
        m_stats_timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        try {
            co_await m_stats_timer.async_wait(asio::use_awaitable);
        } catch (const asio::system_error&) {
            co_return; // cancelled by stop()
        }

        auto ss = m_store.get_stats();
        auto ds = m_dispatcher.get_stats();

        m_log->info("stats: sessions={} updates={} diffs={} published={} publish_failures={} load_failures={} callbacks={} callback_faults={} queue_depth={}",
                   ss.sessions,
                   m_updates_received.load(),
                   ss.diffs_sent,
                   m_transport.published(),
                   m_transport.failures(),
                   ss.loads_failed,
                   ds.executed,
                   ds.faults,
                   ds.queue_depth);
    }
}

} // namespace replicator

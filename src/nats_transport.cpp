#include "nats_transport.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <span>

namespace replicator {

nats_transport::nats_transport(asio::io_context& ioc, const config& cfg,
                               std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_diff_prefix(cfg.diff_prefix), m_log(std::move(log))
{}

void nats_transport::attach(nats_asio::iconnection_sptr conn) {
    std::atomic_store(&m_conn, std::move(conn));
}

void nats_transport::send(const std::string& identity, bytes added, bytes removed) {
    auto frame = pack_frame(added, removed);
    std::vector<char> payload(frame.begin(), frame.end());
    post_publish(m_diff_prefix + "." + identity, std::move(payload));
}

void nats_transport::publish(std::string subject, std::string payload) {
    post_publish(std::move(subject), std::vector<char>(payload.begin(), payload.end()));
}

void nats_transport::post_publish(std::string subject, std::vector<char> payload) {
    auto conn = std::atomic_load(&m_conn);
    if (!conn) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("nats_transport: not connected, dropping message for '{}'", subject);
        return;
    }

    auto log = m_log;
    auto& published_counter = m_published;
    auto& failure_counter = m_failures;

    // Single-threaded io_context: coroutines start in the order they are spawned
    asio::co_spawn(m_ioc,
        [subject = std::move(subject),
         payload = std::move(payload),
         conn = std::move(conn),
         log,
         &published_counter,
         &failure_counter]() mutable -> asio::awaitable<void> {
            auto s = co_await conn->publish(
                subject, std::span<const char>(payload.data(), payload.size()), std::nullopt);

            if (s.failed()) {
                failure_counter.fetch_add(1, std::memory_order_relaxed);
                log->warn("nats_transport: failed to publish to '{}': {}", subject, s.error());
            } else {
                published_counter.fetch_add(1, std::memory_order_relaxed);
            }
        },
        asio::detached
    );
}

} // namespace replicator

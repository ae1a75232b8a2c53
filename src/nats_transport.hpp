#pragma once

#include "config.hpp"
#include "transport.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace replicator {

// Publishes diff frames to <diff_prefix>.<identity>. send() may be called
// from any thread; publishing happens on the io_context thread, in call order.
class nats_transport : public transport {
public:
    nats_transport(asio::io_context& ioc, const config& cfg,
                   std::shared_ptr<spdlog::logger> log);

    // Must be called once the connection is established. Frames sent before
    // are dropped.
    void attach(nats_asio::iconnection_sptr conn);

    void send(const std::string& identity, bytes added, bytes removed) override;

    // Publish an arbitrary payload from any thread.
    void publish(std::string subject, std::string payload);

    uint64_t published() const { return m_published.load(std::memory_order_relaxed); }
    uint64_t failures() const { return m_failures.load(std::memory_order_relaxed); }

private:
    void post_publish(std::string subject, std::vector<char> payload);

    asio::io_context& m_ioc;
    std::string m_diff_prefix;
    std::shared_ptr<spdlog::logger> m_log;

    // Written on the io thread, read from scheduler threads
    nats_asio::iconnection_sptr m_conn;

    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace replicator

#include "nats_connect.hpp"
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>
#include <optional>

namespace replicator {

void apply_log_level(const std::string& level) {
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

nats_asio::iconnection_sptr open_connection(asio::io_context& ioc, const config& cfg,
                                            std::shared_ptr<spdlog::logger> log) {
    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;

    std::optional<nats_asio::ssl_config> ssl_conf;
    if (!cfg.tls_cert.empty()) {
        nats_asio::ssl_config sc;
        sc.cert = cfg.tls_cert;
        sc.key = cfg.tls_key;
        sc.ca = cfg.tls_ca;
        sc.verify = true;
        ssl_conf = sc;
    }

    auto conn = nats_asio::create_connection(
        ioc,
        [log](nats_asio::iconnection&) -> asio::awaitable<void> {
            log->info("Connected to NATS");
            co_return;
        },
        [log](nats_asio::iconnection&) -> asio::awaitable<void> {
            log->warn("Lost NATS connection");
            co_return;
        },
        [log](nats_asio::iconnection&, std::string_view err) -> asio::awaitable<void> {
            log->error("NATS error: {}", err);
            co_return;
        },
        ssl_conf);

    conn->start(nats_cfg);
    log->info("Connecting to nats://{}:{}{}", cfg.nats_address, cfg.nats_port,
              ssl_conf ? " (tls)" : "");
    return conn;
}

asio::awaitable<void> wait_connected(nats_asio::iconnection_sptr conn) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    while (!conn->is_connected()) {
        timer.expires_after(std::chrono::milliseconds(100));
        co_await timer.async_wait(asio::use_awaitable);
    }
}

} // namespace replicator

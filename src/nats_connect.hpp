#pragma once

#include "config.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace replicator {

// "debug", "warn", "error"; anything else means info.
void apply_log_level(const std::string& level);

// Create and start a connection using the address and TLS settings of `cfg`.
// Connection state changes are logged to `log`.
nats_asio::iconnection_sptr open_connection(asio::io_context& ioc, const config& cfg,
                                            std::shared_ptr<spdlog::logger> log);

// Suspend until `conn` reports connected.
asio::awaitable<void> wait_connected(nats_asio::iconnection_sptr conn);

} // namespace replicator

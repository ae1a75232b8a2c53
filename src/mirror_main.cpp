#include "callback_dispatcher.hpp"
#include "config.hpp"
#include "mirror_store.hpp"
#include "nats_connect.hpp"
#include "path_index.hpp"
#include <nlohmann/json.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdint>
#include <iostream>
#include <memory>
#include <span>
#include <vector>

namespace {

std::span<const std::uint8_t> as_bytes(std::span<const char> payload) {
    return {reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()};
}

} // namespace

// Joins as one identity and keeps a local mirror of its document, logging
// every change under the watched paths.
int main(int argc, char* argv[]) {
    cxxopts::Options options("replica_mirror",
        "Mirror one identity's replicated document and log watched values");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("i,identity", "Identity to mirror", cxxopts::value<std::string>())
        ("w,watch", "Dotted path to watch (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config") || !result.count("identity")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    auto console = spdlog::stdout_color_mt("mirror");

    replicator::config cfg;
    try {
        cfg = replicator::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("verbose")) cfg.log_level = "debug";

    replicator::apply_log_level(cfg.log_level);

    const std::string identity = result["identity"].as<std::string>();

    replicator::callback_dispatcher dispatcher(1, console);
    dispatcher.start();
    replicator::mirror_store mirror(dispatcher, console);

    std::vector<replicator::disconnect_fn> watches;
    if (result.count("watch")) {
        for (const auto& dotted : result["watch"].as<std::vector<std::string>>()) {
            watches.push_back(mirror.listen_to_value_changed(
                replicator::parse_path(dotted),
                [console, dotted](const std::optional<replicator::value>& v) {
                    if (v) console->info("{} = {}", dotted, replicator::to_string(*v));
                    else   console->info("{} removed", dotted);
                }));
        }
    }

    console->info("replica_mirror starting for '{}' ({} watches)", identity, watches.size());

    asio::io_context ioc(1);
    auto conn = replicator::open_connection(ioc, cfg, console);

    const std::string lifecycle_body = nlohmann::json({{"identity", identity}}).dump();

    auto send_lifecycle = [conn, console, lifecycle_body](std::string subject) -> asio::awaitable<void> {
        auto s = co_await conn->publish(
            subject,
            std::span<const char>(lifecycle_body.data(), lifecycle_body.size()),
            std::nullopt);
        if (s.failed()) console->error("Failed to publish to '{}': {}", subject, s.error());
    };

    // Tell the server we are leaving, then stop
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        mirror.close();
        asio::co_spawn(ioc,
            [&]() -> asio::awaitable<void> {
                if (conn->is_connected()) co_await send_lifecycle(cfg.disconnect_subject);
                ioc.stop();
            },
            asio::detached);
    });

    asio::co_spawn(ioc,
        [&]() -> asio::awaitable<void> {
            co_await replicator::wait_connected(conn);

            // Diffs first, so the initial full state is not missed
            auto [diff_sub, diff_status] = co_await conn->subscribe(
                replicator::diff_subject(cfg, identity),
                [&](auto /*subject*/, auto /*reply_to*/, auto payload) -> asio::awaitable<void> {
                    mirror.on_frame(as_bytes(payload));
                    co_return;
                });
            if (diff_status.failed()) {
                console->error("Failed to subscribe to diffs: {}", diff_status.error());
                ioc.stop();
                co_return;
            }

            auto [kick_sub, kick_status] = co_await conn->subscribe(
                replicator::kick_subject(cfg, identity),
                [&](auto /*subject*/, auto /*reply_to*/, auto payload) -> asio::awaitable<void> {
                    std::string reason(payload.data(), payload.size());
                    try {
                        reason = nlohmann::json::parse(reason).at("reason").get<std::string>();
                    } catch (const nlohmann::json::exception&) {
                        // not JSON, log the raw payload
                    }
                    console->warn("Kicked by server: {}", reason);
                    mirror.close();
                    ioc.stop();
                    co_return;
                });
            if (kick_status.failed()) {
                console->error("Failed to subscribe to kicks: {}", kick_status.error());
                ioc.stop();
                co_return;
            }

            co_await send_lifecycle(cfg.connect_subject);
            console->info("Requested session for '{}'", identity);
        },
        asio::detached
    );

    ioc.run();

    for (auto& disconnect : watches) disconnect();
    dispatcher.stop();

    if (auto data = mirror.peek()) {
        console->info("final state: {}", replicator::to_string(*data));
    }
    console->info("replica_mirror stopped ({} diffs applied)", mirror.diffs_received());
    return 0;
}

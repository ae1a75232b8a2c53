#include "config.hpp"
#include "nats_connect.hpp"
#include "replication_server.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("nats_replicator",
        "Server-authoritative diff replication of per-session documents over NATS");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("d,data-dir", "Profile directory (overrides config)", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    auto console = spdlog::stdout_color_mt("replicator");

    replicator::config cfg;
    try {
        cfg = replicator::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    if (result.count("address"))  cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))     cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("data-dir")) cfg.data_dir = result["data-dir"].as<std::string>();
    if (result.count("verbose"))  cfg.log_level = "debug";

    replicator::apply_log_level(cfg.log_level);

    unsigned int callback_threads = cfg.callback_threads > 0
        ? cfg.callback_threads
        : std::max(1u, std::thread::hardware_concurrency());

    console->info("nats_replicator starting");
    console->info("  data dir: {}", cfg.data_dir);
    console->info("  diffs:    {}.<identity>", cfg.diff_prefix);
    console->info("  kicks:    {}.<identity>", cfg.kick_prefix);
    console->info("  control:  {} / {} / {} / {}", cfg.connect_subject, cfg.disconnect_subject,
                  cfg.update_subject, cfg.release_subject);
    console->info("  defaults: {}", replicator::to_string(cfg.default_data));
    console->info("  callback threads: {}", callback_threads);

    // NATS I/O, control handlers and publish coroutines all run on this thread
    asio::io_context ioc(1);

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        ioc.stop();
    });

    std::shared_ptr<replicator::replication_server> server;
    try {
        server = std::make_shared<replicator::replication_server>(ioc, cfg, console);
    } catch (const std::exception& e) {
        console->error("Failed to initialise: {}", e.what());
        return 1;
    }

    auto conn = replicator::open_connection(ioc, cfg, console);

    asio::co_spawn(ioc,
        [server, conn]() -> asio::awaitable<void> {
            co_await replicator::wait_connected(conn);
            co_await server->start(conn);
        },
        asio::detached
    );

    ioc.run();

    // Persist every session before the last publishes are flushed
    server->stop();
    ioc.restart();
    ioc.run();

    console->info("nats_replicator stopped");
    return 0;
}

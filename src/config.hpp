#pragma once

#include "value.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string>

namespace replicator {

struct config {
    // NATS connection
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Diffs for identity X are published to <diff_prefix>.X
    std::string diff_prefix = "replication.diff";

    // Session lifecycle and control - request/reply subjects
    std::string connect_subject = "replication.connect";
    std::string disconnect_subject = "replication.disconnect";
    std::string update_subject = "replication.update";
    std::string release_subject = "replication.release";

    // Termination notices for identity X go to <kick_prefix>.X
    std::string kick_prefix = "replication.kick";

    // Profile documents (<data_dir>/<identity>.json)
    std::string data_dir;

    // Template reconciled into every freshly loaded document
    table default_data;

    // Operational
    unsigned int callback_threads = 0;  // 0 = hardware_concurrency
    int stats_interval_seconds = 10;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Same, from an already parsed document.
config parse_config(const YAML::Node& root);

// YAML mapping -> table. Scalars become bool, then int64, then double, then
// string, whichever parses first; sequences become tables keyed 1..n.
// Throws std::runtime_error on null nodes.
table table_from_yaml(const YAML::Node& node);

std::string diff_subject(const config& cfg, const std::string& identity);
std::string kick_subject(const config& cfg, const std::string& identity);

} // namespace replicator

#include "config.hpp"
#include <stdexcept>

namespace replicator {

static value value_from_yaml(const YAML::Node& node);

table table_from_yaml(const YAML::Node& node) {
    table t;
    if (node.IsMap()) {
        for (const auto& item : node) {
            t.emplace(item.first.as<std::string>(), value_from_yaml(item.second));
        }
    } else if (node.IsSequence()) {
        std::int64_t index = 1;
        for (const auto& item : node) {
            t.emplace(index++, value_from_yaml(item));
        }
    } else if (!node.IsNull()) {
        throw std::runtime_error("config: expected a mapping or a list");
    }
    return t;
}

static value value_from_yaml(const YAML::Node& node) {
    if (node.IsMap() || node.IsSequence()) return table_from_yaml(node);
    if (!node.IsScalar()) throw std::runtime_error("config: null values are not allowed in default_data");

    // Quoted scalars carry the non-specific "!" tag and stay strings
    if (node.Tag() == "!") return node.as<std::string>();

    bool b;
    if (YAML::convert<bool>::decode(node, b)) return b;
    std::int64_t i;
    if (YAML::convert<std::int64_t>::decode(node, i)) return i;
    double d;
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.as<std::string>();
}

config parse_config(const YAML::Node& root) {
    config cfg;

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Subjects
    if (auto n = root["diff_prefix"])        cfg.diff_prefix        = n.as<std::string>();
    if (auto n = root["connect_subject"])    cfg.connect_subject    = n.as<std::string>();
    if (auto n = root["disconnect_subject"]) cfg.disconnect_subject = n.as<std::string>();
    if (auto n = root["update_subject"])     cfg.update_subject     = n.as<std::string>();
    if (auto n = root["release_subject"])    cfg.release_subject    = n.as<std::string>();
    if (auto n = root["kick_prefix"])        cfg.kick_prefix        = n.as<std::string>();

    if (cfg.diff_prefix.empty()) throw std::runtime_error("config: 'diff_prefix' must not be empty");
    if (cfg.kick_prefix.empty()) throw std::runtime_error("config: 'kick_prefix' must not be empty");

    // Storage (required)
    if (auto n = root["data_dir"]) {
        cfg.data_dir = n.as<std::string>();
    } else {
        throw std::runtime_error("config: 'data_dir' is required");
    }

    if (auto n = root["default_data"]) {
        if (!n.IsMap()) throw std::runtime_error("config: 'default_data' must be a mapping");
        cfg.default_data = table_from_yaml(n);
    }

    // Operational
    if (auto n = root["callback_threads"])       cfg.callback_threads = n.as<unsigned int>();
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();

    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }

    return cfg;
}

config load_config(const std::string& path) {
    return parse_config(YAML::LoadFile(path));
}

std::string diff_subject(const config& cfg, const std::string& identity) {
    return cfg.diff_prefix + "." + identity;
}

std::string kick_subject(const config& cfg, const std::string& identity) {
    return cfg.kick_prefix + "." + identity;
}

} // namespace replicator

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

/// Thrown when the config file is missing, unreadable or invalid.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Typed view of config.json.
 *
 * {
 *   "node":      { "username": "alice", "id": "", "listen_port": 0, "bind_address": "0.0.0.0" },
 *   "discovery": { "enabled": true, "port": 41234, "interval_ms": 2000, "service": "lanos_v6_fix" },
 *   "transfer":  { "receive_dir": "received", "chunk_size": 16384 },
 *   "heartbeat": { "interval_ms": 3000 },
 *   "network":   { "connect_timeout_ms": 5000 },
 *   "logging":   { "level": "info" }
 * }
 *
 * Only node.username is required.
 */
struct NodeConfig {
    std::string   username;
    std::string   node_id;          // empty: generate one per run
    std::uint16_t listen_port = 0;  // 0: pick one in kPortRangeMin..kPortRangeMax
    std::string   bind_address = "0.0.0.0";

    bool                      discovery_enabled = true;
    std::uint16_t             discovery_port = 41234;
    std::chrono::milliseconds discovery_interval{2000};
    std::string               discovery_service = "lanos_v6_fix";

    std::string receive_dir = "received";
    std::size_t chunk_size = 16 * 1024;

    std::chrono::milliseconds heartbeat_interval{3000};
    std::chrono::milliseconds connect_timeout{5000};

    std::string log_level = "info";

    static constexpr std::uint16_t kPortRangeMin = 9000;
    static constexpr std::uint16_t kPortRangeMax = 9999;
};

/// Build a NodeConfig from parsed JSON. Throws ConfigError.
NodeConfig parse_config(const nlohmann::json& root);

/// Read and parse a config file. Throws ConfigError.
NodeConfig load_config(const std::string& path);

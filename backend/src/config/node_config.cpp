/**
 * NodeConfig — loads config.json into typed settings.
 */

#include "config/node_config.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace {

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(fmt::format("config section '{}' must be an object", name));
    }
    return *it;
}

template <typename T>
T read(const json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("config key '{}' has the wrong type: {}", key, e.what()));
    }
}

std::uint16_t read_port(const json& obj, const char* key, std::uint16_t fallback) {
    const auto value = read<std::int64_t>(obj, key, fallback);
    if (value < 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError(fmt::format("config key '{}' is not a valid port: {}", key, value));
    }
    return static_cast<std::uint16_t>(value);
}

std::chrono::milliseconds read_millis(const json& obj, const char* key,
                                      std::chrono::milliseconds fallback) {
    const auto value = read<std::int64_t>(obj, key, fallback.count());
    if (value <= 0) {
        throw ConfigError(fmt::format("config key '{}' must be positive", key));
    }
    return std::chrono::milliseconds(value);
}

} // namespace

NodeConfig parse_config(const json& root) {
    if (!root.is_object()) throw ConfigError("config root must be an object");

    NodeConfig config;

    const json& node = section(root, "node");
    config.username     = read<std::string>(node, "username", "");
    config.node_id      = read<std::string>(node, "id", "");
    config.listen_port  = read_port(node, "listen_port", config.listen_port);
    config.bind_address = read<std::string>(node, "bind_address", config.bind_address);
    if (config.username.empty()) throw ConfigError("node.username is required");

    const json& discovery = section(root, "discovery");
    config.discovery_enabled  = read<bool>(discovery, "enabled", config.discovery_enabled);
    config.discovery_port     = read_port(discovery, "port", config.discovery_port);
    config.discovery_interval = read_millis(discovery, "interval_ms", config.discovery_interval);
    config.discovery_service  = read<std::string>(discovery, "service", config.discovery_service);

    const json& transfer = section(root, "transfer");
    config.receive_dir = read<std::string>(transfer, "receive_dir", config.receive_dir);
    const auto chunk_size = read<std::int64_t>(transfer, "chunk_size",
                                               static_cast<std::int64_t>(config.chunk_size));
    if (chunk_size <= 0 || chunk_size > 1024 * 1024) {
        throw ConfigError("transfer.chunk_size must be between 1 and 1048576");
    }
    config.chunk_size = static_cast<std::size_t>(chunk_size);

    config.heartbeat_interval = read_millis(section(root, "heartbeat"), "interval_ms",
                                            config.heartbeat_interval);
    config.connect_timeout = read_millis(section(root, "network"), "connect_timeout_ms",
                                         config.connect_timeout);
    config.log_level = read<std::string>(section(root, "logging"), "level", config.log_level);
    static const std::array<const char*, 7> kLevels = {"trace", "debug", "info", "warn",
                                                       "error", "critical", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), config.log_level) == kLevels.end()) {
        throw ConfigError(fmt::format("logging.level '{}' is not a log level", config.log_level));
    }

    return config;
}

NodeConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("cannot open config file: {}", path));
    }
    json root = json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        throw ConfigError(fmt::format("config file is not valid JSON: {}", path));
    }
    return parse_config(root);
}

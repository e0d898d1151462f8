#include <gtest/gtest.h>

#include <fstream>

#include "config/node_config.h"
#include "test_peer.h"

using nlohmann::json;

TEST(NodeConfig, MinimalConfigGetsDefaults) {
    const NodeConfig config = parse_config(json{{"node", {{"username", "alice"}}}});

    EXPECT_EQ(config.username, "alice");
    EXPECT_TRUE(config.node_id.empty());
    EXPECT_EQ(config.listen_port, 0);
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_TRUE(config.discovery_enabled);
    EXPECT_EQ(config.discovery_port, 41234);
    EXPECT_EQ(config.discovery_interval, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.discovery_service, "lanos_v6_fix");
    EXPECT_EQ(config.receive_dir, "received");
    EXPECT_EQ(config.chunk_size, 16384u);
    EXPECT_EQ(config.heartbeat_interval, std::chrono::milliseconds(3000));
    EXPECT_EQ(config.connect_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.log_level, "info");
}

TEST(NodeConfig, ReadsEverySection) {
    const json root = {
        {"node", {{"username", "bob"}, {"id", "bob-1"}, {"listen_port", 9500}, {"bind_address", "127.0.0.1"}}},
        {"discovery", {{"enabled", false}, {"port", 5000}, {"interval_ms", 250}, {"service", "lab"}}},
        {"transfer", {{"receive_dir", "/tmp/in"}, {"chunk_size", 4096}}},
        {"heartbeat", {{"interval_ms", 1000}}},
        {"network", {{"connect_timeout_ms", 700}}},
        {"logging", {{"level", "debug"}}},
    };
    const NodeConfig config = parse_config(root);

    EXPECT_EQ(config.node_id, "bob-1");
    EXPECT_EQ(config.listen_port, 9500);
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_FALSE(config.discovery_enabled);
    EXPECT_EQ(config.discovery_port, 5000);
    EXPECT_EQ(config.discovery_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(config.discovery_service, "lab");
    EXPECT_EQ(config.receive_dir, "/tmp/in");
    EXPECT_EQ(config.chunk_size, 4096u);
    EXPECT_EQ(config.heartbeat_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.connect_timeout, std::chrono::milliseconds(700));
    EXPECT_EQ(config.log_level, "debug");
}

TEST(NodeConfig, RejectsInvalidValues) {
    EXPECT_THROW(parse_config(json::object()), ConfigError);
    EXPECT_THROW(parse_config(json::array()), ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", ""}}}}), ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", 5}}}}), ConfigError);
    EXPECT_THROW(parse_config(json{{"node", "alice"}}), ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", "a"}, {"listen_port", 70000}}}}), ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", "a"}}}, {"transfer", {{"chunk_size", 0}}}}),
                 ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", "a"}}},
                                   {"transfer", {{"chunk_size", 2 * 1024 * 1024}}}}),
                 ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", "a"}}}, {"heartbeat", {{"interval_ms", 0}}}}),
                 ConfigError);
    EXPECT_THROW(parse_config(json{{"node", {{"username", "a"}}}, {"logging", {{"level", "loud"}}}}),
                 ConfigError);
}

TEST(NodeConfig, LoadsFromFile) {
    TempDir dir;
    const auto path = (dir.path / "config.json").string();
    {
        std::ofstream out(path);
        out << R"({"node": {"username": "carol"}, "logging": {"level": "warn"}})";
    }

    const NodeConfig config = load_config(path);
    EXPECT_EQ(config.username, "carol");
    EXPECT_EQ(config.log_level, "warn");
}

TEST(NodeConfig, LoadReportsMissingAndMalformedFiles) {
    TempDir dir;
    EXPECT_THROW(load_config((dir.path / "absent.json").string()), ConfigError);

    const auto path = (dir.path / "broken.json").string();
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_config(path), ConfigError);
}

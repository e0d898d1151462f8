/**
 * Node — Represents the local LAN node.
 *
 * Wires discovery, sessions and the feature engines together, binds the
 * session listener and forwards front-end commands to the engine that
 * owns them.
 */

#include "node/node.h"

#include <sodium.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

#include "network/peer_client.h"

namespace {

constexpr int kBindAttempts = 20;

ConnectionManager::Settings connection_settings(const NodeConfig& config) {
    ConnectionManager::Settings settings;
    settings.heartbeat_interval = config.heartbeat_interval;
    settings.connect_timeout = config.connect_timeout;
    return settings;
}

FileTransferEngine::Settings transfer_settings(const NodeConfig& config) {
    FileTransferEngine::Settings settings;
    settings.receive_dir = config.receive_dir;
    settings.chunk_size = config.chunk_size;
    return settings;
}

} // namespace

Node::Node(asio::io_context& io, NodeConfig config)
    : Node(io, std::move(config), std::make_unique<PeerClient>(io),
           std::make_unique<ShellCommandRunner>(io)) {}

Node::Node(asio::io_context& io,
           NodeConfig config,
           std::unique_ptr<Dialer> dialer,
           std::unique_ptr<CommandRunner> runner)
    : io_(io),
      config_(std::move(config)),
      identity_(make_identity(config_)),
      discovery_(identity_.id, registry_),
      dialer_(std::move(dialer)),
      runner_(std::move(runner)),
      connections_(io, identity_, registry_, *dialer_, hub_, connection_settings(config_)),
      transfers_(io, identity_, connections_, hub_, transfer_settings(config_)),
      game_(identity_, connections_, hub_),
      consent_(identity_, connections_, *runner_, hub_),
      router_(identity_, connections_, transfers_, game_, consent_, hub_) {
    registry_.set_on_changed([this](const std::vector<DiscoveredPeer>& peers) {
        hub_.registry_changed(peers);
    });
    connections_.set_inbound_handler(&router_);
    spdlog::info("Node {} ({}) on {}", identity_.username, identity_.id, identity_.device);
}

Node::~Node() {
    connections_.set_inbound_handler(nullptr);
}

void Node::start() {
    bind_server();
    server_->set_on_accept([this](std::shared_ptr<Transport> transport) {
        accept_inbound(std::move(transport));
    });
    server_->start();
    connections_.start_heartbeat();

    if (config_.discovery_enabled) {
        announcer_ = std::make_unique<LanAnnouncer>(io_, identity_, discovery_,
                                                    config_.discovery_service,
                                                    config_.discovery_port,
                                                    config_.discovery_interval);
        if (!announcer_->start(server_->port())) {
            hub_.notice(NoticeLevel::Warning,
                        "LAN discovery is unavailable; peers will not appear automatically.");
        }
    }
}

void Node::bind_server() {
    if (config_.listen_port != 0) {
        try {
            server_ = std::make_unique<PeerServer>(io_, config_.bind_address, config_.listen_port);
        } catch (const std::system_error& e) {
            throw std::runtime_error(fmt::format("Cannot listen on port {}: {}",
                                                 config_.listen_port, e.what()));
        }
        return;
    }

    const uint32_t span = NodeConfig::kPortRangeMax - NodeConfig::kPortRangeMin + 1;
    for (int attempt = 0; attempt < kBindAttempts; ++attempt) {
        const auto port = static_cast<uint16_t>(NodeConfig::kPortRangeMin + randombytes_uniform(span));
        try {
            server_ = std::make_unique<PeerServer>(io_, config_.bind_address, port);
            return;
        } catch (const std::system_error& e) {
            spdlog::debug("Port {} unavailable: {}", port, e.what());
        }
    }
    throw std::runtime_error(fmt::format("No free port in {}-{} after {} attempts",
                                         NodeConfig::kPortRangeMin, NodeConfig::kPortRangeMax,
                                         kBindAttempts));
}

void Node::stop() {
    if (announcer_) announcer_->stop();
    if (server_) server_->stop();
    connections_.stop();
    spdlog::info("Node stopped");
}

void Node::accept_inbound(std::shared_ptr<Transport> transport) {
    connections_.accept_inbound(std::move(transport));
}

CommandResult Node::connect(const std::string& peer_id) {
    return connections_.dial(peer_id);
}

CommandResult Node::set_active_target(const ActiveTarget& target) {
    return connections_.set_active_target(target);
}

CommandResult Node::send_chat(const std::string& text) {
    return router_.send_chat(text);
}

CommandResult Node::send_file(const std::filesystem::path& path) {
    return transfers_.send_file(path);
}

CommandResult Node::send_nudge() {
    return router_.send_nudge();
}

CommandResult Node::request_exec(const std::string& command) {
    return consent_.request(command);
}

CommandResult Node::approve_exec() {
    return consent_.approve();
}

CommandResult Node::deny_exec() {
    return consent_.deny();
}

CommandResult Node::invite_game() {
    return game_.invite();
}

CommandResult Node::accept_game() {
    return game_.accept();
}

CommandResult Node::move(std::size_t cell) {
    return game_.move(cell);
}

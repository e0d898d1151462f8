#pragma once

#include <asio.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "config/node_config.h"
#include "discovery/discovery_adapter.h"
#include "discovery/lan_announcer.h"
#include "discovery/peer_registry.h"
#include "events/observer_hub.h"
#include "exec/command_consent.h"
#include "exec/command_runner.h"
#include "game/game_session.h"
#include "network/peer_server.h"
#include "network/transport.h"
#include "node/active_target.h"
#include "node/command_result.h"
#include "node/connection_manager.h"
#include "node/identity.h"
#include "node/message_router.h"
#include "transfer/file_transfer.h"

/**
 * Represents the local LAN node.
 *
 * Owns the identity, the peer registry, every session and the feature
 * engines, and exposes the command surface a front end drives. All
 * methods must be called on the io_context thread; a front end running
 * elsewhere posts to it.
 */
class Node {
public:
    Node(asio::io_context& io, NodeConfig config);

    /// Inject the outbound transport and the command runner (tests).
    Node(asio::io_context& io,
         NodeConfig config,
         std::unique_ptr<Dialer> dialer,
         std::unique_ptr<CommandRunner> runner);

    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Bind the session listener, start heartbeats and discovery.
    /// Throws std::runtime_error if no listen port can be bound.
    void start();

    /// Say goodbye on the LAN and close every session.
    void stop();

    void subscribe(NodeObserver* observer) { hub_.subscribe(observer); }
    void unsubscribe(NodeObserver* observer) { hub_.unsubscribe(observer); }

    /// Hand an already-connected inbound transport to the node.
    void accept_inbound(std::shared_ptr<Transport> transport);

    // ── Local commands ──────────────────────────────────────────────────
    CommandResult connect(const std::string& peer_id);
    CommandResult set_active_target(const ActiveTarget& target);
    CommandResult send_chat(const std::string& text);
    CommandResult send_file(const std::filesystem::path& path);
    CommandResult send_nudge();
    CommandResult request_exec(const std::string& command);
    CommandResult approve_exec();
    CommandResult deny_exec();
    CommandResult invite_game();
    CommandResult accept_game();
    CommandResult move(std::size_t cell);

    [[nodiscard]] const Identity& identity() const { return identity_; }
    [[nodiscard]] const NodeConfig& config() const { return config_; }
    [[nodiscard]] const PeerRegistry& registry() const { return registry_; }
    [[nodiscard]] DiscoveryAdapter& discovery() { return discovery_; }
    [[nodiscard]] const ConnectionManager& connections() const { return connections_; }
    [[nodiscard]] const GameSession& game() const { return game_; }
    [[nodiscard]] const CommandConsent& consent() const { return consent_; }
    [[nodiscard]] const FileTransferEngine& transfers() const { return transfers_; }
    [[nodiscard]] uint16_t listen_port() const { return server_ ? server_->port() : 0; }

private:
    void bind_server();

    asio::io_context& io_;
    NodeConfig config_;
    Identity identity_;

    ObserverHub hub_;
    PeerRegistry registry_;
    DiscoveryAdapter discovery_;

    std::unique_ptr<Dialer> dialer_;
    std::unique_ptr<CommandRunner> runner_;

    ConnectionManager connections_;
    FileTransferEngine transfers_;
    GameSession game_;
    CommandConsent consent_;
    MessageRouter router_;

    std::unique_ptr<PeerServer> server_;
    std::unique_ptr<LanAnnouncer> announcer_;
};

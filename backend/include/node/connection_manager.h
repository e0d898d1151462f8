#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "discovery/peer_registry.h"
#include "events/observer_hub.h"
#include "network/transport.h"
#include "node/active_target.h"
#include "node/command_result.h"
#include "node/identity.h"
#include "protocol/frame_codec.h"

using ConnectionId = std::uint64_t;

/**
 * Per-connection state. A Session exists from the moment a transport is
 * dialed or accepted; it is established once a pairing message has been
 * processed and peer_id is set.
 */
struct Session {
    ConnectionId               connection_id = 0;
    std::shared_ptr<Transport> transport;

    std::string peer_id;  // empty until paired
    std::string name;
    std::string device;

    bool initiator = false;  // we dialed
    bool pair_sent = false;  // our pairing message went out
    bool alive = true;       // cleared each heartbeat, set by pong
    std::chrono::steady_clock::time_point last_pong{};

    [[nodiscard]] bool established() const { return !peer_id.empty(); }
};

/**
 * Receives application traffic from established sessions.
 */
class InboundHandler {
public:
    virtual ~InboundHandler() = default;

    virtual void on_control(const SessionInfo& from, const ControlMessage& message) = 0;
    virtual void on_chunk(const SessionInfo& from, const ChunkFrame& frame) = 0;
    virtual void on_session_closed(const std::string& peer_id) = 0;
};

/**
 * Owns every peer connection: dialing, accepting, the pairing handshake,
 * heartbeats and teardown. Also holds the process-wide ActiveTarget.
 *
 * At most one established Session per peer id. A second pairing for a
 * peer that is already connected is rejected and the newer transport is
 * closed; the existing session is left alone. The exception is two
 * crossed dials: there both ends keep the link dialed by the lower peer
 * id, replacing an already established session if need be.
 *
 * Everything here runs on the node's event loop.
 */
class ConnectionManager {
public:
    struct Settings {
        std::chrono::milliseconds heartbeat_interval{3000};
        std::chrono::milliseconds connect_timeout{5000};
    };

    ConnectionManager(asio::io_context& io,
                      const Identity& identity,
                      const PeerRegistry& registry,
                      Dialer& dialer,
                      ObserverHub& hub,
                      Settings settings);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_inbound_handler(InboundHandler* handler) { inbound_ = handler; }

    /// Connect to a discovered peer. Failures after this returns are
    /// reported as notices and never retried.
    CommandResult dial(const std::string& peer_id);

    /// Adopt a freshly accepted transport and wait for its pairing message.
    void accept_inbound(std::shared_ptr<Transport> transport);

    void start_heartbeat();

    /// One heartbeat pass: close sessions that missed the previous probe,
    /// probe the rest.
    void heartbeat_tick();

    /// Stop the heartbeat and close every connection.
    void stop();

    /// Fire-and-forget sends. Return false if there is no session for the peer.
    bool send_to(const std::string& peer_id, const ControlMessage& message,
                 WriteHandler on_written = {});
    bool send_binary(const std::string& peer_id, Bytes frame, WriteHandler on_written = {});

    /// Send to every established session. Returns how many were queued.
    std::size_t broadcast(const ControlMessage& message);

    [[nodiscard]] bool is_connected(const std::string& peer_id) const;
    [[nodiscard]] std::optional<SessionInfo> session(const std::string& peer_id) const;
    [[nodiscard]] std::vector<SessionInfo> sessions() const;

    [[nodiscard]] const ActiveTarget& active_target() const { return active_target_; }

    /// The current direct peer, or std::nullopt while targeting broadcast.
    [[nodiscard]] std::optional<std::string> direct_target() const;

    /// Select broadcast or a connected peer.
    CommandResult set_active_target(const ActiveTarget& target);

    /// Back to broadcast; notifies observers if that is a change.
    void reset_active_target();

private:
    ConnectionId adopt(std::shared_ptr<Transport> transport, bool initiator);
    void send_pair(Session& session, bool ack);

    void on_text(ConnectionId id, const std::string& text);
    void on_binary(ConnectionId id, const Bytes& data);
    void on_pong(ConnectionId id);
    void on_closed(ConnectionId id, const std::error_code& reason);

    void handle_pair(Session& session, const ControlMessage& message);
    void schedule_heartbeat();
    void publish_connections();

    Session* find_established(const std::string& peer_id);
    const Session* find_established(const std::string& peer_id) const;
    static SessionInfo info_of(const Session& session);

    const Identity& identity_;
    const PeerRegistry& registry_;
    Dialer& dialer_;
    ObserverHub& hub_;
    Settings settings_;
    InboundHandler* inbound_ = nullptr;

    std::map<ConnectionId, Session> links_;
    std::unordered_map<std::string, ConnectionId> by_peer_;
    ConnectionId next_id_ = 1;

    ActiveTarget active_target_;
    asio::steady_timer heartbeat_timer_;
    bool stopped_ = false;

    // Expires with the manager; transport callbacks check it before touching `this`.
    std::shared_ptr<char> lifetime_ = std::make_shared<char>(0);
};

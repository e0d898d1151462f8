/**
 * ConnectionManager — session lifecycle for every peer connection.
 *
 * Dial → pair (ack=false) → peer answers pair (ack=true) → established.
 * Accepted connections run the same exchange from the other side.
 * Once established, control messages and chunk frames go to the
 * InboundHandler; pairing is never re-processed on that link.
 */

#include "node/connection_manager.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

ConnectionManager::ConnectionManager(asio::io_context& io,
                                     const Identity& identity,
                                     const PeerRegistry& registry,
                                     Dialer& dialer,
                                     ObserverHub& hub,
                                     Settings settings)
    : identity_(identity),
      registry_(registry),
      dialer_(dialer),
      hub_(hub),
      settings_(settings),
      heartbeat_timer_(io) {}

ConnectionManager::~ConnectionManager() {
    stop();
}

CommandResult ConnectionManager::dial(const std::string& peer_id) {
    auto peer = registry_.find(peer_id);
    if (!peer) return CommandResult::UnknownPeer;
    if (is_connected(peer_id)) return CommandResult::AlreadyConnected;

    hub_.notice(NoticeLevel::Info, fmt::format("Connecting to {}...", peer->name));

    std::weak_ptr<char> guard = lifetime_;
    dialer_.dial(peer->address, peer->port, settings_.connect_timeout,
        [this, guard, name = peer->name](const std::error_code& ec, std::shared_ptr<Transport> transport) {
            if (guard.expired()) return;
            if (ec || !transport) {
                hub_.notice(NoticeLevel::Warning,
                            fmt::format("Could not connect to {}: {}", name,
                                        ec ? ec.message() : std::string("no transport")));
                return;
            }
            if (stopped_) {
                transport->close();
                return;
            }
            const ConnectionId id = adopt(std::move(transport), true);
            send_pair(links_.at(id), false);
        });
    return CommandResult::Ok;
}

void ConnectionManager::accept_inbound(std::shared_ptr<Transport> transport) {
    if (!transport) return;
    if (stopped_) {
        transport->close();
        return;
    }
    adopt(std::move(transport), false);
}

ConnectionId ConnectionManager::adopt(std::shared_ptr<Transport> transport, bool initiator) {
    const ConnectionId id = next_id_++;

    Session session;
    session.connection_id = id;
    session.transport = transport;
    session.initiator = initiator;
    links_.emplace(id, std::move(session));

    std::weak_ptr<char> guard = lifetime_;
    TransportHandlers handlers;
    handlers.on_text = [this, guard, id](std::string text) {
        if (!guard.expired()) on_text(id, text);
    };
    handlers.on_binary = [this, guard, id](Bytes data) {
        if (!guard.expired()) on_binary(id, data);
    };
    handlers.on_pong = [this, guard, id] {
        if (!guard.expired()) on_pong(id);
    };
    handlers.on_closed = [this, guard, id](const std::error_code& reason) {
        if (!guard.expired()) on_closed(id, reason);
    };
    transport->start(std::move(handlers));

    spdlog::debug("Link {} opened ({}, {})", id, transport->remote_address(),
                  initiator ? "outbound" : "inbound");
    return id;
}

void ConnectionManager::send_pair(Session& session, bool ack) {
    ControlMessage pair;
    pair.type = MessageType::Pair;
    pair.payload["fromId"] = identity_.id;
    pair.payload["name"] = identity_.username;
    pair.payload["device"] = identity_.device;
    pair.payload["ack"] = ack;

    session.pair_sent = true;
    const ConnectionId id = session.connection_id;
    session.transport->send_text(FrameCodec::encode_control(pair), [id](const std::error_code& ec) {
        if (ec) spdlog::warn("Pairing message on link {} not sent: {}", id, ec.message());
    });
}

void ConnectionManager::on_text(ConnectionId id, const std::string& text) {
    auto it = links_.find(id);
    if (it == links_.end()) return;
    Session& session = it->second;

    auto message = FrameCodec::decode_control(text);
    if (!message) {
        spdlog::warn("Dropping malformed control message on link {}", id);
        return;
    }

    if (message->type == MessageType::Pair) {
        handle_pair(session, *message);
        return;
    }
    if (!session.established()) {
        spdlog::warn("Dropping '{}' received before pairing on link {}", to_string(message->type), id);
        return;
    }
    if (inbound_) inbound_->on_control(info_of(session), *message);
}

void ConnectionManager::on_binary(ConnectionId id, const Bytes& data) {
    auto it = links_.find(id);
    if (it == links_.end()) return;
    if (!it->second.established()) {
        spdlog::warn("Dropping binary frame received before pairing on link {}", id);
        return;
    }

    auto frame = FrameCodec::decode_chunk(data);
    if (!frame) {
        spdlog::warn("Dropping malformed chunk frame from {}", it->second.name);
        return;
    }
    if (inbound_) inbound_->on_chunk(info_of(it->second), *frame);
}

void ConnectionManager::on_pong(ConnectionId id) {
    auto it = links_.find(id);
    if (it == links_.end()) return;
    it->second.alive = true;
    it->second.last_pong = std::chrono::steady_clock::now();
}

void ConnectionManager::on_closed(ConnectionId id, const std::error_code& reason) {
    auto it = links_.find(id);
    if (it == links_.end()) return;

    Session session = std::move(it->second);
    links_.erase(it);

    if (!session.established()) {
        spdlog::debug("Unpaired link {} closed", id);
        return;
    }

    auto peer_it = by_peer_.find(session.peer_id);
    if (peer_it != by_peer_.end() && peer_it->second == id) by_peer_.erase(peer_it);

    if (reason && reason != asio::error::eof && reason != asio::error::operation_aborted) {
        hub_.notice(NoticeLevel::Warning,
                    fmt::format("Connection to {} lost: {}", session.name, reason.message()));
    } else {
        hub_.notice(NoticeLevel::Info, fmt::format("User left: {}", session.name));
    }

    if (inbound_) inbound_->on_session_closed(session.peer_id);
    if (active_target_.peer_id == session.peer_id) reset_active_target();
    publish_connections();
}

void ConnectionManager::handle_pair(Session& session, const ControlMessage& message) {
    if (session.established()) {
        spdlog::debug("Ignoring repeated pairing from {} on link {}", session.peer_id,
                      session.connection_id);
        return;
    }

    const std::string from_id = string_field(message.payload, "fromId");
    if (from_id.empty() || from_id == identity_.id) {
        spdlog::warn("Rejecting pairing with invalid id '{}' on link {}", from_id,
                     session.connection_id);
        session.transport->close();
        return;
    }

    bool replaced = false;
    auto existing = by_peer_.find(from_id);
    if (existing != by_peer_.end()) {
        auto old_it = links_.find(existing->second);
        if (old_it != links_.end()) {
            const std::string& new_dialer = session.initiator ? identity_.id : from_id;
            const std::string& old_dialer = old_it->second.initiator ? identity_.id : from_id;
            if (new_dialer == old_dialer) {
                hub_.notice(NoticeLevel::Warning,
                            fmt::format("Already connected to {}; closing duplicate connection", from_id));
                session.transport->close();
                return;
            }
            // Crossed dials: both ends keep the link dialed by the lower peer id.
            if (new_dialer > old_dialer) {
                spdlog::info("Crossed connection with {}; closing link {}", from_id, session.connection_id);
                session.transport->close();
                return;
            }
            spdlog::info("Crossed connection with {}; link {} replaces link {}", from_id,
                         session.connection_id, old_it->second.connection_id);
            auto old_transport = std::move(old_it->second.transport);
            links_.erase(old_it);
            old_transport->close();
            replaced = true;
        }
    }

    session.peer_id = from_id;
    session.name = string_field(message.payload, "name");
    if (session.name.empty()) session.name = from_id;
    session.device = string_field(message.payload, "device");
    session.alive = true;
    session.last_pong = std::chrono::steady_clock::now();
    by_peer_[from_id] = session.connection_id;

    if (!replaced) hub_.notice(NoticeLevel::Info, fmt::format("User joined: {}", session.name));

    if (!bool_field(message.payload, "ack") && !session.pair_sent) {
        send_pair(session, true);
    }
    publish_connections();
}

void ConnectionManager::start_heartbeat() {
    stopped_ = false;
    schedule_heartbeat();
}

void ConnectionManager::schedule_heartbeat() {
    heartbeat_timer_.expires_after(settings_.heartbeat_interval);
    std::weak_ptr<char> guard = lifetime_;
    heartbeat_timer_.async_wait([this, guard](const std::error_code& ec) {
        if (ec || guard.expired() || stopped_) return;
        heartbeat_tick();
        schedule_heartbeat();
    });
}

void ConnectionManager::heartbeat_tick() {
    for (auto& [id, session] : links_) {
        if (!session.established()) continue;
        if (!session.alive) {
            hub_.notice(NoticeLevel::Warning,
                        fmt::format("{} stopped answering heartbeats; closing", session.name));
            session.transport->close();
            continue;
        }
        session.alive = false;
        session.transport->ping();
    }
}

void ConnectionManager::stop() {
    stopped_ = true;
    heartbeat_timer_.cancel();
    for (auto& [id, session] : links_) {
        session.transport->close();
    }
}

bool ConnectionManager::send_to(const std::string& peer_id, const ControlMessage& message,
                                WriteHandler on_written) {
    Session* session = find_established(peer_id);
    if (session == nullptr) return false;

    session->transport->send_text(FrameCodec::encode_control(message),
        [peer_id, on_written = std::move(on_written)](const std::error_code& ec) {
            if (ec) spdlog::warn("Send to {} failed: {}", peer_id, ec.message());
            if (on_written) on_written(ec);
        });
    return true;
}

bool ConnectionManager::send_binary(const std::string& peer_id, Bytes frame, WriteHandler on_written) {
    Session* session = find_established(peer_id);
    if (session == nullptr) return false;
    session->transport->send_binary(std::move(frame), std::move(on_written));
    return true;
}

std::size_t ConnectionManager::broadcast(const ControlMessage& message) {
    const std::string text = FrameCodec::encode_control(message);
    std::size_t queued = 0;
    for (auto& [id, session] : links_) {
        if (!session.established()) continue;
        const std::string peer = session.peer_id;
        session.transport->send_text(text, [peer](const std::error_code& ec) {
            if (ec) spdlog::warn("Broadcast to {} failed: {}", peer, ec.message());
        });
        ++queued;
    }
    return queued;
}

bool ConnectionManager::is_connected(const std::string& peer_id) const {
    return find_established(peer_id) != nullptr;
}

std::optional<SessionInfo> ConnectionManager::session(const std::string& peer_id) const {
    const Session* session = find_established(peer_id);
    if (session == nullptr) return std::nullopt;
    return info_of(*session);
}

std::vector<SessionInfo> ConnectionManager::sessions() const {
    std::vector<SessionInfo> out;
    out.reserve(by_peer_.size());
    for (const auto& [id, session] : links_) {
        if (session.established()) out.push_back(info_of(session));
    }
    return out;
}

std::optional<std::string> ConnectionManager::direct_target() const {
    if (active_target_.is_broadcast()) return std::nullopt;
    return active_target_.peer_id;
}

CommandResult ConnectionManager::set_active_target(const ActiveTarget& target) {
    if (!target.is_broadcast() && !is_connected(target.peer_id)) {
        return CommandResult::PeerNotConnected;
    }
    if (target != active_target_) {
        active_target_ = target;
        hub_.active_target_changed(active_target_);
    }
    return CommandResult::Ok;
}

void ConnectionManager::reset_active_target() {
    if (active_target_.is_broadcast()) return;
    active_target_ = ActiveTarget::broadcast();
    hub_.active_target_changed(active_target_);
}

void ConnectionManager::publish_connections() {
    hub_.connections_changed(sessions());
}

Session* ConnectionManager::find_established(const std::string& peer_id) {
    const auto* self = this;
    return const_cast<Session*>(self->find_established(peer_id));
}

// A session whose transport already closed counts as gone, even before
// on_closed has run.
const Session* ConnectionManager::find_established(const std::string& peer_id) const {
    auto it = by_peer_.find(peer_id);
    if (it == by_peer_.end()) return nullptr;
    auto link = links_.find(it->second);
    if (link == links_.end() || !link->second.transport->is_open()) return nullptr;
    return &link->second;
}

SessionInfo ConnectionManager::info_of(const Session& session) {
    SessionInfo info;
    info.peer_id = session.peer_id;
    info.name = session.name;
    info.device = session.device;
    info.address = session.transport ? session.transport->remote_address() : std::string();
    info.initiator = session.initiator;
    info.alive = session.alive;
    return info;
}

#pragma once

#include <string>
#include <vector>

#include "discovery/peer_registry.h"
#include "events/events.h"
#include "node/active_target.h"

/**
 * One-way notifications from the engine to a presentation layer.
 *
 * Every callback runs on the node's event loop and receives snapshots.
 * Override only what you need.
 */
class NodeObserver {
public:
    virtual ~NodeObserver() = default;

    virtual void on_registry_changed(const std::vector<DiscoveredPeer>& /*peers*/) {}
    virtual void on_connections_changed(const std::vector<SessionInfo>& /*sessions*/) {}
    virtual void on_active_target_changed(const ActiveTarget& /*target*/) {}
    virtual void on_chat_received(const ChatMessage& /*message*/) {}
    virtual void on_nudge_received(const std::string& /*from_name*/) {}
    virtual void on_game_updated(const GameSnapshot& /*game*/) {}
    virtual void on_exec_request(const PendingCommandRequest& /*request*/) {}
    virtual void on_exec_result(const ExecResult& /*result*/) {}
    virtual void on_file_received(const ReceivedFile& /*file*/) {}
    virtual void on_notice(const Notice& /*notice*/) {}
};

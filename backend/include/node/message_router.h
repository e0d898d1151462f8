#pragma once

#include <string>

#include "events/observer_hub.h"
#include "exec/command_consent.h"
#include "game/game_session.h"
#include "node/command_result.h"
#include "node/connection_manager.h"
#include "node/identity.h"
#include "transfer/file_transfer.h"

/**
 * Dispatches inbound traffic from established sessions to the engine that
 * owns each message type, and sends chat and nudges to the active target.
 */
class MessageRouter : public InboundHandler {
public:
    MessageRouter(const Identity& identity,
                  ConnectionManager& connections,
                  FileTransferEngine& transfers,
                  GameSession& game,
                  CommandConsent& consent,
                  ObserverHub& hub);

    /// Broadcast, or direct to the active target. Redirected if that peer is gone.
    CommandResult send_chat(const std::string& text);
    CommandResult send_nudge();

    void on_control(const SessionInfo& from, const ControlMessage& message) override;
    void on_chunk(const SessionInfo& from, const ChunkFrame& frame) override;
    void on_session_closed(const std::string& peer_id) override;

private:
    CommandResult send_targeted(const ControlMessage& message);

    const Identity& identity_;
    ConnectionManager& connections_;
    FileTransferEngine& transfers_;
    GameSession& game_;
    CommandConsent& consent_;
    ObserverHub& hub_;
};

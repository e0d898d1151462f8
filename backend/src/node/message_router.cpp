/**
 * MessageRouter — inbound dispatch and outbound chat / nudge.
 */

#include "node/message_router.h"

#include <spdlog/spdlog.h>

MessageRouter::MessageRouter(const Identity& identity,
                             ConnectionManager& connections,
                             FileTransferEngine& transfers,
                             GameSession& game,
                             CommandConsent& consent,
                             ObserverHub& hub)
    : identity_(identity),
      connections_(connections),
      transfers_(transfers),
      game_(game),
      consent_(consent),
      hub_(hub) {}

CommandResult MessageRouter::send_chat(const std::string& text) {
    if (text.empty()) return CommandResult::EmptyMessage;

    ControlMessage message;
    message.type = MessageType::Chat;
    message.payload["fromId"] = identity_.id;
    message.payload["name"] = identity_.username;
    message.payload["text"] = text;
    message.payload["isPm"] = !connections_.active_target().is_broadcast();
    return send_targeted(message);
}

CommandResult MessageRouter::send_nudge() {
    ControlMessage message;
    message.type = MessageType::Nudge;
    message.payload["fromId"] = identity_.id;
    message.payload["name"] = identity_.username;
    return send_targeted(message);
}

CommandResult MessageRouter::send_targeted(const ControlMessage& message) {
    auto target = connections_.direct_target();
    if (!target) {
        const std::size_t sent = connections_.broadcast(message);
        spdlog::debug("{} broadcast to {} peer(s)", to_string(message.type), sent);
        return CommandResult::Ok;
    }

    if (!connections_.send_to(*target, message)) {
        connections_.reset_active_target();
        hub_.notice(NoticeLevel::Warning, "User disconnected. Switched to broadcast.");
        return CommandResult::Redirected;
    }
    return CommandResult::Ok;
}

void MessageRouter::on_control(const SessionInfo& from, const ControlMessage& message) {
    switch (message.type) {
    case MessageType::Chat: {
        ChatMessage chat;
        chat.from_id = from.peer_id;
        chat.from_name = from.name;
        chat.text = string_field(message.payload, "text");
        chat.direct = bool_field(message.payload, "isPm");
        hub_.chat_received(chat);
        break;
    }
    case MessageType::Nudge:
        hub_.nudge_received(from.name);
        break;
    case MessageType::FileOffer:
        transfers_.on_offer(from, message.payload);
        break;
    case MessageType::FileEnd:
        transfers_.on_end(from, message.payload);
        break;
    case MessageType::GameInvite:
        game_.on_invite(from, message.payload);
        break;
    case MessageType::GameStart:
        game_.on_start(from, message.payload);
        break;
    case MessageType::GameMove:
        game_.on_move(from, message.payload);
        break;
    case MessageType::ExecRequest:
        consent_.on_request(from, message.payload);
        break;
    case MessageType::ExecResult:
        consent_.on_result(from, message.payload);
        break;
    case MessageType::Pair:
        // Handled by the connection manager; never reaches here on a live session.
        break;
    }
}

void MessageRouter::on_chunk(const SessionInfo& from, const ChunkFrame& frame) {
    transfers_.on_chunk(from, frame);
}

void MessageRouter::on_session_closed(const std::string& peer_id) {
    transfers_.on_peer_closed(peer_id);
    game_.on_peer_closed(peer_id);
}

/**
 * GameSession — keeps one tic-tac-toe board in step with the opponent.
 *
 * Local and remote moves go through the same TicTacToe checks, so an
 * out-of-turn or repeated move is rejected on both ends.
 */

#include "game/game_session.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

GameSession::GameSession(const Identity& identity, ConnectionManager& connections, ObserverHub& hub)
    : identity_(identity), connections_(connections), hub_(hub) {}

CommandResult GameSession::invite() {
    auto target = connections_.direct_target();
    if (!target) return CommandResult::NoDirectTarget;

    ControlMessage message;
    message.type = MessageType::GameInvite;
    message.payload["fromId"] = identity_.id;
    message.payload["fromName"] = identity_.username;
    if (!connections_.send_to(*target, message)) return CommandResult::PeerNotConnected;

    hub_.notice(NoticeLevel::Info, "Invited peer to a game.");
    return CommandResult::Ok;
}

CommandResult GameSession::accept() {
    std::string opponent;
    Mark role = Mark::X;

    if (pending_inviter_ && connections_.is_connected(*pending_inviter_)) {
        opponent = *pending_inviter_;
        role = Mark::O;
    } else {
        auto target = connections_.direct_target();
        if (!target) return CommandResult::NoDirectTarget;
        if (!connections_.is_connected(*target)) return CommandResult::PeerNotConnected;
        opponent = *target;
    }

    ControlMessage message;
    message.type = MessageType::GameStart;
    message.payload["fromId"] = identity_.id;
    message.payload["fromName"] = identity_.username;
    message.payload["role"] = to_string(opponent_of(role));
    if (!connections_.send_to(opponent, message)) return CommandResult::PeerNotConnected;

    pending_inviter_.reset();
    begin(opponent, role);
    return CommandResult::Ok;
}

CommandResult GameSession::move(std::size_t cell) {
    if (phase_ != GamePhase::Active || game_.turn() != local_role_) return CommandResult::InvalidMove;
    if (cell >= TicTacToe::kCells || game_.board()[cell] != Mark::Empty) return CommandResult::InvalidMove;
    if (!connections_.is_connected(opponent_id_)) return CommandResult::PeerNotConnected;
    if (!game_.move(cell, local_role_)) return CommandResult::InvalidMove;

    ControlMessage message;
    message.type = MessageType::GameMove;
    message.payload["index"] = cell;
    message.payload["symbol"] = to_string(local_role_);
    connections_.send_to(opponent_id_, message);

    after_move();
    return CommandResult::Ok;
}

void GameSession::on_invite(const SessionInfo& from, const nlohmann::json& /*payload*/) {
    pending_inviter_ = from.peer_id;
    hub_.notice(NoticeLevel::Info, fmt::format("Game invite from {}! Type /accept", from.name));
}

void GameSession::on_start(const SessionInfo& from, const nlohmann::json& payload) {
    auto role = mark_from_string(string_field(payload, "role"));
    if (!role) {
        spdlog::warn("Dropping game-start without a valid role from {}", from.name);
        return;
    }
    pending_inviter_.reset();
    begin(from.peer_id, *role);
}

void GameSession::on_move(const SessionInfo& from, const nlohmann::json& payload) {
    if (phase_ != GamePhase::Active || from.peer_id != opponent_id_) {
        spdlog::debug("Ignoring game-move from {}: no active game with them", from.name);
        return;
    }
    auto index = int_field(payload, "index");
    auto symbol = mark_from_string(string_field(payload, "symbol"));
    if (!index || !symbol || *index < 0 || *symbol == local_role_) {
        spdlog::warn("Dropping malformed game-move from {}", from.name);
        return;
    }
    if (!game_.move(static_cast<std::size_t>(*index), *symbol)) {
        spdlog::debug("Rejected game-move {} {} from {}", to_string(*symbol), *index, from.name);
        return;
    }
    after_move();
}

void GameSession::on_peer_closed(const std::string& peer_id) {
    if (pending_inviter_ && *pending_inviter_ == peer_id) pending_inviter_.reset();
    if (phase_ != GamePhase::Active || peer_id != opponent_id_) return;

    game_.finish();
    phase_ = GamePhase::Over;
    hub_.notice(NoticeLevel::Warning, "Opponent left; game over.");
    hub_.game_updated(snapshot());
}

GameSnapshot GameSession::snapshot() const {
    GameSnapshot snap;
    snap.board = game_.board();
    snap.turn = game_.turn();
    snap.phase = phase_;
    snap.local_role = local_role_;
    snap.opponent_id = opponent_id_;
    snap.result = result_;
    return snap;
}

void GameSession::begin(const std::string& opponent_id, Mark local_role) {
    game_.reset();
    phase_ = GamePhase::Active;
    local_role_ = local_role;
    opponent_id_ = opponent_id;
    result_ = GameResult::None;

    hub_.notice(NoticeLevel::Info, fmt::format("Game started! You are {}.", to_string(local_role_)));
    hub_.game_updated(snapshot());
}

void GameSession::after_move() {
    result_ = game_.result();
    if (result_ != GameResult::None) {
        game_.finish();
        phase_ = GamePhase::Over;
        if (result_ == GameResult::Draw) {
            hub_.notice(NoticeLevel::Info, "GAME OVER: draw.");
        } else {
            hub_.notice(NoticeLevel::Info, fmt::format("GAME OVER: {} wins!", to_string(result_)));
        }
    }
    hub_.game_updated(snapshot());
}

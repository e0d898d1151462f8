#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "events/observer_hub.h"
#include "game/tic_tac_toe.h"
#include "node/command_result.h"
#include "node/connection_manager.h"
#include "node/identity.h"

/**
 * The node's single tic-tac-toe game, mirrored with one opponent.
 *
 * Idle -> Active (accept / game-start) -> Over (win or draw) -> Active ...
 *
 * The inviter always plays X and X always moves first. Whoever accepts
 * tells the other side its role in game-start, so both ends agree. Only
 * one game exists per node; a new accept replaces whatever was there,
 * since the protocol has no game id to tell two games apart.
 */
class GameSession {
public:
    GameSession(const Identity& identity, ConnectionManager& connections, ObserverHub& hub);

    /// Invite the current direct target. Does not touch local state.
    CommandResult invite();

    /// Start a game: against a pending inviter (we play O), otherwise
    /// against the current direct target (we play X).
    CommandResult accept();

    /// Play a local move and relay it.
    CommandResult move(std::size_t cell);

    void on_invite(const SessionInfo& from, const nlohmann::json& payload);
    void on_start(const SessionInfo& from, const nlohmann::json& payload);
    void on_move(const SessionInfo& from, const nlohmann::json& payload);
    void on_peer_closed(const std::string& peer_id);

    [[nodiscard]] GameSnapshot snapshot() const;
    [[nodiscard]] GamePhase phase() const { return phase_; }

private:
    void begin(const std::string& opponent_id, Mark local_role);
    void after_move();

    const Identity& identity_;
    ConnectionManager& connections_;
    ObserverHub& hub_;

    TicTacToe game_;
    GamePhase phase_ = GamePhase::Idle;
    Mark local_role_ = Mark::Empty;
    std::string opponent_id_;
    GameResult result_ = GameResult::None;

    std::optional<std::string> pending_inviter_;
};

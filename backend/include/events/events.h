#pragma once

#include <cstdint>
#include <string>

#include "game/tic_tac_toe.h"

// Value types handed to observers. They are copies; holding on to one
// never aliases engine state.

/// An established session as the UI sees it.
struct SessionInfo {
    std::string peer_id;
    std::string name;
    std::string device;
    std::string address;
    bool initiator = false;
    bool alive = true;
};

enum class NoticeLevel { Info, Warning, Error };

struct Notice {
    NoticeLevel level = NoticeLevel::Info;
    std::string text;
};

struct ChatMessage {
    std::string from_id;
    std::string from_name;
    std::string text;
    bool        direct = false;
};

enum class GamePhase { Idle, Active, Over };

const char* to_string(GamePhase phase);

struct GameSnapshot {
    TicTacToe::Board board{};
    Mark        turn = Mark::X;
    GamePhase   phase = GamePhase::Idle;
    Mark        local_role = Mark::Empty;
    std::string opponent_id;
    GameResult  result = GameResult::None;
};

/// A remote peer asking to run a command here. Awaits local approval.
struct PendingCommandRequest {
    std::string requester_id;
    std::string requester_name;
    std::string command;
};

/// Output of a command we asked a peer to run.
struct ExecResult {
    std::string from_id;
    std::string from_name;
    std::string command;
    std::string output;
    int         exit_code = 0;
};

struct ReceivedFile {
    std::string   file_id;
    std::string   from_id;
    std::string   path;
    std::uint64_t bytes = 0;
};

/**
 * TicTacToe — board, turn order and win detection.
 */

#include "game/tic_tac_toe.h"

namespace {

constexpr std::array<std::array<std::size_t, 3>, 8> kLines = {{
    {{0, 1, 2}}, {{3, 4, 5}}, {{6, 7, 8}},  // rows
    {{0, 3, 6}}, {{1, 4, 7}}, {{2, 5, 8}},  // columns
    {{0, 4, 8}}, {{2, 4, 6}},               // diagonals
}};

} // namespace

const char* to_string(Mark mark) {
    switch (mark) {
        case Mark::X: return "X";
        case Mark::O: return "O";
        case Mark::Empty: break;
    }
    return "";
}

const char* to_string(GameResult result) {
    switch (result) {
        case GameResult::X:    return "X";
        case GameResult::O:    return "O";
        case GameResult::Draw: return "DRAW";
        case GameResult::None: break;
    }
    return "";
}

std::optional<Mark> mark_from_string(const std::string& text) {
    if (text == "X") return Mark::X;
    if (text == "O") return Mark::O;
    return std::nullopt;
}

Mark opponent_of(Mark mark) {
    if (mark == Mark::X) return Mark::O;
    if (mark == Mark::O) return Mark::X;
    return Mark::Empty;
}

TicTacToe::TicTacToe() {
    board_.fill(Mark::Empty);
}

void TicTacToe::reset() {
    board_.fill(Mark::Empty);
    turn_ = Mark::X;
    active_ = true;
}

bool TicTacToe::move(std::size_t cell, Mark mark) {
    if (!active_ || cell >= kCells || mark == Mark::Empty) return false;
    if (board_[cell] != Mark::Empty || mark != turn_) return false;
    board_[cell] = mark;
    turn_ = opponent_of(mark);
    return true;
}

GameResult TicTacToe::evaluate(const Board& board) {
    for (const auto& line : kLines) {
        const Mark first = board[line[0]];
        if (first != Mark::Empty && first == board[line[1]] && first == board[line[2]]) {
            return first == Mark::X ? GameResult::X : GameResult::O;
        }
    }
    for (Mark cell : board) {
        if (cell == Mark::Empty) return GameResult::None;
    }
    return GameResult::Draw;
}

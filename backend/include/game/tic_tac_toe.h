#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

enum class Mark : std::uint8_t { Empty, X, O };

enum class GameResult { None, X, O, Draw };

/// "X", "O" or "" for Empty.
const char* to_string(Mark mark);
/// "X", "O", "DRAW" or "" for None.
const char* to_string(GameResult result);

std::optional<Mark> mark_from_string(const std::string& text);
Mark opponent_of(Mark mark);

/**
 * Tic-tac-toe rules: a 3x3 board, X moves first, turns strictly alternate.
 */
class TicTacToe {
public:
    static constexpr std::size_t kCells = 9;
    using Board = std::array<Mark, kCells>;

    TicTacToe();

    /// Empty board, X to move, game active.
    void reset();

    /// Place @p mark at @p cell. Fails without side effects when the game
    /// is inactive, the cell is out of range or occupied, or it is not
    /// @p mark's turn.
    bool move(std::size_t cell, Mark mark);

    /// Stop accepting moves.
    void finish() { active_ = false; }

    [[nodiscard]] GameResult result() const { return evaluate(board_); }

    /// Winner of any of the 8 lines, else Draw on a full board, else None.
    static GameResult evaluate(const Board& board);

    [[nodiscard]] const Board& board() const { return board_; }
    [[nodiscard]] Mark turn() const { return turn_; }
    [[nodiscard]] bool active() const { return active_; }

private:
    Board board_{};
    Mark turn_ = Mark::X;
    bool active_ = false;
};

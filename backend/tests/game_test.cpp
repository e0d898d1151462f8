#include <gtest/gtest.h>

#include "test_peer.h"

namespace {

std::string move_text(int index, const std::string& symbol) {
    ControlMessage message;
    message.type = MessageType::GameMove;
    message.payload = {{"index", index}, {"symbol", symbol}};
    return FrameCodec::encode_control(message);
}

class GameTest : public ::testing::Test {
protected:
    GameTest() : alice(io, "alice"), bob(io, "bob") {}

    /// Alice invites, Bob accepts.
    void start_game() {
        connect_peers(io, alice, bob);
        ASSERT_EQ(alice.node->set_active_target(ActiveTarget::peer(bob.id)), CommandResult::Ok);
        ASSERT_EQ(alice.node->invite_game(), CommandResult::Ok);
        drain(io);
        ASSERT_EQ(bob.node->accept_game(), CommandResult::Ok);
        drain(io);
    }

    asio::io_context io;
    TestPeer alice;
    TestPeer bob;
};

} // namespace

TEST_F(GameTest, InviteAloneChangesNothingLocally) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    ASSERT_EQ(alice.node->invite_game(), CommandResult::Ok);
    drain(io);

    EXPECT_EQ(alice.node->game().phase(), GamePhase::Idle);
    EXPECT_EQ(bob.node->game().phase(), GamePhase::Idle);
    EXPECT_TRUE(bob.events.has_notice("Game invite from alice"));
}

TEST_F(GameTest, InviterPlaysXOnBothSides) {
    start_game();

    const auto a = alice.node->game().snapshot();
    const auto b = bob.node->game().snapshot();
    EXPECT_EQ(a.phase, GamePhase::Active);
    EXPECT_EQ(b.phase, GamePhase::Active);
    EXPECT_EQ(a.local_role, Mark::X);
    EXPECT_EQ(b.local_role, Mark::O);
    EXPECT_EQ(a.opponent_id, bob.id);
    EXPECT_EQ(b.opponent_id, alice.id);
    EXPECT_EQ(a.turn, Mark::X);
}

TEST_F(GameTest, MovesMirrorAndWinEndsGameEverywhere) {
    start_game();

    for (std::size_t cell : {0, 3, 1, 4}) {
        TestPeer& player = alice.node->game().snapshot().turn == Mark::X ? alice : bob;
        ASSERT_EQ(player.node->move(cell), CommandResult::Ok) << "cell " << cell;
        drain(io);
    }
    EXPECT_EQ(alice.node->game().snapshot().board, bob.node->game().snapshot().board);

    ASSERT_EQ(alice.node->move(2), CommandResult::Ok);
    drain(io);

    for (TestPeer* peer : {&alice, &bob}) {
        const auto snap = peer->node->game().snapshot();
        EXPECT_EQ(snap.phase, GamePhase::Over) << peer->name;
        EXPECT_EQ(snap.result, GameResult::X) << peer->name;
        EXPECT_TRUE(peer->events.has_notice("GAME OVER: X wins!")) << peer->name;
    }
    EXPECT_EQ(bob.node->move(8), CommandResult::InvalidMove);
}

TEST_F(GameTest, DrawIsDetected) {
    start_game();

    // X O X / X O O / O X X
    const std::size_t order[] = {0, 1, 2, 4, 3, 5, 7, 6, 8};
    for (std::size_t cell : order) {
        TestPeer& player = alice.node->game().snapshot().turn == Mark::X ? alice : bob;
        ASSERT_EQ(player.node->move(cell), CommandResult::Ok) << "cell " << cell;
        drain(io);
    }

    EXPECT_EQ(alice.node->game().snapshot().result, GameResult::Draw);
    EXPECT_EQ(bob.node->game().snapshot().result, GameResult::Draw);
    EXPECT_EQ(bob.node->game().phase(), GamePhase::Over);
}

TEST_F(GameTest, InvalidLocalMovesSendNothing) {
    start_game();
    auto link = alice.link_to(bob);
    const auto before = link->sent_text.size();

    EXPECT_EQ(bob.node->move(0), CommandResult::InvalidMove);      // not O's turn
    EXPECT_EQ(alice.node->move(9), CommandResult::InvalidMove);    // off the board
    ASSERT_EQ(alice.node->move(4), CommandResult::Ok);
    drain(io);
    EXPECT_EQ(alice.node->move(5), CommandResult::InvalidMove);    // twice in a row
    EXPECT_EQ(bob.node->move(4), CommandResult::InvalidMove);      // occupied

    EXPECT_EQ(link->sent_text.size(), before + 1);
}

TEST_F(GameTest, ForgedRemoteMovesAreDropped) {
    start_game();
    auto link = alice.link_to(bob);

    link->send_text(move_text(0, "O"));   // O out of turn
    link->send_text(move_text(0, "Z"));
    link->send_text(move_text(12, "X"));
    drain(io);
    EXPECT_EQ(bob.node->game().snapshot().board, TicTacToe::Board{});

    link->send_text(move_text(0, "X"));
    link->send_text(move_text(0, "X"));   // replay
    drain(io);

    const auto board = bob.node->game().snapshot().board;
    EXPECT_EQ(board[0], Mark::X);
    EXPECT_EQ(bob.node->game().snapshot().turn, Mark::O);
}

TEST_F(GameTest, AcceptWithoutInviteNeedsDirectTarget) {
    connect_peers(io, alice, bob);
    EXPECT_EQ(alice.node->accept_game(), CommandResult::NoDirectTarget);
    EXPECT_EQ(alice.node->invite_game(), CommandResult::NoDirectTarget);
}

TEST_F(GameTest, AcceptWithoutInviteMakesAccepterX) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    ASSERT_EQ(alice.node->accept_game(), CommandResult::Ok);
    drain(io);

    EXPECT_EQ(alice.node->game().snapshot().local_role, Mark::X);
    EXPECT_EQ(bob.node->game().snapshot().local_role, Mark::O);
}

TEST_F(GameTest, OpponentLeavingEndsGame) {
    start_game();
    alice.link_to(bob)->close();
    drain(io);

    for (TestPeer* peer : {&alice, &bob}) {
        const auto snap = peer->node->game().snapshot();
        EXPECT_EQ(snap.phase, GamePhase::Over) << peer->name;
        EXPECT_EQ(snap.result, GameResult::None) << peer->name;
    }
    EXPECT_EQ(alice.node->move(0), CommandResult::InvalidMove);
}

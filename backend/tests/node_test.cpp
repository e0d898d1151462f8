#include <gtest/gtest.h>

#include "test_peer.h"

namespace {

class NodeTest : public ::testing::Test {
protected:
    NodeTest() : alice(io, "alice"), bob(io, "bob"), carol(io, "carol") {}

    asio::io_context io;
    TestPeer alice;
    TestPeer bob;
    TestPeer carol;
};

std::size_t count_type(const FakeTransport& link, MessageType type) {
    std::size_t n = 0;
    for (const auto& text : link.sent_text) {
        auto message = FrameCodec::decode_control(text);
        if (message && message->type == type) ++n;
    }
    return n;
}

} // namespace

TEST_F(NodeTest, DiscoveryFeedsRegistryAndObservers) {
    alice.discover(bob);
    alice.discover(bob);
    alice.node->discovery().on_peer_up({alice.id, "alice", "me", "10.9.9.9", 9000});

    EXPECT_EQ(alice.node->registry().size(), 1u);
    EXPECT_EQ(alice.events.registry_events, 1);
    ASSERT_EQ(alice.events.peers.size(), 1u);
    EXPECT_EQ(alice.events.peers[0].name, "bob");
}

TEST_F(NodeTest, ConnectPairsBothSides) {
    EXPECT_EQ(alice.node->connect(bob.id), CommandResult::UnknownPeer);

    connect_peers(io, alice, bob);

    auto on_alice = alice.node->connections().session(bob.id);
    auto on_bob = bob.node->connections().session(alice.id);
    ASSERT_TRUE(on_alice.has_value());
    ASSERT_TRUE(on_bob.has_value());
    EXPECT_EQ(on_alice->name, "bob");
    EXPECT_TRUE(on_alice->initiator);
    EXPECT_EQ(on_bob->name, "alice");
    EXPECT_FALSE(on_bob->initiator);
    EXPECT_EQ(alice.node->connect(bob.id), CommandResult::AlreadyConnected);
}

TEST_F(NodeTest, CrossedDialsSettleOnOneSharedLink) {
    alice.discover(bob);
    bob.discover(alice);
    ASSERT_EQ(alice.node->connect(bob.id), CommandResult::Ok);
    ASSERT_EQ(bob.node->connect(alice.id), CommandResult::Ok);
    drain(io);

    // Both keep the link dialed by the lower id, which is alice's.
    ASSERT_EQ(alice.node->connections().sessions().size(), 1u);
    ASSERT_EQ(bob.node->connections().sessions().size(), 1u);
    EXPECT_TRUE(alice.node->connections().session(bob.id)->initiator);
    EXPECT_FALSE(bob.node->connections().session(alice.id)->initiator);
    EXPECT_TRUE(alice.link_to(bob)->is_open());
    EXPECT_FALSE(bob.link_to(alice)->is_open());
    EXPECT_FALSE(alice.events.has_notice("User left"));
    EXPECT_FALSE(bob.events.has_notice("User left"));

    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    bob.node->set_active_target(ActiveTarget::peer(alice.id));
    ASSERT_EQ(alice.node->send_chat("ping"), CommandResult::Ok);
    ASSERT_EQ(bob.node->send_chat("pong"), CommandResult::Ok);
    drain(io);
    ASSERT_EQ(bob.events.chats.size(), 1u);
    ASSERT_EQ(alice.events.chats.size(), 1u);
    EXPECT_EQ(alice.events.chats[0].text, "pong");
}

TEST_F(NodeTest, BroadcastChatReachesEverySession) {
    connect_peers(io, alice, bob);
    connect_peers(io, alice, carol);

    ASSERT_EQ(alice.node->send_chat("hello all"), CommandResult::Ok);
    drain(io);

    for (TestPeer* peer : {&bob, &carol}) {
        ASSERT_EQ(peer->events.chats.size(), 1u) << peer->name;
        EXPECT_EQ(peer->events.chats[0].from_name, "alice");
        EXPECT_EQ(peer->events.chats[0].text, "hello all");
        EXPECT_FALSE(peer->events.chats[0].direct);
    }
}

TEST_F(NodeTest, BroadcastChatSurvivesOneFailingSession) {
    connect_peers(io, alice, bob);
    connect_peers(io, alice, carol);
    alice.link_to(bob)->fail_writes = true;

    ASSERT_EQ(alice.node->send_chat("still here"), CommandResult::Ok);
    drain(io);

    EXPECT_TRUE(bob.events.chats.empty());
    ASSERT_EQ(carol.events.chats.size(), 1u);
    EXPECT_EQ(carol.events.chats[0].text, "still here");
}

TEST_F(NodeTest, DirectChatGoesOnlyToTarget) {
    connect_peers(io, alice, bob);
    connect_peers(io, alice, carol);
    ASSERT_EQ(alice.node->set_active_target(ActiveTarget::peer(carol.id)), CommandResult::Ok);

    ASSERT_EQ(alice.node->send_chat("psst"), CommandResult::Ok);
    drain(io);

    EXPECT_TRUE(bob.events.chats.empty());
    ASSERT_EQ(carol.events.chats.size(), 1u);
    EXPECT_TRUE(carol.events.chats[0].direct);
}

TEST_F(NodeTest, ChatToVanishedTargetIsRedirected) {
    connect_peers(io, alice, bob);
    ASSERT_EQ(alice.node->set_active_target(ActiveTarget::peer(bob.id)), CommandResult::Ok);

    // Bob's hang-up has not been processed yet when Alice types.
    alice.link_to(bob)->remote_close();
    EXPECT_EQ(alice.node->send_chat("anyone?"), CommandResult::Redirected);
    EXPECT_TRUE(alice.node->connections().active_target().is_broadcast());
    EXPECT_TRUE(alice.events.has_notice("Switched to broadcast"));
    drain(io);

    EXPECT_TRUE(bob.events.chats.empty());
    ASSERT_EQ(alice.events.targets.size(), 2u);
    EXPECT_TRUE(alice.events.targets.back().is_broadcast());
}

TEST_F(NodeTest, EmptyChatIsRejected) {
    connect_peers(io, alice, bob);
    const auto before = alice.link_to(bob)->sent_text.size();
    EXPECT_EQ(alice.node->send_chat(""), CommandResult::EmptyMessage);
    drain(io);
    EXPECT_EQ(alice.link_to(bob)->sent_text.size(), before);
}

TEST_F(NodeTest, NudgeFollowsChatTargeting) {
    connect_peers(io, alice, bob);
    connect_peers(io, alice, carol);

    ASSERT_EQ(alice.node->send_nudge(), CommandResult::Ok);
    drain(io);
    EXPECT_EQ(bob.events.nudges, std::vector<std::string>{"alice"});
    EXPECT_EQ(carol.events.nudges, std::vector<std::string>{"alice"});

    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    ASSERT_EQ(alice.node->send_nudge(), CommandResult::Ok);
    drain(io);
    EXPECT_EQ(bob.events.nudges.size(), 2u);
    EXPECT_EQ(carol.events.nudges.size(), 1u);
}

TEST_F(NodeTest, ApproveWithNothingPendingSendsNothing) {
    connect_peers(io, alice, bob);
    auto link = alice.link_to(bob);
    const auto before = link->sent_text.size();

    EXPECT_EQ(alice.node->approve_exec(), CommandResult::NothingPending);
    drain(io);

    EXPECT_EQ(link->sent_text.size(), before);
    EXPECT_TRUE(alice.events.has_notice("Nothing pending to approve"));
    EXPECT_TRUE(alice.runner->commands.empty());
}

TEST_F(NodeTest, ExecRequestWaitsForApprovalAndRunsOnce) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    bob.runner->reply = CommandOutput{"total 0\n", 0};

    ASSERT_EQ(alice.node->request_exec("ls -la"), CommandResult::Ok);
    drain(io);

    ASSERT_EQ(bob.events.exec_requests.size(), 1u);
    EXPECT_EQ(bob.events.exec_requests[0].requester_name, "alice");
    EXPECT_EQ(bob.events.exec_requests[0].command, "ls -la");
    EXPECT_TRUE(bob.runner->commands.empty());
    EXPECT_TRUE(bob.node->consent().pending().has_value());

    ASSERT_EQ(bob.node->approve_exec(), CommandResult::Ok);
    drain(io);
    EXPECT_EQ(bob.node->approve_exec(), CommandResult::NothingPending);
    drain(io);

    EXPECT_EQ(bob.runner->commands, std::vector<std::string>{"ls -la"});
    ASSERT_EQ(alice.events.exec_results.size(), 1u);
    EXPECT_EQ(alice.events.exec_results[0].from_name, "bob");
    EXPECT_EQ(alice.events.exec_results[0].command, "ls -la");
    EXPECT_EQ(alice.events.exec_results[0].output, "total 0\n");
    EXPECT_EQ(alice.events.exec_results[0].exit_code, 0);
}

TEST_F(NodeTest, FailingCommandStillReportsOutputAndCode) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    bob.runner->reply = CommandOutput{"sh: nope: not found\n", 127};

    alice.node->request_exec("nope");
    drain(io);
    bob.node->approve_exec();
    drain(io);

    ASSERT_EQ(alice.events.exec_results.size(), 1u);
    EXPECT_EQ(alice.events.exec_results[0].exit_code, 127);
    EXPECT_EQ(alice.events.exec_results[0].output, "sh: nope: not found\n");
}

TEST_F(NodeTest, BinaryCommandOutputIsStillDelivered) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    bob.runner->reply = CommandOutput{"\xff\xfe", 0};

    alice.node->request_exec("head -c 2 /dev/urandom");
    drain(io);
    ASSERT_EQ(bob.node->approve_exec(), CommandResult::Ok);
    drain(io);

    ASSERT_EQ(alice.events.exec_results.size(), 1u);
    EXPECT_EQ(alice.events.exec_results[0].output, "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(alice.events.exec_results[0].exit_code, 0);
}

TEST_F(NodeTest, NewerExecRequestReplacesPendingOne) {
    connect_peers(io, alice, bob);
    connect_peers(io, carol, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    carol.node->set_active_target(ActiveTarget::peer(bob.id));

    alice.node->request_exec("whoami");
    drain(io);
    carol.node->request_exec("uptime");
    drain(io);

    ASSERT_TRUE(bob.node->consent().pending().has_value());
    EXPECT_EQ(bob.node->consent().pending()->command, "uptime");

    bob.node->approve_exec();
    drain(io);
    EXPECT_EQ(bob.runner->commands, std::vector<std::string>{"uptime"});
    EXPECT_EQ(carol.events.exec_results.size(), 1u);
    EXPECT_TRUE(alice.events.exec_results.empty());
}

TEST_F(NodeTest, DenyClearsPendingWithoutTraffic) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    alice.node->request_exec("rm -rf /tmp/x");
    drain(io);

    EXPECT_EQ(bob.node->deny_exec(), CommandResult::Ok);
    EXPECT_EQ(bob.node->deny_exec(), CommandResult::NothingPending);
    EXPECT_EQ(bob.node->approve_exec(), CommandResult::NothingPending);
    drain(io);

    EXPECT_TRUE(bob.runner->commands.empty());
    EXPECT_TRUE(alice.events.exec_results.empty());
}

TEST_F(NodeTest, ExecRequestNeedsDirectTarget) {
    connect_peers(io, alice, bob);
    auto link = alice.link_to(bob);

    EXPECT_EQ(alice.node->request_exec("ls"), CommandResult::NoDirectTarget);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    EXPECT_EQ(alice.node->request_exec(""), CommandResult::EmptyMessage);
    drain(io);

    EXPECT_EQ(count_type(*link, MessageType::ExecRequest), 0u);
}

TEST_F(NodeTest, ResultForDepartedRequesterBecomesNotice) {
    connect_peers(io, alice, bob);
    alice.node->set_active_target(ActiveTarget::peer(bob.id));
    alice.node->request_exec("date");
    drain(io);

    alice.link_to(bob)->close();
    drain(io);
    EXPECT_EQ(bob.node->approve_exec(), CommandResult::Ok);
    drain(io);

    EXPECT_EQ(bob.runner->commands.size(), 1u);
    EXPECT_TRUE(bob.events.has_notice("output of 'date' discarded"));
}

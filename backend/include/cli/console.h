#pragma once

#include <asio.hpp>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

#include "events/node_observer.h"
#include "node/node.h"

/**
 * Line-oriented terminal front end.
 *
 * run() reads stdin on the calling thread and posts each line to the
 * node's io_context, where execute() interprets it. Observer callbacks
 * arrive on the io_context thread and print to the same stream.
 */
class Console : public NodeObserver {
public:
    Console(asio::io_context& io, Node& node, std::ostream& out);
    ~Console() override;

    /// Read commands until /quit or end of input. Blocks.
    void run(std::istream& in);

    /// Interpret one input line. Must run on the io_context thread.
    /// Returns false for /quit.
    bool execute(const std::string& line);

    void on_registry_changed(const std::vector<DiscoveredPeer>& peers) override;
    void on_connections_changed(const std::vector<SessionInfo>& sessions) override;
    void on_active_target_changed(const ActiveTarget& target) override;
    void on_chat_received(const ChatMessage& message) override;
    void on_nudge_received(const std::string& from_name) override;
    void on_game_updated(const GameSnapshot& game) override;
    void on_exec_request(const PendingCommandRequest& request) override;
    void on_exec_result(const ExecResult& result) override;
    void on_file_received(const ReceivedFile& file) override;
    void on_notice(const Notice& notice) override;

private:
    void print(const std::string& text);
    void report(CommandResult result);

    void list_peers();
    void list_sessions();
    void connect(const std::string& arg);
    void target(const std::string& arg);
    void move(const std::string& arg);
    void show_board(const GameSnapshot& game);
    void help();

    /// Resolve "2" (1-based index) or an id prefix against @p ids.
    static std::string resolve(const std::string& arg, const std::vector<std::string>& ids);

    asio::io_context& io_;
    Node& node_;
    std::ostream& out_;
    std::mutex out_mutex_;
};

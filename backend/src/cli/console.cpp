/**
 * Console — stdin commands in, engine events out.
 */

#include "cli/console.h"

#include <cctype>
#include <future>
#include <istream>
#include <ostream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

char cell_char(Mark mark, std::size_t index) {
    if (mark == Mark::X) return 'X';
    if (mark == Mark::O) return 'O';
    return static_cast<char>('0' + index);
}

} // namespace

Console::Console(asio::io_context& io, Node& node, std::ostream& out)
    : io_(io), node_(node), out_(out) {
    node_.subscribe(this);
}

Console::~Console() {
    node_.unsubscribe(this);
}

void Console::run(std::istream& in) {
    help();
    std::string line;
    while (std::getline(in, line)) {
        std::promise<bool> keep_going;
        auto result = keep_going.get_future();
        asio::post(io_, [this, &keep_going, line] { keep_going.set_value(execute(line)); });
        if (!result.get()) break;
    }
}

bool Console::execute(const std::string& raw) {
    const std::string line = trim(raw);
    if (line.empty()) return true;

    if (line[0] != '/') {
        report(node_.send_chat(line));
        return true;
    }

    const auto space = line.find(' ');
    const std::string command = line.substr(0, space);
    const std::string arg = space == std::string::npos ? std::string() : trim(line.substr(space + 1));

    if (command == "/quit" || command == "/exit") return false;
    if (command == "/help") help();
    else if (command == "/peers") list_peers();
    else if (command == "/chats") list_sessions();
    else if (command == "/connect") connect(arg);
    else if (command == "/target" || command == "/dm") target(arg);
    else if (command == "/all") report(node_.set_active_target(ActiveTarget::broadcast()));
    else if (command == "/send") report(node_.send_file(arg));
    else if (command == "/nudge") report(node_.send_nudge());
    else if (command == "/play") report(node_.invite_game());
    else if (command == "/accept") report(node_.accept_game());
    else if (command == "/move") move(arg);
    else if (command == "/board") show_board(node_.game().snapshot());
    else if (command == "/exec") report(node_.request_exec(arg));
    else if (command == "/approve") report(node_.approve_exec());
    else if (command == "/deny") report(node_.deny_exec());
    else print(fmt::format("Unknown command {}. Type /help", command));
    return true;
}

void Console::report(CommandResult result) {
    // Redirected already produced a notice.
    if (result == CommandResult::Ok || result == CommandResult::Redirected) return;
    print(fmt::format("! {}", to_string(result)));
}

void Console::list_peers() {
    const auto peers = node_.registry().list();
    if (peers.empty()) {
        print("No peers discovered yet.");
        return;
    }
    std::string text = "Discovered peers:";
    int index = 1;
    for (const auto& peer : peers) {
        const bool connected = node_.connections().is_connected(peer.peer_id);
        text += fmt::format("\n  {}. {} ({}) {}:{}{}", index++, peer.name, peer.device,
                            peer.address, peer.port, connected ? " [connected]" : "");
    }
    print(text);
}

void Console::list_sessions() {
    const auto sessions = node_.connections().sessions();
    const auto& target = node_.connections().active_target();
    std::string text = fmt::format("{} All{}", target.is_broadcast() ? '*' : ' ', " (broadcast)");
    int index = 1;
    for (const auto& session : sessions) {
        text += fmt::format("\n{} {}. {} ({})", target.peer_id == session.peer_id ? '*' : ' ',
                            index++, session.name, session.device);
    }
    print(text);
}

void Console::connect(const std::string& arg) {
    std::vector<std::string> ids;
    for (const auto& peer : node_.registry().list()) ids.push_back(peer.peer_id);
    const std::string id = resolve(arg, ids);
    if (id.empty()) {
        report(CommandResult::UnknownPeer);
        return;
    }
    report(node_.connect(id));
}

void Console::target(const std::string& arg) {
    if (arg.empty() || arg == "all") {
        report(node_.set_active_target(ActiveTarget::broadcast()));
        return;
    }
    std::vector<std::string> ids;
    for (const auto& session : node_.connections().sessions()) ids.push_back(session.peer_id);
    const std::string id = resolve(arg, ids);
    if (id.empty()) {
        report(CommandResult::PeerNotConnected);
        return;
    }
    report(node_.set_active_target(ActiveTarget::peer(id)));
}

void Console::move(const std::string& arg) {
    if (arg.size() != 1 || !std::isdigit(static_cast<unsigned char>(arg[0]))) {
        report(CommandResult::InvalidMove);
        return;
    }
    report(node_.move(static_cast<std::size_t>(arg[0] - '0')));
}

std::string Console::resolve(const std::string& arg, const std::vector<std::string>& ids) {
    if (arg.empty()) return {};

    bool numeric = true;
    for (char c : arg) numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
    if (numeric && arg.size() < 4) {
        const auto index = std::stoul(arg);
        if (index >= 1 && index <= ids.size()) return ids[index - 1];
    }

    std::string match;
    for (const auto& id : ids) {
        if (id == arg) return id;
        if (id.compare(0, arg.size(), arg) == 0) {
            if (!match.empty()) return {};  // ambiguous prefix
            match = id;
        }
    }
    return match;
}

void Console::show_board(const GameSnapshot& game) {
    if (game.phase == GamePhase::Idle) {
        print("No game. /play to invite, /accept to start.");
        return;
    }
    std::string text;
    for (std::size_t row = 0; row < 3; ++row) {
        const std::size_t i = row * 3;
        text += fmt::format(" {} | {} | {}\n", cell_char(game.board[i], i),
                            cell_char(game.board[i + 1], i + 1), cell_char(game.board[i + 2], i + 2));
        if (row < 2) text += "---+---+---\n";
    }
    if (game.phase == GamePhase::Over) {
        text += game.result == GameResult::None
                    ? std::string("Game over.")
                    : game.result == GameResult::Draw ? std::string("Draw.")
                                                      : fmt::format("{} wins.", to_string(game.result));
    } else if (game.turn == game.local_role) {
        text += fmt::format("Your move ({}). /move <0-8>", to_string(game.local_role));
    } else {
        text += fmt::format("Waiting for opponent ({}).", to_string(game.turn));
    }
    print(text);
}

void Console::help() {
    print("Commands:\n"
          "  /peers              discovered peers\n"
          "  /connect <n|id>     connect to a discovered peer\n"
          "  /chats              connected peers and the current target\n"
          "  /target <n|id|all>  chat with one peer (/dm) or everyone (/all)\n"
          "  /send <path>        send a file to the current peer\n"
          "  /nudge              nudge the current target\n"
          "  /play  /accept      invite to / start tic-tac-toe\n"
          "  /move <0-8>  /board\n"
          "  /exec <command>     ask the current peer to run a command\n"
          "  /approve  /deny     answer a pending command request\n"
          "  /quit\n"
          "Anything else is sent as a chat message.");
}

void Console::print(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << std::endl;
}

void Console::on_registry_changed(const std::vector<DiscoveredPeer>& peers) {
    spdlog::debug("{} peer(s) discovered", peers.size());
}

void Console::on_connections_changed(const std::vector<SessionInfo>& sessions) {
    print(fmt::format("[{} connected]", sessions.size()));
}

void Console::on_active_target_changed(const ActiveTarget& target) {
    if (target.is_broadcast()) {
        print("Now chatting with everyone.");
        return;
    }
    auto session = node_.connections().session(target.peer_id);
    print(fmt::format("Now chatting with {}.", session ? session->name : target.peer_id));
}

void Console::on_chat_received(const ChatMessage& message) {
    print(fmt::format("{}{}: {}", message.direct ? "[PM] " : "", message.from_name, message.text));
}

void Console::on_nudge_received(const std::string& from_name) {
    print(fmt::format("\a*** {} nudged you! ***", from_name));
}

void Console::on_game_updated(const GameSnapshot& game) {
    show_board(game);
}

void Console::on_exec_request(const PendingCommandRequest& /*request*/) {
    // The consent flow's notice already asks for /approve.
}

void Console::on_exec_result(const ExecResult& result) {
    print(fmt::format("--- {} ran '{}' (exit {}) ---\n{}", result.from_name, result.command,
                      result.exit_code, result.output));
}

void Console::on_file_received(const ReceivedFile& file) {
    spdlog::debug("Received {} bytes into {}", file.bytes, file.path);
}

void Console::on_notice(const Notice& notice) {
    switch (notice.level) {
    case NoticeLevel::Info:    print(fmt::format("* {}", notice.text)); break;
    case NoticeLevel::Warning: print(fmt::format("! {}", notice.text)); break;
    case NoticeLevel::Error:   print(fmt::format("!! {}", notice.text)); break;
    }
}

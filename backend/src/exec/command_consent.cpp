/**
 * CommandConsent — exec-request / approve / exec-result.
 */

#include "exec/command_consent.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

CommandConsent::CommandConsent(const Identity& identity,
                               ConnectionManager& connections,
                               CommandRunner& runner,
                               ObserverHub& hub)
    : identity_(identity), connections_(connections), runner_(runner), hub_(hub) {}

CommandResult CommandConsent::request(const std::string& command) {
    if (command.empty()) return CommandResult::EmptyMessage;
    auto target = connections_.direct_target();
    if (!target) return CommandResult::NoDirectTarget;

    ControlMessage message;
    message.type = MessageType::ExecRequest;
    message.payload["fromId"] = identity_.id;
    message.payload["fromName"] = identity_.username;
    message.payload["command"] = command;
    if (!connections_.send_to(*target, message)) return CommandResult::PeerNotConnected;

    hub_.notice(NoticeLevel::Info, fmt::format("Asked peer to run: {}", command));
    return CommandResult::Ok;
}

CommandResult CommandConsent::approve() {
    if (!pending_) {
        hub_.notice(NoticeLevel::Info, "Nothing pending to approve.");
        return CommandResult::NothingPending;
    }

    const PendingCommandRequest request = std::move(*pending_);
    pending_.reset();

    hub_.notice(NoticeLevel::Info,
                fmt::format("Running '{}' for {}", request.command, request.requester_name));

    runner_.run(request.command, [this, request](CommandOutput result) {
        ControlMessage message;
        message.type = MessageType::ExecResult;
        message.payload["fromId"] = identity_.id;
        message.payload["fromName"] = identity_.username;
        message.payload["command"] = request.command;
        message.payload["output"] = result.output;
        message.payload["exitCode"] = result.exit_code;

        if (!connections_.send_to(request.requester_id, message)) {
            hub_.notice(NoticeLevel::Warning,
                        fmt::format("{} disconnected; output of '{}' discarded",
                                    request.requester_name, request.command));
            return;
        }
        spdlog::info("Sent output of '{}' (exit {}) to {}", request.command, result.exit_code,
                     request.requester_name);
    });
    return CommandResult::Ok;
}

CommandResult CommandConsent::deny() {
    if (!pending_) return CommandResult::NothingPending;
    hub_.notice(NoticeLevel::Info, fmt::format("Ignored request from {}", pending_->requester_name));
    pending_.reset();
    return CommandResult::Ok;
}

void CommandConsent::on_request(const SessionInfo& from, const nlohmann::json& payload) {
    const std::string command = string_field(payload, "command");
    if (command.empty()) {
        spdlog::warn("Dropping exec-request without a command from {}", from.name);
        return;
    }
    if (pending_) {
        spdlog::info("Exec request from {} replaces unapproved one from {}", from.name,
                     pending_->requester_name);
    }

    pending_ = PendingCommandRequest{from.peer_id, from.name, command};
    hub_.notice(NoticeLevel::Warning,
                fmt::format("{} wants to run: {}  (type /approve to allow)", from.name, command));
    hub_.exec_request(*pending_);
}

void CommandConsent::on_result(const SessionInfo& from, const nlohmann::json& payload) {
    ExecResult result;
    result.from_id = from.peer_id;
    result.from_name = from.name;
    result.command = string_field(payload, "command");
    result.output = string_field(payload, "output");
    result.exit_code = static_cast<int>(int_field(payload, "exitCode").value_or(0));
    hub_.exec_result(result);
}

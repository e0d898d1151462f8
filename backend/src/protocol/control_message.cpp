/**
 * ControlMessage — message type names and tolerant payload accessors.
 */

#include "protocol/control_message.h"

#include <array>
#include <utility>

namespace {

const std::array<std::pair<MessageType, const char*>, 10> kTypeNames = {{
    {MessageType::Pair,        "pair"},
    {MessageType::Chat,        "msg"},
    {MessageType::FileOffer,   "file-offer"},
    {MessageType::FileEnd,     "file-end"},
    {MessageType::GameInvite,  "game-invite"},
    {MessageType::GameStart,   "game-start"},
    {MessageType::GameMove,    "game-move"},
    {MessageType::ExecRequest, "exec-request"},
    {MessageType::ExecResult,  "exec-result"},
    {MessageType::Nudge,       "nudge"},
}};

} // namespace

const char* to_string(MessageType type) {
    for (const auto& [value, name] : kTypeNames) {
        if (value == type) return name;
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(std::string_view name) {
    for (const auto& [value, wire_name] : kTypeNames) {
        if (name == wire_name) return value;
    }
    return std::nullopt;
}

std::string string_field(const nlohmann::json& payload, const char* key) {
    if (!payload.is_object()) return {};
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool bool_field(const nlohmann::json& payload, const char* key) {
    if (!payload.is_object()) return false;
    auto it = payload.find(key);
    return it != payload.end() && it->is_boolean() && it->get<bool>();
}

std::optional<std::int64_t> int_field(const nlohmann::json& payload, const char* key) {
    if (!payload.is_object()) return std::nullopt;
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<std::int64_t>();
}

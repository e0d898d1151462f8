#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

/**
 * Kinds of JSON control messages exchanged over a session.
 *
 * The wire names ("pair", "msg", "file-offer", ...) are fixed by the
 * protocol and must not change.
 */
enum class MessageType {
    Pair,
    Chat,
    FileOffer,
    FileEnd,
    GameInvite,
    GameStart,
    GameMove,
    ExecRequest,
    ExecResult,
    Nudge,
};

/// Wire name of a message type.
const char* to_string(MessageType type);

/// Parse a wire name. Unknown names yield std::nullopt.
std::optional<MessageType> message_type_from_string(std::string_view name);

/**
 * A decoded `{type, payload}` control record.
 */
struct ControlMessage {
    MessageType    type = MessageType::Chat;
    nlohmann::json payload = nlohmann::json::object();
};

// Payload accessors. A missing field or a field of the wrong JSON type
// reads as the fallback, so handlers never throw on hostile input.
std::string string_field(const nlohmann::json& payload, const char* key);
bool bool_field(const nlohmann::json& payload, const char* key);
std::optional<std::int64_t> int_field(const nlohmann::json& payload, const char* key);

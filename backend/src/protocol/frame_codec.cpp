/**
 * FrameCodec — JSON control messages and length-prefixed binary chunk frames.
 */

#include "protocol/frame_codec.h"

using json = nlohmann::json;

namespace {

// Payloads may carry raw command output or foreign filenames; invalid
// UTF-8 becomes U+FFFD instead of throwing.
std::string dump_lenient(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

void write_u32_be(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint32_t read_u32_be(const std::uint8_t* in) {
    return (static_cast<std::uint32_t>(in[0]) << 24) |
           (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) |
           static_cast<std::uint32_t>(in[3]);
}

std::string FrameCodec::encode_control(const ControlMessage& message) {
    json j;
    j["type"] = to_string(message.type);
    j["payload"] = message.payload.is_object() ? message.payload : json::object();
    return dump_lenient(j);
}

std::optional<ControlMessage> FrameCodec::decode_control(std::string_view text) {
    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) return std::nullopt;

    auto type = message_type_from_string(type_it->get<std::string>());
    if (!type) return std::nullopt;

    ControlMessage message;
    message.type = *type;

    auto payload_it = j.find("payload");
    if (payload_it != j.end()) {
        if (!payload_it->is_object()) return std::nullopt;
        message.payload = std::move(*payload_it);
    }
    return message;
}

Bytes FrameCodec::encode_chunk(const std::string& file_id,
                               const std::uint8_t* data,
                               std::size_t size) {
    json header = json::object();
    header["fileId"] = file_id;
    const std::string header_text = dump_lenient(header);

    Bytes frame;
    frame.reserve(kLengthPrefixSize + header_text.size() + size);
    write_u32_be(frame, static_cast<std::uint32_t>(header_text.size()));
    frame.insert(frame.end(), header_text.begin(), header_text.end());
    if (size > 0) frame.insert(frame.end(), data, data + size);
    return frame;
}

std::optional<ChunkFrame> FrameCodec::decode_chunk(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size < kLengthPrefixSize) return std::nullopt;

    const std::uint32_t header_len = read_u32_be(data);
    if (header_len > size - kLengthPrefixSize) return std::nullopt;

    const char* header_begin = reinterpret_cast<const char*>(data + kLengthPrefixSize);
    json header = json::parse(header_begin, header_begin + header_len, nullptr, false);
    if (header.is_discarded() || !header.is_object()) return std::nullopt;

    auto id_it = header.find("fileId");
    if (id_it == header.end() || !id_it->is_string()) return std::nullopt;

    ChunkFrame frame;
    frame.file_id = id_it->get<std::string>();
    frame.data.assign(data + kLengthPrefixSize + header_len, data + size);
    return frame;
}

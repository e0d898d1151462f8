#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "protocol/control_message.h"

using Bytes = std::vector<std::uint8_t>;

/**
 * One decoded binary chunk frame.
 */
struct ChunkFrame {
    std::string file_id;
    Bytes       data;
};

/**
 * Encodes and decodes the two message shapes carried by a session.
 *
 * Control messages are JSON text: {"type": "...", "payload": {...}}.
 *
 * Binary chunk frames are laid out as
 *   [u32 big-endian N][N bytes JSON header {"fileId": "..."}][raw chunk]
 *
 * Each transport message carries exactly one complete control message or
 * one complete frame; nothing is reassembled across messages.
 */
class FrameCodec {
public:
    static std::string encode_control(const ControlMessage& message);

    /// Returns std::nullopt for invalid JSON, an unknown type or a non-object payload.
    static std::optional<ControlMessage> decode_control(std::string_view text);

    static Bytes encode_chunk(const std::string& file_id,
                              const std::uint8_t* data,
                              std::size_t size);

    static Bytes encode_chunk(const std::string& file_id, const Bytes& chunk) {
        return encode_chunk(file_id, chunk.data(), chunk.size());
    }

    /// Returns std::nullopt when the declared header length overruns the
    /// buffer or the header is not an object with a string "fileId".
    static std::optional<ChunkFrame> decode_chunk(const std::uint8_t* data, std::size_t size);

    static std::optional<ChunkFrame> decode_chunk(const Bytes& frame) {
        return decode_chunk(frame.data(), frame.size());
    }

    static constexpr std::size_t kLengthPrefixSize = 4;
};

// Big-endian helpers shared with the TCP record layer.
void write_u32_be(Bytes& out, std::uint32_t value);
std::uint32_t read_u32_be(const std::uint8_t* in);

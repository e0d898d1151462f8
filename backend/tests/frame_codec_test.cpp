#include <gtest/gtest.h>

#include "protocol/frame_codec.h"

namespace {

Bytes pattern(std::size_t size) {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) out[i] = static_cast<std::uint8_t>(i * 31 + 7);
    return out;
}

} // namespace

TEST(FrameCodec, ChunkRoundTripsForEmptySingleAndFullChunks) {
    for (std::size_t size : {std::size_t(0), std::size_t(1), std::size_t(16384)}) {
        const Bytes chunk = pattern(size);
        const Bytes frame = FrameCodec::encode_chunk("abc", chunk);

        auto decoded = FrameCodec::decode_chunk(frame);
        ASSERT_TRUE(decoded.has_value()) << "size " << size;
        EXPECT_EQ(decoded->file_id, "abc");
        EXPECT_EQ(decoded->data, chunk) << "size " << size;
    }
}

TEST(FrameCodec, ChunkHeaderIsBigEndianLengthThenJson) {
    const Bytes frame = FrameCodec::encode_chunk("abc", Bytes{0xFF});
    const std::string header = R"({"fileId":"abc"})";

    ASSERT_EQ(frame.size(), 4 + header.size() + 1);
    EXPECT_EQ(read_u32_be(frame.data()), header.size());
    EXPECT_EQ(std::string(frame.begin() + 4, frame.begin() + 4 + header.size()), header);
    EXPECT_EQ(frame.back(), 0xFF);
}

TEST(FrameCodec, RejectsHeaderLengthBeyondBuffer) {
    Bytes frame;
    write_u32_be(frame, 100);
    const std::string header = R"({"fileId":"abc"})";
    frame.insert(frame.end(), header.begin(), header.end());

    EXPECT_FALSE(FrameCodec::decode_chunk(frame).has_value());
}

TEST(FrameCodec, RejectsTruncatedPrefix) {
    EXPECT_FALSE(FrameCodec::decode_chunk(Bytes{0x00, 0x00, 0x01}).has_value());
    EXPECT_FALSE(FrameCodec::decode_chunk(Bytes{}).has_value());
}

TEST(FrameCodec, RejectsHeaderWithoutStringFileId) {
    for (const std::string header : {std::string("not json"), std::string("[1,2]"),
                                     std::string(R"({"fileId":7})"), std::string(R"({"id":"abc"})")}) {
        Bytes frame;
        write_u32_be(frame, static_cast<std::uint32_t>(header.size()));
        frame.insert(frame.end(), header.begin(), header.end());
        EXPECT_FALSE(FrameCodec::decode_chunk(frame).has_value()) << header;
    }
}

TEST(FrameCodec, ControlMessageRoundTrip) {
    ControlMessage message;
    message.type = MessageType::FileOffer;
    message.payload["fileId"] = "f1";
    message.payload["size"] = 42;

    const std::string text = FrameCodec::encode_control(message);
    auto decoded = FrameCodec::decode_control(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::FileOffer);
    EXPECT_EQ(decoded->payload, message.payload);

    auto raw = nlohmann::json::parse(text);
    EXPECT_EQ(raw["type"], "file-offer");
}

TEST(FrameCodec, InvalidUtf8IsReplacedInsteadOfThrowing) {
    ControlMessage message;
    message.type = MessageType::ExecResult;
    message.payload["output"] = "\xff\xfe binary output";

    std::string text;
    ASSERT_NO_THROW(text = FrameCodec::encode_control(message));
    auto decoded = FrameCodec::decode_control(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(string_field(decoded->payload, "output"), "\xEF\xBF\xBD\xEF\xBF\xBD binary output");
}

TEST(FrameCodec, ControlMessageWithoutPayloadGetsEmptyObject) {
    auto decoded = FrameCodec::decode_control(R"({"type":"nudge"})");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::Nudge);
    EXPECT_TRUE(decoded->payload.is_object());
    EXPECT_TRUE(decoded->payload.empty());
}

TEST(FrameCodec, MalformedControlMessagesAreRejected) {
    EXPECT_FALSE(FrameCodec::decode_control("{not json").has_value());
    EXPECT_FALSE(FrameCodec::decode_control("[]").has_value());
    EXPECT_FALSE(FrameCodec::decode_control(R"({"payload":{}})").has_value());
    EXPECT_FALSE(FrameCodec::decode_control(R"({"type":"teleport","payload":{}})").has_value());
    EXPECT_FALSE(FrameCodec::decode_control(R"({"type":"msg","payload":"hi"})").has_value());
    EXPECT_FALSE(FrameCodec::decode_control(R"({"type":3})").has_value());
}

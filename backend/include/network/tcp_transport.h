#pragma once

#include <asio.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "network/transport.h"

/**
 * Transport over a TCP socket using standalone ASIO.
 *
 * Every message is sent as a record:
 *
 *   [u8 kind][u32 big-endian length][payload]
 *
 * kind is 0x1 text, 0x2 binary, 0x9 ping, 0xA pong. Records larger than
 * kMaxRecordSize close the connection.
 */
class TcpTransport : public Transport,
                     public std::enable_shared_from_this<TcpTransport> {
public:
    enum class RecordKind : std::uint8_t {
        Text   = 0x1,
        Binary = 0x2,
        Ping   = 0x9,
        Pong   = 0xA,
    };

    static constexpr std::size_t   kHeaderSize = 5;
    static constexpr std::uint32_t kMaxRecordSize = 16 * 1024 * 1024;

    static std::shared_ptr<TcpTransport> create(asio::ip::tcp::socket socket);

    void start(TransportHandlers handlers) override;
    void send_text(std::string text, WriteHandler on_written = {}) override;
    void send_binary(Bytes data, WriteHandler on_written = {}) override;
    void ping() override;
    void close() override;

    [[nodiscard]] bool is_open() const override { return !closed_; }
    [[nodiscard]] std::string remote_address() const override { return remote_; }

private:
    explicit TcpTransport(asio::ip::tcp::socket socket);

    struct Outgoing {
        Bytes        record;
        WriteHandler on_written;
    };

    void enqueue(RecordKind kind, const std::uint8_t* data, std::size_t size, WriteHandler on_written);
    void do_write();
    void read_header();
    void read_body(RecordKind kind, std::uint32_t length);
    void dispatch(RecordKind kind);
    void fail(const std::error_code& reason);

    asio::ip::tcp::socket socket_;
    std::string remote_;
    TransportHandlers handlers_;

    std::array<std::uint8_t, kHeaderSize> header_{};
    Bytes body_;

    std::deque<Outgoing> queue_;
    bool writing_ = false;
    bool closed_ = false;
};

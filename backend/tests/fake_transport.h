#pragma once

#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "exec/command_runner.h"
#include "network/transport.h"

/**
 * In-memory Transport. Either standalone (sends are only recorded) or one
 * end of a linked pair (sends are also delivered to the other end).
 * Every delivery and completion is posted to the io_context, as a real
 * socket would.
 */
class FakeTransport : public Transport, public std::enable_shared_from_this<FakeTransport> {
public:
    FakeTransport(asio::io_context& io, std::string address);

    static std::pair<std::shared_ptr<FakeTransport>, std::shared_ptr<FakeTransport>>
    make_pair(asio::io_context& io, const std::string& a_address, const std::string& b_address);

    void start(TransportHandlers handlers) override;
    void send_text(std::string text, WriteHandler on_written = {}) override;
    void send_binary(Bytes data, WriteHandler on_written = {}) override;
    void ping() override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return !closed_; }
    [[nodiscard]] std::string remote_address() const override { return address_; }

    /// Inject an inbound text message as if the remote side sent it.
    void deliver_text(const std::string& text);
    void deliver_binary(const Bytes& data);

    /// The remote side hung up.
    void remote_close();

    std::vector<std::string> sent_text;
    std::vector<Bytes>       sent_binary;
    int  pings = 0;
    bool answers_pings = true;  // whether pings come back as pongs
    bool fail_writes = false;   // sends complete with broken_pipe and go nowhere

private:
    void complete(WriteHandler on_written, const std::error_code& ec);
    void finish(const std::error_code& reason);

    asio::io_context& io_;
    std::string address_;
    std::weak_ptr<FakeTransport> peer_;
    TransportHandlers handlers_;
    bool started_ = false;
    bool closed_ = false;
    std::vector<std::function<void()>> backlog_;  // inbound before start()
};

/**
 * Dialer that connects to in-process routes instead of sockets.
 */
class FakeDialer : public Dialer {
public:
    using Acceptor = std::function<void(std::shared_ptr<Transport> remote_end)>;

    explicit FakeDialer(asio::io_context& io) : io_(io) {}

    /// Connections to address:port hand their far end to @p acceptor.
    void route(const std::string& address, std::uint16_t port, Acceptor acceptor);

    void dial(const std::string& address,
              std::uint16_t port,
              std::chrono::milliseconds timeout,
              ConnectHandler handler) override;

    /// Local ends of every successful dial, in order.
    std::vector<std::shared_ptr<FakeTransport>> dialed;

private:
    asio::io_context& io_;
    std::map<std::string, Acceptor> routes_;
};

/**
 * CommandRunner that records commands and answers with a canned result.
 */
class FakeRunner : public CommandRunner {
public:
    explicit FakeRunner(asio::io_context& io) : io_(io) {}

    void run(const std::string& command, Completion on_done) override;

    std::vector<std::string> commands;
    CommandOutput reply{"ok\n", 0};

private:
    asio::io_context& io_;
};

/// Run every ready handler, including ones posted while running.
void drain(asio::io_context& io);

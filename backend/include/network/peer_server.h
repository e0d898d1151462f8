#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "network/transport.h"

/**
 * Async TCP server that accepts peer connections.
 */
class PeerServer {
public:
    using AcceptCallback = std::function<void(std::shared_ptr<Transport> transport)>;

    /// Binds immediately. Throws asio::system_error if the port is taken.
    PeerServer(asio::io_context& io, const std::string& bind_address, uint16_t port);

    void start();
    void stop();

    /// Set the callback invoked for every accepted connection.
    void set_on_accept(AcceptCallback cb);

    [[nodiscard]] uint16_t port() const { return port_; }

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    AcceptCallback on_accept_;
    uint16_t port_ = 0;
    bool running_ = false;
};

/**
 * PeerServer — Listens for incoming TCP connections from other peers.
 *
 * Uses standalone ASIO for async I/O. Each accepted socket is wrapped in
 * a TcpTransport and handed to the connection manager, which waits for
 * the peer's pairing message.
 */

#include "network/peer_server.h"

#include <spdlog/spdlog.h>

#include "network/tcp_transport.h"

PeerServer::PeerServer(asio::io_context& io, const std::string& bind_address, uint16_t port)
    : acceptor_(io) {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bind_address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

void PeerServer::start() {
    if (running_) return;
    running_ = true;
    spdlog::info("Listening for peers on port {}", port_);
    do_accept();
}

void PeerServer::stop() {
    running_ = false;
    std::error_code ignored;
    acceptor_.close(ignored);
}

void PeerServer::set_on_accept(AcceptCallback cb) {
    on_accept_ = std::move(cb);
}

void PeerServer::do_accept() {
    acceptor_.async_accept([this](const std::error_code& ec, asio::ip::tcp::socket socket) {
        if (!running_) return;
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("Accept failed: {}", ec.message());
            }
        } else {
            auto transport = TcpTransport::create(std::move(socket));
            spdlog::debug("Accepted connection from {}", transport->remote_address());
            if (on_accept_) on_accept_(transport);
        }
        if (running_) do_accept();
    });
}

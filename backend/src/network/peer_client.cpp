/**
 * PeerClient — Connects to a remote peer.
 *
 * Opens a TCP connection to the address a peer announced and races it
 * against a timer. A timed-out attempt is closed and reported; the caller
 * decides whether to try again.
 */

#include "network/peer_client.h"

#include <spdlog/spdlog.h>

#include "network/tcp_transport.h"

namespace {

struct ConnectAttempt {
    explicit ConnectAttempt(asio::io_context& io) : socket(io), timer(io) {}

    asio::ip::tcp::socket socket;
    asio::steady_timer    timer;
    bool                  timed_out = false;
};

} // namespace

PeerClient::PeerClient(asio::io_context& io)
    : io_(io) {}

void PeerClient::dial(const std::string& address,
                      std::uint16_t port,
                      std::chrono::milliseconds timeout,
                      ConnectHandler handler) {
    std::error_code ec;
    const auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        asio::post(io_, [handler = std::move(handler), ec] { handler(ec, nullptr); });
        return;
    }

    auto attempt = std::make_shared<ConnectAttempt>(io_);
    const asio::ip::tcp::endpoint endpoint(ip, port);

    attempt->timer.expires_after(timeout);
    attempt->timer.async_wait([attempt](const std::error_code& timer_ec) {
        if (timer_ec) return;  // cancelled: the connect finished first
        attempt->timed_out = true;
        std::error_code ignored;
        attempt->socket.close(ignored);
    });

    spdlog::debug("Dialing {}:{}", address, port);
    attempt->socket.async_connect(endpoint,
        [attempt, handler = std::move(handler)](const std::error_code& connect_ec) {
            attempt->timer.cancel();
            if (attempt->timed_out) {
                handler(asio::error::timed_out, nullptr);
                return;
            }
            if (connect_ec) {
                handler(connect_ec, nullptr);
                return;
            }
            handler({}, TcpTransport::create(std::move(attempt->socket)));
        });
}

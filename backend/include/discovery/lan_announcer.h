#pragma once

#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <string>

#include "discovery/discovery_adapter.h"
#include "node/identity.h"

/**
 * UDP broadcast discovery.
 *
 * Every interval the node broadcasts a small JSON datagram
 *
 *   {"service": "...", "id": "...", "name": "...", "device": "...", "port": 9123}
 *
 * on the discovery port and listens on the same port for everyone
 * else's. On shutdown it broadcasts the same record with "bye": true.
 * The sender's source address becomes the peer's dial address.
 */
class LanAnnouncer {
public:
    LanAnnouncer(asio::io_context& io,
                 const Identity& identity,
                 DiscoveryAdapter& adapter,
                 std::string service,
                 uint16_t discovery_port,
                 std::chrono::milliseconds interval);

    /// Start announcing @p session_port. Returns false if the socket could not be bound.
    bool start(uint16_t session_port);
    void stop();

private:
    std::string datagram(bool bye) const;
    void schedule_announce();
    void announce();
    void receive();
    void handle_datagram(const std::string& text, const asio::ip::address& sender);

    const Identity& identity_;
    DiscoveryAdapter& adapter_;
    std::string service_;
    uint16_t discovery_port_;
    std::chrono::milliseconds interval_;
    uint16_t session_port_ = 0;

    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;
    asio::ip::udp::endpoint sender_;
    std::array<char, 2048> buffer_{};
    bool running_ = false;
};

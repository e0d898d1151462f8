#pragma once

#include <asio.hpp>
#include <string>
#include <cstdint>

#include "network/transport.h"

/**
 * Opens TCP connections to remote peers with a connect timeout.
 */
class PeerClient : public Dialer {
public:
    explicit PeerClient(asio::io_context& io);

    void dial(const std::string& address,
              std::uint16_t port,
              std::chrono::milliseconds timeout,
              ConnectHandler handler) override;

private:
    asio::io_context& io_;
};

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "protocol/frame_codec.h"

/// Completion of a queued send. A non-zero code means the bytes never left.
using WriteHandler = std::function<void(const std::error_code&)>;

/**
 * Receive-side callbacks for one transport. All of them run on the
 * node's event loop.
 */
struct TransportHandlers {
    std::function<void(std::string text)> on_text;
    std::function<void(Bytes data)>       on_binary;
    std::function<void()>                 on_pong;

    /// Fired exactly once, for local and remote closes alike.
    std::function<void(const std::error_code& reason)> on_closed;
};

/**
 * A bidirectional, ordered message channel to one remote peer.
 *
 * Carries text messages, binary messages and an application-level
 * ping/pong. The receiving side answers pings by itself.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /// Begin delivering inbound messages to @p handlers.
    virtual void start(TransportHandlers handlers) = 0;

    virtual void send_text(std::string text, WriteHandler on_written = {}) = 0;
    virtual void send_binary(Bytes data, WriteHandler on_written = {}) = 0;

    /// Send a heartbeat probe. The reply arrives through on_pong.
    virtual void ping() = 0;

    /// Close asynchronously. on_closed fires afterwards.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
    [[nodiscard]] virtual std::string remote_address() const = 0;
};

/**
 * Opens outbound transports.
 */
class Dialer {
public:
    using ConnectHandler =
        std::function<void(const std::error_code& ec, std::shared_ptr<Transport> transport)>;

    virtual ~Dialer() = default;

    /// Connect to address:port. Gives up after @p timeout; no retries.
    virtual void dial(const std::string& address,
                      std::uint16_t port,
                      std::chrono::milliseconds timeout,
                      ConnectHandler handler) = 0;
};

/**
 * TcpTransport — one peer connection over TCP.
 *
 * Reads length-prefixed records off the socket and hands complete
 * messages to the owner. Writes are queued and issued one at a time so
 * records never interleave. Pings are answered here.
 */

#include "network/tcp_transport.h"

#include <spdlog/spdlog.h>

std::shared_ptr<TcpTransport> TcpTransport::create(asio::ip::tcp::socket socket) {
    return std::shared_ptr<TcpTransport>(new TcpTransport(std::move(socket)));
}

TcpTransport::TcpTransport(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)) {
    std::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("?") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

void TcpTransport::start(TransportHandlers handlers) {
    handlers_ = std::move(handlers);
    read_header();
}

void TcpTransport::send_text(std::string text, WriteHandler on_written) {
    enqueue(RecordKind::Text, reinterpret_cast<const std::uint8_t*>(text.data()), text.size(),
            std::move(on_written));
}

void TcpTransport::send_binary(Bytes data, WriteHandler on_written) {
    enqueue(RecordKind::Binary, data.data(), data.size(), std::move(on_written));
}

void TcpTransport::ping() {
    enqueue(RecordKind::Ping, nullptr, 0, {});
}

void TcpTransport::close() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self] { self->fail({}); });
}

void TcpTransport::enqueue(RecordKind kind, const std::uint8_t* data, std::size_t size,
                           WriteHandler on_written) {
    if (closed_) {
        if (on_written) {
            asio::post(socket_.get_executor(), [on_written = std::move(on_written)] {
                on_written(asio::error::not_connected);
            });
        }
        return;
    }

    Outgoing item;
    item.record.reserve(kHeaderSize + size);
    item.record.push_back(static_cast<std::uint8_t>(kind));
    write_u32_be(item.record, static_cast<std::uint32_t>(size));
    if (size > 0) item.record.insert(item.record.end(), data, data + size);
    item.on_written = std::move(on_written);

    queue_.push_back(std::move(item));
    if (!writing_) {
        writing_ = true;
        do_write();
    }
}

void TcpTransport::do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(queue_.front().record),
        [self](const std::error_code& ec, std::size_t /*bytes*/) {
            auto handler = std::move(self->queue_.front().on_written);
            self->queue_.pop_front();
            if (handler) handler(ec);

            if (ec) {
                auto pending = std::move(self->queue_);
                self->queue_.clear();
                self->writing_ = false;
                for (auto& item : pending) {
                    if (item.on_written) item.on_written(ec);
                }
                self->fail(ec);
                return;
            }

            if (self->queue_.empty()) {
                self->writing_ = false;
                return;
            }
            self->do_write();
        });
}

void TcpTransport::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [self](const std::error_code& ec, std::size_t /*bytes*/) {
            if (ec) {
                self->fail(ec);
                return;
            }
            const auto kind = static_cast<RecordKind>(self->header_[0]);
            const std::uint32_t length = read_u32_be(self->header_.data() + 1);
            if (length > kMaxRecordSize) {
                spdlog::warn("Record of {} bytes from {} exceeds limit, closing", length, self->remote_);
                self->fail(std::make_error_code(std::errc::message_size));
                return;
            }
            self->read_body(kind, length);
        });
}

void TcpTransport::read_body(RecordKind kind, std::uint32_t length) {
    body_.resize(length);
    if (length == 0) {
        dispatch(kind);
        return;
    }
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(body_),
        [self, kind](const std::error_code& ec, std::size_t /*bytes*/) {
            if (ec) {
                self->fail(ec);
                return;
            }
            self->dispatch(kind);
        });
}

void TcpTransport::dispatch(RecordKind kind) {
    switch (kind) {
        case RecordKind::Text:
            if (handlers_.on_text) handlers_.on_text(std::string(body_.begin(), body_.end()));
            break;
        case RecordKind::Binary:
            if (handlers_.on_binary) handlers_.on_binary(std::move(body_));
            body_ = Bytes();
            break;
        case RecordKind::Ping:
            enqueue(RecordKind::Pong, nullptr, 0, {});
            break;
        case RecordKind::Pong:
            if (handlers_.on_pong) handlers_.on_pong();
            break;
        default:
            spdlog::debug("Dropping record of unknown kind {} from {}",
                          static_cast<int>(kind), remote_);
            break;
    }
    if (!closed_) read_header();
}

void TcpTransport::fail(const std::error_code& reason) {
    if (closed_) return;
    closed_ = true;

    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    // Dropping the handlers breaks the owner <-> transport reference cycle.
    auto on_closed = std::move(handlers_.on_closed);
    handlers_ = TransportHandlers{};
    if (on_closed) on_closed(reason);
}

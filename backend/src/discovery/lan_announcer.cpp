/**
 * LanAnnouncer — Broadcasts our presence and listens for other nodes.
 */

#include "discovery/lan_announcer.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
using asio::ip::udp;

LanAnnouncer::LanAnnouncer(asio::io_context& io,
                           const Identity& identity,
                           DiscoveryAdapter& adapter,
                           std::string service,
                           uint16_t discovery_port,
                           std::chrono::milliseconds interval)
    : identity_(identity),
      adapter_(adapter),
      service_(std::move(service)),
      discovery_port_(discovery_port),
      interval_(interval),
      socket_(io),
      timer_(io) {}

bool LanAnnouncer::start(uint16_t session_port) {
    session_port_ = session_port;

    std::error_code ec;
    socket_.open(udp::v4(), ec);
    if (!ec) socket_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) socket_.set_option(asio::socket_base::broadcast(true), ec);
    if (!ec) socket_.bind(udp::endpoint(udp::v4(), discovery_port_), ec);
    if (ec) {
        spdlog::warn("Discovery unavailable on UDP port {}: {}", discovery_port_, ec.message());
        std::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    running_ = true;
    spdlog::info("Announcing '{}' on UDP port {}", service_, discovery_port_);
    receive();
    announce();
    schedule_announce();
    return true;
}

void LanAnnouncer::stop() {
    if (!running_) return;
    running_ = false;
    timer_.cancel();

    std::error_code ec;
    const std::string bye = datagram(true);
    socket_.send_to(asio::buffer(bye), udp::endpoint(asio::ip::address_v4::broadcast(), discovery_port_), 0, ec);
    if (ec) spdlog::debug("Could not send discovery goodbye: {}", ec.message());
    socket_.close(ec);
}

std::string LanAnnouncer::datagram(bool bye) const {
    json j;
    j["service"] = service_;
    j["id"] = identity_.id;
    j["name"] = identity_.username;
    j["device"] = identity_.device;
    j["port"] = session_port_;
    if (bye) j["bye"] = true;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void LanAnnouncer::schedule_announce() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const std::error_code& ec) {
        if (ec || !running_) return;
        announce();
        schedule_announce();
    });
}

void LanAnnouncer::announce() {
    auto payload = std::make_shared<std::string>(datagram(false));
    socket_.async_send_to(asio::buffer(*payload),
                          udp::endpoint(asio::ip::address_v4::broadcast(), discovery_port_),
                          [payload](const std::error_code& ec, std::size_t) {
                              if (ec && ec != asio::error::operation_aborted) {
                                  spdlog::debug("Discovery broadcast failed: {}", ec.message());
                              }
                          });
}

void LanAnnouncer::receive() {
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
        [this](const std::error_code& ec, std::size_t bytes) {
            if (!running_) return;
            if (!ec) {
                handle_datagram(std::string(buffer_.data(), bytes), sender_.address());
            } else if (ec == asio::error::operation_aborted) {
                return;
            } else {
                spdlog::debug("Discovery receive failed: {}", ec.message());
            }
            receive();
        });
}

void LanAnnouncer::handle_datagram(const std::string& text, const asio::ip::address& sender) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return;
    auto service_it = j.find("service");
    if (service_it == j.end() || !service_it->is_string() || service_it->get<std::string>() != service_) {
        return;
    }

    auto id_it = j.find("id");
    if (id_it == j.end() || !id_it->is_string()) return;
    const std::string id = id_it->get<std::string>();

    auto bye_it = j.find("bye");
    if (bye_it != j.end() && bye_it->is_boolean() && bye_it->get<bool>()) {
        adapter_.on_peer_down(id);
        return;
    }

    auto port_it = j.find("port");
    if (port_it == j.end() || !port_it->is_number_unsigned()) return;
    const auto port = port_it->get<std::uint64_t>();
    if (port == 0 || port > 65535) return;

    DiscoveredPeer peer;
    peer.peer_id = id;
    peer.address = sender.to_string();
    peer.port = static_cast<uint16_t>(port);
    auto name_it = j.find("name");
    if (name_it != j.end() && name_it->is_string()) peer.name = name_it->get<std::string>();
    auto device_it = j.find("device");
    if (device_it != j.end() && device_it->is_string()) peer.device = device_it->get<std::string>();

    adapter_.on_peer_up(peer);
}

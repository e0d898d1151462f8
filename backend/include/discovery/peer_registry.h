#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * A peer seen on the LAN. Being listed here does not mean we are
 * connected to it.
 */
struct DiscoveredPeer {
    std::string   peer_id;
    std::string   name;
    std::string   device;
    std::string   address;
    std::uint16_t port = 0;

    bool operator==(const DiscoveredPeer& other) const {
        return peer_id == other.peer_id && name == other.name && device == other.device &&
               address == other.address && port == other.port;
    }
    bool operator!=(const DiscoveredPeer& other) const { return !(*this == other); }
};

/**
 * Discovered-but-not-necessarily-connected peers, in first-seen order.
 */
class PeerRegistry {
public:
    using ChangeCallback = std::function<void(const std::vector<DiscoveredPeer>& peers)>;

    /// Insert or update in place. Returns true if anything changed.
    bool upsert(const DiscoveredPeer& peer);

    /// Returns true if the peer was present.
    bool remove(const std::string& peer_id);

    [[nodiscard]] std::vector<DiscoveredPeer> list() const { return peers_; }
    [[nodiscard]] std::optional<DiscoveredPeer> find(const std::string& peer_id) const;
    [[nodiscard]] std::size_t size() const { return peers_.size(); }

    /// Invoked with a snapshot after every change.
    void set_on_changed(ChangeCallback cb);

private:
    void notify();

    std::vector<DiscoveredPeer> peers_;
    ChangeCallback on_changed_;
};

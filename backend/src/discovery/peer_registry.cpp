/**
 * PeerRegistry — what discovery has told us about the LAN.
 */

#include "discovery/peer_registry.h"

#include <algorithm>
#include <spdlog/spdlog.h>

bool PeerRegistry::upsert(const DiscoveredPeer& peer) {
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&](const DiscoveredPeer& p) { return p.peer_id == peer.peer_id; });
    if (it == peers_.end()) {
        peers_.push_back(peer);
        spdlog::info("Discovered peer {} ({}) at {}:{}", peer.name, peer.peer_id, peer.address, peer.port);
    } else if (*it != peer) {
        *it = peer;
        spdlog::debug("Updated peer {} -> {}:{}", peer.peer_id, peer.address, peer.port);
    } else {
        return false;
    }
    notify();
    return true;
}

bool PeerRegistry::remove(const std::string& peer_id) {
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&](const DiscoveredPeer& p) { return p.peer_id == peer_id; });
    if (it == peers_.end()) return false;
    spdlog::info("Peer {} ({}) went away", it->name, peer_id);
    peers_.erase(it);
    notify();
    return true;
}

std::optional<DiscoveredPeer> PeerRegistry::find(const std::string& peer_id) const {
    for (const auto& peer : peers_) {
        if (peer.peer_id == peer_id) return peer;
    }
    return std::nullopt;
}

void PeerRegistry::set_on_changed(ChangeCallback cb) {
    on_changed_ = std::move(cb);
}

void PeerRegistry::notify() {
    if (on_changed_) on_changed_(list());
}

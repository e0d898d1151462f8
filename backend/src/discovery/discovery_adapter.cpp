#include "discovery/discovery_adapter.h"

#include <spdlog/spdlog.h>

DiscoveryAdapter::DiscoveryAdapter(std::string local_peer_id, PeerRegistry& registry)
    : local_peer_id_(std::move(local_peer_id)), registry_(registry) {}

void DiscoveryAdapter::on_peer_up(const DiscoveredPeer& peer) {
    if (peer.peer_id.empty() || peer.peer_id == local_peer_id_) return;
    if (peer.address.empty() || peer.port == 0) {
        spdlog::debug("Ignoring announcement from {} without an address", peer.peer_id);
        return;
    }
    DiscoveredPeer entry = peer;
    if (entry.name.empty()) entry.name = entry.peer_id;
    registry_.upsert(entry);
}

void DiscoveryAdapter::on_peer_down(const std::string& peer_id) {
    if (peer_id.empty() || peer_id == local_peer_id_) return;
    registry_.remove(peer_id);
}

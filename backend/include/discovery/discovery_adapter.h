#pragma once

#include <string>

#include "discovery/peer_registry.h"

/**
 * Entry point for whatever discovery mechanism is running. Announcements
 * may repeat, arrive out of order, or describe ourselves; the adapter
 * absorbs all of that before the registry sees it.
 */
class DiscoveryAdapter {
public:
    DiscoveryAdapter(std::string local_peer_id, PeerRegistry& registry);

    void on_peer_up(const DiscoveredPeer& peer);
    void on_peer_down(const std::string& peer_id);

private:
    std::string local_peer_id_;
    PeerRegistry& registry_;
};

#pragma once

#include <string>
#include <utility>

/**
 * Default destination for outgoing chat: everyone, or one peer.
 */
struct ActiveTarget {
    std::string peer_id;  // empty means broadcast

    static ActiveTarget broadcast() { return ActiveTarget{}; }
    static ActiveTarget peer(std::string id) { return ActiveTarget{std::move(id)}; }

    [[nodiscard]] bool is_broadcast() const { return peer_id.empty(); }

    bool operator==(const ActiveTarget& other) const { return peer_id == other.peer_id; }
    bool operator!=(const ActiveTarget& other) const { return !(*this == other); }
};

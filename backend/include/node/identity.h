#pragma once

#include <string>

struct NodeConfig;

/**
 * Who this node is on the LAN.
 */
struct Identity {
    std::string id;        // stable peer id announced to others
    std::string username;  // display name
    std::string device;    // host name
};

/// Resolve the local identity: configured id or a fresh UUID, plus the host name.
Identity make_identity(const NodeConfig& config);

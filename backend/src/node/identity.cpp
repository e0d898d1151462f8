/**
 * Identity — local peer id, display name and device name.
 */

#include "node/identity.h"

#include <array>
#include <unistd.h>

#include "config/node_config.h"
#include "crypto/id_generator.h"

namespace {

std::string host_name() {
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0) return "unknown";
    return std::string(buffer.data());
}

} // namespace

Identity make_identity(const NodeConfig& config) {
    Identity identity;
    identity.id       = config.node_id.empty() ? IdGenerator::uuid() : config.node_id;
    identity.username = config.username;
    identity.device   = host_name();
    return identity;
}

#pragma once

#include <string>

/**
 * Random identifiers backed by libsodium's CSPRNG.
 *
 * Used for the local peer id (when the config does not pin one) and for
 * file transfer ids.
 */
class IdGenerator {
public:
    /// Initialise libsodium. Safe to call more than once.
    static bool init();

    /// A random RFC 4122 version 4 UUID, e.g. "3b241101-e2bb-4255-8caf-4136c566a962".
    static std::string uuid();
};

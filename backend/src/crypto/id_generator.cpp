/**
 * IdGenerator — UUIDs from libsodium's randombytes.
 */

#include "crypto/id_generator.h"

#include <array>
#include <sodium.h>

bool IdGenerator::init() {
    return sodium_init() >= 0;
}

std::string IdGenerator::uuid() {
    static const bool ready = init();
    (void)ready;

    std::array<unsigned char, 16> bytes{};
    randombytes_buf(bytes.data(), bytes.size());
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    std::array<char, 33> hex{};
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

    const std::string h(hex.data());
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
           h.substr(16, 4) + "-" + h.substr(20, 12);
}

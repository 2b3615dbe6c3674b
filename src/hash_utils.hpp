#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>
#include <openssl/sha.h>

namespace txproof {

// 32-byte hash, always held in internal (little-endian) byte order
using Hash256 = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

// HashUtils wraps the hash primitives used by Merkle trees, transaction
// ids and witness commitments
class HashUtils {
public:
    // Computes the SHA256 hash of input data
    static Hash256 sha256(std::span<const uint8_t> data);

    // Computes double SHA256 hash (SHA256(SHA256(data)))
    static Hash256 double_sha256(std::span<const uint8_t> data);

    // Computes double SHA256 over the 64-byte concatenation left || right
    static Hash256 hash_pair(const Hash256& left, const Hash256& right);

    // Converts a display-order hex id (as printed by bitcoind) to internal order
    static Hash256 from_display_hex(const std::string& hex);

    // Converts an internal-order hash to display-order hex
    static std::string to_display_hex(const Hash256& hash);

    // Parses internal-order hex without reversing
    static Hash256 from_hex(const std::string& hex);

    static bool is_zero(const Hash256& hash);

private:
    // Private constructor to prevent instantiation
    HashUtils() = delete;
};

} // namespace txproof

#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "error.hpp"
#include <algorithm>
#include <cstring>

namespace txproof {

Hash256 HashUtils::sha256(std::span<const uint8_t> data) {
    Hash256 digest;
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    SHA256_Final(digest.data(), &ctx);
    return digest;
}

// txid, wtxid, Merkle node and witness commitment hash
Hash256 HashUtils::double_sha256(std::span<const uint8_t> data) {
    const Hash256 inner = sha256(data);
    return sha256(inner);
}

// Combines two Merkle nodes. Order matters: the left operand is hashed first.
Hash256 HashUtils::hash_pair(const Hash256& left, const Hash256& right) {
    std::array<uint8_t, 2 * SHA256_DIGEST_LENGTH> buffer;
    std::memcpy(buffer.data(), left.data(), left.size());
    std::memcpy(buffer.data() + left.size(), right.data(), right.size());
    return double_sha256(buffer);
}

Hash256 HashUtils::from_hex(const std::string& hex) {
    auto bytes = HexUtils::decode(hex);
    if (bytes.size() != SHA256_DIGEST_LENGTH) {
        throw ProofError(ErrorKind::InvalidArgument,
            "Expected 32-byte hash, got " + std::to_string(bytes.size()) + " bytes");
    }
    Hash256 hash;
    std::copy(bytes.begin(), bytes.end(), hash.begin());
    return hash;
}

// Node RPCs print ids big-endian; Merkle math works on the reversed bytes
Hash256 HashUtils::from_display_hex(const std::string& hex) {
    auto hash = from_hex(hex);
    std::reverse(hash.begin(), hash.end());
    return hash;
}

std::string HashUtils::to_display_hex(const Hash256& hash) {
    return HexUtils::encode_reversed(hash);
}

bool HashUtils::is_zero(const Hash256& hash) {
    return std::all_of(hash.begin(), hash.end(), [](uint8_t b) { return b == 0; });
}

} // namespace txproof

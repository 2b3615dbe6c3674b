#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace txproof {

    // Hash sizes
    constexpr size_t HASH_SIZE = 32;
    constexpr size_t BLOCK_HEADER_SIZE = 80;

    // Offset of hashMerkleRoot inside the 80-byte header:
    // version (4) | hashPrevBlock (32) | hashMerkleRoot (32) | time | bits | nonce
    constexpr size_t HEADER_MERKLE_ROOT_OFFSET = 36;

    // Transaction encoding
    constexpr uint8_t TX_MARKER = 0x00;
    constexpr uint8_t TX_FLAG = 0x01;
    constexpr uint8_t COMPACT_SIZE_U16 = 0xfd;
    constexpr uint8_t COMPACT_SIZE_U32 = 0xfe;
    constexpr uint8_t COMPACT_SIZE_U64 = 0xff;

    // BIP141 witness commitment output script prefix:
    // OP_RETURN (0x6a) | push 36 (0x24) | commitment header aa21a9ed
    constexpr std::array<uint8_t, 6> WITNESS_COMMITMENT_MARKER = {0x6a, 0x24, 0xaa, 0x21, 0xa9, 0xed};

    // Alternate strategy quota defaults
    constexpr size_t DEFAULT_ALTERNATE_QUOTA = 5;
    constexpr std::chrono::seconds DEFAULT_ALTERNATE_WINDOW{3600};

    constexpr size_t DEFAULT_WORKER_THREADS = 4;
    constexpr int DEFAULT_RPC_TIMEOUT_SECONDS = 30;
    constexpr uint16_t DEFAULT_RPC_PORT = 8332;

} // namespace txproof

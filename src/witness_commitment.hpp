#pragma once

#include <optional>
#include <span>
#include <string>
#include "hash_utils.hpp"
#include "transaction_codec.hpp"

namespace txproof {

// BIP141 commitment binding a block's coinbase to the witness Merkle root
struct WitnessCommitment {
    Hash256 witness_merkle_root{};   // Root over wtxids, coinbase leaf zeroed
    Hash256 reserved_value{};        // Coinbase witness reserved value
    Hash256 commitment_hash{};       // SHA256d(witness_merkle_root || reserved_value)
};

class WitnessCommitmentResolver {
public:
    // Scans the serialized coinbase for the 6a24aa21a9ed marker and returns
    // the 32 bytes that follow it. When several outputs carry the marker the
    // last one wins, as in BIP141. An all-zero placeholder counts as absent.
    static std::optional<Hash256> extract_commitment(std::span<const uint8_t> coinbase_raw);
    static std::optional<Hash256> extract_commitment_hex(const std::string& coinbase_raw_hex);

    static Hash256 compute_commitment(const Hash256& witness_merkle_root, const Hash256& reserved_value);

    static bool verify(const Hash256& witness_merkle_root,
                       const Hash256& reserved_value,
                       const Hash256& expected_commitment);

    // Witness reserved value carried in the coinbase input's witness,
    // 32 zero bytes when the coinbase has none
    static Hash256 reserved_value(const ParsedTransaction& coinbase);

    // Recomputes the commitment for witness_merkle_root and checks it against
    // the one embedded in the live coinbase. Returns std::nullopt when no
    // commitment is available; throws WitnessCommitmentMismatch when the
    // coinbase commits to a different root.
    static std::optional<WitnessCommitment> resolve(const Hash256& witness_merkle_root,
                                                    const ParsedTransaction& coinbase);

private:
    WitnessCommitmentResolver() = delete;
};

} // namespace txproof

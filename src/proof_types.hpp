#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "hash_utils.hpp"
#include "merkle.hpp"
#include "transaction_codec.hpp"
#include "witness_commitment.hpp"

namespace txproof {

// Block metadata as reported by the node
struct BlockRef {
    std::string hash;                  // Display order hex
    uint32_t height = 0;
    std::string merkle_root_display;   // Display order hex
    std::vector<uint8_t> header_bytes; // Serialized 80-byte header
};

// One transaction of a block, in block order (index 0 is the coinbase)
struct TxRecord {
    std::string txid_display;
    std::string wtxid_display;
    std::string raw_hex;

    bool is_segwit() const { return wtxid_display != txid_display; }
};

// Inclusion of a legacy transaction: a path through the txid tree
struct LegacyInclusion {
    MerkleProof txid_proof;
};

// Inclusion of a segwit transaction: a path through the wtxid tree plus the
// commitment tying that tree's root to the coinbase. The commitment is only
// absent when the degrade policy accepted a block without one.
struct SegwitInclusion {
    MerkleProof witness_proof;
    Hash256 witness_merkle_root{};
    std::optional<WitnessCommitment> commitment;
};

// Complete proof that a transaction is part of a block. Built once by
// ProofAssembler and shared read-only afterwards.
struct TransactionProofSet {
    std::string txid;                    // Display order hex
    Hash256 wtxid{};                     // Internal order; zero for the coinbase
    Hash256 coinbase_txid{};             // Internal order
    size_t tx_index = 0;
    uint32_t height = 0;
    std::string block_hash;
    std::vector<uint8_t> header_bytes;
    size_t tree_depth = 0;
    MerkleProof coinbase_proof;
    Hash256 merkle_root{};               // Internal order
    ParsedTransaction parsed_transaction;
    std::vector<uint8_t> witness_bytes;
    std::string tx_raw_hex;
    std::string coinbase_raw_hex;        // Witness-stripped coinbase
    std::variant<LegacyInclusion, SegwitInclusion> inclusion;

    bool segwit() const { return std::holds_alternative<SegwitInclusion>(inclusion); }

    // Proof for the target: the txid path or the wtxid path
    const MerkleProof& target_proof() const {
        if (const auto* segwit_inclusion = std::get_if<SegwitInclusion>(&inclusion)) {
            return segwit_inclusion->witness_proof;
        }
        return std::get<LegacyInclusion>(inclusion).txid_proof;
    }
};

} // namespace txproof

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "merkle.hpp"
#include "proof_orchestrator.hpp"
#include "proof_types.hpp"

namespace txproof {

// Encodes proofs for on-chain and off-chain verifiers.
// Hashes are written in internal byte order, the order verifiers hash in.
class ProofFormatter {
public:
    static nlohmann::json to_json(const TransactionProofSet& proof);

    static nlohmann::json to_json(const JobSnapshot& snapshot);

    static nlohmann::json transaction_to_json(const ParsedTransaction& tx);

    // Proof as an array of 32-byte hex chunks. Throws ProofLengthMismatch
    // when the proof does not have exactly tree_depth siblings.
    static nlohmann::json proof_chunks(const MerkleProof& proof, size_t tree_depth);

    // Same siblings as a single concatenated hex string
    static std::string proof_hex(const MerkleProof& proof, size_t tree_depth);

private:
    ProofFormatter() = delete;

    static void check_length(const MerkleProof& proof, size_t tree_depth);
};

} // namespace txproof

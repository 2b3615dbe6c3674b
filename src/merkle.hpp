#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "hash_utils.hpp"

namespace txproof {

// Inclusion proof for one leaf: sibling hashes from the leaf level up to
// (but excluding) the root, in internal byte order
struct MerkleProof {
    std::vector<Hash256> siblings;
    size_t depth = 0;
    size_t leaf_index = 0;
};

// MerkleEngine builds Bitcoin-style Merkle trees over transaction ids.
// All inputs and outputs are in internal byte order.
class MerkleEngine {
public:
    // Computes the Merkle root; std::nullopt for an empty leaf set
    static std::optional<Hash256> build_root(const std::vector<Hash256>& leaves);

    // Returns every level of the tree, leaves first, root last.
    // Odd levels are stored as given (without the duplicated element).
    static std::vector<std::vector<Hash256>> build_tree(const std::vector<Hash256>& leaves);

    // Builds the inclusion proof for leaves[target_index]
    static MerkleProof build_proof(size_t target_index, const std::vector<Hash256>& leaves);

    // Recomputes the root from leaf and proof and compares it to root
    static bool verify_proof(const Hash256& leaf, const MerkleProof& proof, const Hash256& root);

private:
    MerkleEngine() = delete;

    static std::vector<Hash256> next_level(const std::vector<Hash256>& level);
};

} // namespace txproof

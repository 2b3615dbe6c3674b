#include "merkle.hpp"
#include "error.hpp"

namespace txproof {

// Hash one level of the tree into the next.
// Bitcoin's rule for an odd number of nodes is to pair the last node with
// itself (H(x || x)). This is consensus behaviour: any other rule yields a
// different root than the one committed in the block header.
std::vector<Hash256> MerkleEngine::next_level(const std::vector<Hash256>& level) {
    std::vector<Hash256> parents;
    parents.reserve((level.size() + 1) / 2);

    for (size_t i = 0; i < level.size(); i += 2) {
        const Hash256& left = level[i];
        const Hash256& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
        parents.push_back(HashUtils::hash_pair(left, right));
    }

    return parents;
}

std::optional<Hash256> MerkleEngine::build_root(const std::vector<Hash256>& leaves) {
    if (leaves.empty()) {
        return std::nullopt;
    }

    std::vector<Hash256> level = leaves;
    while (level.size() > 1) {
        level = next_level(level);
    }
    return level.front();
}

std::vector<std::vector<Hash256>> MerkleEngine::build_tree(const std::vector<Hash256>& leaves) {
    std::vector<std::vector<Hash256>> levels;
    if (leaves.empty()) {
        return levels;
    }

    levels.push_back(leaves);
    while (levels.back().size() > 1) {
        levels.push_back(next_level(levels.back()));
    }
    return levels;
}

// Build a Merkle inclusion proof
//
// Walking from the leaves to the root, each level contributes the partner
// of the current node:
// - even index: the node to the right (or the node itself when it is the
//   last node of an odd-length level, matching the duplication rule)
// - odd index: the node to the left
// The position in the next level is index / 2.
//
// A complete proof has exactly one sibling per level below the root,
// so its length must equal levels - 1.
MerkleProof MerkleEngine::build_proof(size_t target_index, const std::vector<Hash256>& leaves) {
    if (leaves.empty()) {
        throw ProofError(ErrorKind::InvalidArgument, "Cannot build a Merkle proof over an empty leaf set");
    }
    if (target_index >= leaves.size()) {
        throw ProofError(ErrorKind::InvalidArgument,
            "Leaf index " + std::to_string(target_index) + " out of range for " +
            std::to_string(leaves.size()) + " leaves");
    }

    auto levels = build_tree(leaves);
    const size_t tree_depth = levels.size() - 1;

    MerkleProof proof;
    proof.leaf_index = target_index;
    proof.siblings.reserve(tree_depth);

    size_t index = target_index;
    for (size_t level = 0; level < tree_depth; ++level) {
        const auto& nodes = levels[level];
        size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        if (sibling >= nodes.size()) {
            sibling = index;
        }
        proof.siblings.push_back(nodes[sibling]);
        index /= 2;
    }

    if (proof.siblings.size() != tree_depth) {
        throw ProofError(ErrorKind::ProofLengthMismatch,
            "Proof length mismatch: expected " + std::to_string(tree_depth) +
            ", got " + std::to_string(proof.siblings.size()));
    }

    proof.depth = tree_depth;
    return proof;
}

// Verify a Merkle proof
//
// Bit i of the leaf index tells on which side the running hash sits at
// level i: 1 means it is the right child, so the sibling goes first.
bool MerkleEngine::verify_proof(const Hash256& leaf, const MerkleProof& proof, const Hash256& root) {
    Hash256 current = leaf;
    for (size_t i = 0; i < proof.siblings.size(); ++i) {
        const bool is_right = i < 64 && ((proof.leaf_index >> i) & 1U) != 0;
        current = is_right ? HashUtils::hash_pair(proof.siblings[i], current)
                           : HashUtils::hash_pair(current, proof.siblings[i]);
    }
    return current == root;
}

} // namespace txproof

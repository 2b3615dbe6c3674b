#include "proof_assembler.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include <algorithm>

namespace txproof {

const char* to_string(CommitmentPolicy policy) {
    return policy == CommitmentPolicy::Fail ? "fail" : "degrade";
}

CommitmentPolicy parse_commitment_policy(const std::string& name) {
    if (name == "fail") return CommitmentPolicy::Fail;
    if (name == "degrade") return CommitmentPolicy::Degrade;
    throw ProofError(ErrorKind::InvalidArgument, "Unknown commitment policy: " + name);
}

// Assemble the inclusion proof for one transaction
//
// 1. Leaves: txids reversed into internal order. If the block has segwit
//    transactions, a second leaf set is built from wtxids with the coinbase
//    leaf replaced by 32 zero bytes (BIP141).
// 2. The txid root must match the root reported by the node and the one in
//    the serialized header. A disagreement means the transaction list is
//    wrong, so nothing is returned.
// 3. The coinbase proof is always produced; verifiers use it to
//    authenticate the coinbase that carries the witness commitment.
// 4. Legacy target, or the coinbase: path through the txid tree. The
//    coinbase's wtxid leaf is fixed at zero, so only its txid proves it.
// 5. Segwit target: path through the wtxid tree plus the witness commitment.
// 6. The target is decoded so consumers get structural fields and the
//    witness section without reparsing the raw hex.
TransactionProofSet ProofAssembler::assemble(const BlockRef& block,
                                             const std::vector<TxRecord>& transactions,
                                             const std::string& target_txid) const {
    const std::string target = HexUtils::normalize(target_txid);

    auto target_it = std::find_if(transactions.begin(), transactions.end(),
        [&target](const TxRecord& record) {
            return record.txid_display == target;
        });
    if (target_it == transactions.end()) {
        throw ProofError(ErrorKind::TransactionNotInBlock,
            "Transaction " + target + " not found in block " + block.hash);
    }
    const size_t tx_index = static_cast<size_t>(target_it - transactions.begin());

    std::vector<Hash256> txid_leaves;
    txid_leaves.reserve(transactions.size());
    for (const auto& record : transactions) {
        txid_leaves.push_back(HashUtils::from_display_hex(record.txid_display));
    }

    const bool block_has_segwit = std::any_of(transactions.begin(), transactions.end(),
        [](const TxRecord& record) { return record.is_segwit(); });

    std::vector<Hash256> wtxid_leaves;
    if (block_has_segwit) {
        wtxid_leaves.reserve(transactions.size());
        wtxid_leaves.push_back(Hash256{});
        for (size_t i = 1; i < transactions.size(); ++i) {
            wtxid_leaves.push_back(HashUtils::from_display_hex(transactions[i].wtxid_display));
        }
    }

    // Step 2: root consistency
    const Hash256 merkle_root = *MerkleEngine::build_root(txid_leaves);
    const Hash256 reported_root = HashUtils::from_display_hex(block.merkle_root_display);
    if (merkle_root != reported_root) {
        throw ProofError(ErrorKind::MerkleRootMismatch,
            "Computed merkle root " + HashUtils::to_display_hex(merkle_root) +
            " does not match block " + block.hash + " root " + block.merkle_root_display);
    }
    if (block.header_bytes.size() == BLOCK_HEADER_SIZE &&
        !std::equal(merkle_root.begin(), merkle_root.end(),
                    block.header_bytes.begin() + HEADER_MERKLE_ROOT_OFFSET)) {
        throw ProofError(ErrorKind::MerkleRootMismatch,
            "Header of block " + block.hash + " commits to a different merkle root");
    }

    // Step 6: decode the target and make sure the bytes are the ones the id names
    ParsedTransaction parsed = TransactionCodec::decode_hex(target_it->raw_hex);
    if (TransactionCodec::txid(parsed) != txid_leaves[tx_index]) {
        throw ProofError(ErrorKind::MalformedTransaction,
            "Raw transaction does not hash to txid " + target);
    }
    if (target_it->is_segwit() && tx_index != 0 &&
        TransactionCodec::wtxid(parsed) != wtxid_leaves[tx_index]) {
        throw ProofError(ErrorKind::MalformedTransaction,
            "Raw transaction does not hash to wtxid " + target_it->wtxid_display);
    }

    ParsedTransaction coinbase = tx_index == 0
        ? parsed
        : TransactionCodec::decode_hex(transactions.front().raw_hex);

    TransactionProofSet proof_set;
    proof_set.txid = target;
    proof_set.wtxid = tx_index == 0 ? Hash256{} : TransactionCodec::wtxid(parsed);
    proof_set.coinbase_txid = txid_leaves.front();
    proof_set.tx_index = tx_index;
    proof_set.height = block.height;
    proof_set.block_hash = block.hash;
    proof_set.header_bytes = block.header_bytes;
    proof_set.merkle_root = merkle_root;
    proof_set.coinbase_proof = MerkleEngine::build_proof(0, txid_leaves);
    proof_set.tx_raw_hex = target_it->raw_hex;
    proof_set.coinbase_raw_hex = HexUtils::encode(TransactionCodec::strip_witness(coinbase));

    if (!target_it->is_segwit() || tx_index == 0) {
        LegacyInclusion legacy;
        legacy.txid_proof = MerkleEngine::build_proof(tx_index, txid_leaves);
        proof_set.tree_depth = legacy.txid_proof.depth;
        proof_set.inclusion = std::move(legacy);
    } else {
        SegwitInclusion segwit;
        segwit.witness_proof = MerkleEngine::build_proof(tx_index, wtxid_leaves);
        segwit.witness_merkle_root = *MerkleEngine::build_root(wtxid_leaves);
        segwit.commitment = WitnessCommitmentResolver::resolve(segwit.witness_merkle_root, coinbase);

        if (!segwit.commitment) {
            if (policy_ == CommitmentPolicy::Fail) {
                throw ProofError(ErrorKind::WitnessCommitmentNotFound,
                    "Block " + block.hash + " has no witness commitment for segwit transaction " + target);
            }
            Log::warn("Block " + block.hash + " has no witness commitment; returning proof for " +
                      target + " without one");
        }

        proof_set.tree_depth = segwit.witness_proof.depth;
        proof_set.inclusion = std::move(segwit);
    }

    proof_set.witness_bytes = parsed.witness_bytes;
    proof_set.parsed_transaction = std::move(parsed);

    Log::debug("Assembled proof for " + target + " at index " + std::to_string(tx_index) +
               " of block " + block.hash + " (depth " + std::to_string(proof_set.tree_depth) +
               (proof_set.segwit() ? ", segwit)" : ", legacy)"));
    return proof_set;
}

} // namespace txproof

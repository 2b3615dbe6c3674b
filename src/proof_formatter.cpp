#include "proof_formatter.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"

namespace txproof {

void ProofFormatter::check_length(const MerkleProof& proof, size_t tree_depth) {
    // Short proofs are rejected; padding them would produce a proof that
    // verifies against the wrong root
    if (proof.siblings.size() != tree_depth) {
        throw ProofError(ErrorKind::ProofLengthMismatch,
            "Proof has " + std::to_string(proof.siblings.size()) +
            " siblings but the tree depth is " + std::to_string(tree_depth));
    }
}

nlohmann::json ProofFormatter::proof_chunks(const MerkleProof& proof, size_t tree_depth) {
    check_length(proof, tree_depth);
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto& sibling : proof.siblings) {
        chunks.push_back(HexUtils::encode(sibling));
    }
    return chunks;
}

std::string ProofFormatter::proof_hex(const MerkleProof& proof, size_t tree_depth) {
    check_length(proof, tree_depth);
    std::string hex;
    hex.reserve(proof.siblings.size() * HASH_SIZE * 2);
    for (const auto& sibling : proof.siblings) {
        hex += HexUtils::encode(sibling);
    }
    return hex;
}

nlohmann::json ProofFormatter::transaction_to_json(const ParsedTransaction& tx) {
    nlohmann::json inputs = nlohmann::json::array();
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        const TxInput& input = tx.inputs[i];
        nlohmann::json witness = nlohmann::json::array();
        if (i < tx.witnesses.size()) {
            for (const auto& item : tx.witnesses[i]) {
                witness.push_back(HexUtils::encode(item));
            }
        }
        inputs.push_back({
            {"prevHash", HexUtils::encode(input.prev_hash)},
            {"prevIndex", HexUtils::encode(input.prev_index)},
            {"scriptSig", HexUtils::encode(input.script_sig)},
            {"sequence", HexUtils::encode(input.sequence)},
            {"witness", witness}
        });
    }

    nlohmann::json outputs = nlohmann::json::array();
    for (const auto& output : tx.outputs) {
        outputs.push_back({
            {"value", HexUtils::encode(output.value)},
            {"valueSats", output.value_sats()},
            {"scriptPubKey", HexUtils::encode(output.script_pubkey)}
        });
    }

    return {
        {"version", HexUtils::encode(tx.version)},
        {"segwit", tx.segwit},
        {"inputs", inputs},
        {"outputs", outputs},
        {"witnessBytes", HexUtils::encode(tx.witness_bytes)},
        {"locktime", HexUtils::encode(tx.locktime)}
    };
}

nlohmann::json ProofFormatter::to_json(const TransactionProofSet& proof) {
    nlohmann::json out = {
        {"txId", proof.txid},
        {"txIdReversed", HexUtils::encode(HashUtils::from_display_hex(proof.txid))},
        {"txId0Reversed", HexUtils::encode(proof.coinbase_txid)},
        {"wtxid", HashUtils::to_display_hex(proof.wtxid)},
        {"wtxidR", HexUtils::encode(proof.wtxid)},
        {"txIndex", proof.tx_index},
        {"height", proof.height},
        {"blockHash", HexUtils::encode(HashUtils::from_display_hex(proof.block_hash))},
        {"header", HexUtils::encode(proof.header_bytes)},
        {"treeDepth", proof.tree_depth},
        {"merkleRoot", HexUtils::encode(proof.merkle_root)},
        {"segwit", proof.segwit()},
        {"coinbaseProof", proof_chunks(proof.coinbase_proof, proof.tree_depth)},
        {"coinbaseProofHex", proof_hex(proof.coinbase_proof, proof.tree_depth)},
        {"txHex", proof.tx_raw_hex},
        {"coinbaseHex", proof.coinbase_raw_hex},
        {"witnessHex", HexUtils::encode(proof.witness_bytes)},
        {"transaction", transaction_to_json(proof.parsed_transaction)}
    };

    if (const auto* segwit = std::get_if<SegwitInclusion>(&proof.inclusion)) {
        out["witnessProof"] = proof_chunks(segwit->witness_proof, proof.tree_depth);
        out["witnessProofHex"] = proof_hex(segwit->witness_proof, proof.tree_depth);
        out["witnessMerkleRoot"] = HexUtils::encode(segwit->witness_merkle_root);
        out["computedWtxidRoot"] = out["witnessMerkleRoot"];
        if (segwit->commitment) {
            out["witnessReservedValue"] = HexUtils::encode(segwit->commitment->reserved_value);
            out["witnessCommitment"] = HexUtils::encode(segwit->commitment->commitment_hash);
        } else {
            out["witnessReservedValue"] = nullptr;
            out["witnessCommitment"] = nullptr;
        }
    } else {
        const auto& legacy = std::get<LegacyInclusion>(proof.inclusion);
        out["txidProof"] = proof_chunks(legacy.txid_proof, proof.tree_depth);
        out["txidProofHex"] = proof_hex(legacy.txid_proof, proof.tree_depth);
    }

    return out;
}

nlohmann::json ProofFormatter::to_json(const JobSnapshot& snapshot) {
    nlohmann::json out = {
        {"jobId", snapshot.job_id},
        {"txId", snapshot.txid},
        {"status", to_string(snapshot.status)},
        {"strategy", snapshot.strategy},
        {"elapsedMs", snapshot.elapsed.count()}
    };

    if (snapshot.error) {
        out["error"] = {
            {"kind", to_string(*snapshot.error)},
            {"message", snapshot.error_message}
        };
        if (snapshot.retry_after) {
            out["error"]["retryAfterSeconds"] = snapshot.retry_after->count();
        }
    }

    if (snapshot.result) {
        out["proof"] = to_json(*snapshot.result);
    }

    return out;
}

} // namespace txproof

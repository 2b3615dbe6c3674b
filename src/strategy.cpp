#include "strategy.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include "transaction_codec.hpp"
#include <algorithm>

namespace txproof {

std::string resolve_block_hash(NodeClient& node, const ProofRequest& request) {
    if (request.block_hash && !request.block_hash->empty()) {
        return HexUtils::normalize(*request.block_hash);
    }

    if (auto located = node.locate_block(request.txid)) {
        Log::debug("Transaction " + request.txid + " is in block " + *located);
        return *located;
    }

    std::string tip = node.best_block_hash();
    Log::info("No block known for " + request.txid + "; trying chain tip " + tip);
    return tip;
}

FallbackAction fallback_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedTransactionFormat:
            return FallbackAction::UseAlternate;
        case ErrorKind::TransactionNotInBlock:
        case ErrorKind::MerkleRootMismatch:
        case ErrorKind::MalformedTransaction:
        case ErrorKind::WitnessCommitmentNotFound:
        case ErrorKind::WitnessCommitmentMismatch:
        case ErrorKind::ProofLengthMismatch:
        case ErrorKind::RateLimited:
        case ErrorKind::JobNotFound:
        case ErrorKind::NodeError:
        case ErrorKind::InvalidArgument:
        case ErrorKind::Internal:
            return FallbackAction::Surface;
    }
    return FallbackAction::Surface;
}

// PrimaryStrategy

PrimaryStrategy::PrimaryStrategy(NodeClient& node, ProofAssembler assembler, std::vector<int32_t> accepted_versions)
    : node_(node)
    , assembler_(assembler)
    , accepted_versions_(std::move(accepted_versions))
{}

TransactionProofSet PrimaryStrategy::run(const ProofRequest& request) {
    const std::string block_hash = resolve_block_hash(node_, request);
    NodeBlock block = node_.get_block(block_hash);

    Log::debug("Primary strategy: block " + block.ref.hash + " at height " +
               std::to_string(block.ref.height) + " with " +
               std::to_string(block.transactions.size()) + " transactions");

    TransactionProofSet proof = assembler_.assemble(block.ref, block.transactions, request.txid);

    const int32_t version = proof.parsed_transaction.version_value();
    if (std::find(accepted_versions_.begin(), accepted_versions_.end(), version) == accepted_versions_.end()) {
        throw ProofError(ErrorKind::UnsupportedTransactionFormat,
            "Transaction " + request.txid + " has version " + std::to_string(version) +
            " which the primary strategy does not accept");
    }

    return proof;
}

// AlternateStrategy

AlternateStrategy::AlternateStrategy(NodeClient& node, ProofAssembler assembler)
    : node_(node)
    , assembler_(assembler)
{}

std::vector<TxRecord> AlternateStrategy::records_from_block(const DecodedBlock& block) {
    std::vector<TxRecord> records;
    records.reserve(block.transactions.size());
    for (const auto& tx : block.transactions) {
        TxRecord record;
        record.txid_display = HashUtils::to_display_hex(TransactionCodec::txid(tx));
        record.wtxid_display = HashUtils::to_display_hex(TransactionCodec::wtxid(tx));
        record.raw_hex = HexUtils::encode(tx.raw);
        records.push_back(std::move(record));
    }
    return records;
}

TransactionProofSet AlternateStrategy::run(const ProofRequest& request) {
    const std::string block_hash = resolve_block_hash(node_, request);
    BlockRef ref = node_.get_block_header(block_hash);

    DecodedBlock block = TransactionCodec::decode_block(node_.get_raw_block(block_hash));
    if (ref.header_bytes.empty()) {
        ref.header_bytes = block.header;
    } else if (ref.header_bytes != block.header) {
        throw ProofError(ErrorKind::NodeError,
            "Raw block " + block_hash + " does not start with the reported header");
    }

    Log::debug("Alternate strategy: decoded " + std::to_string(block.transactions.size()) +
               " transactions from raw block " + block_hash);

    return assembler_.assemble(ref, records_from_block(block), request.txid);
}

} // namespace txproof

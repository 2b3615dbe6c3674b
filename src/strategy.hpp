#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "node_client.hpp"
#include "proof_assembler.hpp"
#include "proof_types.hpp"

namespace txproof {

// What a caller asked for
struct ProofRequest {
    std::string txid;
    std::optional<std::string> block_hash;   // Skips the lookup when given
    std::string caller = "anonymous";       // Identity the alternate quota is charged to
    bool force_alternate = false;            // Go straight to the alternate strategy
};

// One way of producing a proof for a request
class ProofStrategy {
public:
    virtual ~ProofStrategy() = default;

    virtual TransactionProofSet run(const ProofRequest& request) = 0;

    virtual const char* name() const = 0;
};

// Uses the node's own decoding of the block (getblock verbosity 2).
// Replies the node could not fully decode, and target transactions whose
// version is outside the accepted set, fail with
// UnsupportedTransactionFormat so the orchestrator can fall back.
class PrimaryStrategy : public ProofStrategy {
public:
    PrimaryStrategy(NodeClient& node, ProofAssembler assembler, std::vector<int32_t> accepted_versions);

    TransactionProofSet run(const ProofRequest& request) override;

    const char* name() const override { return "primary"; }

private:
    NodeClient& node_;
    ProofAssembler assembler_;
    std::vector<int32_t> accepted_versions_;
};

// Fetches the serialized block and decodes every transaction locally with
// TransactionCodec, recomputing txids and wtxids from the raw bytes.
// Heavier than the primary strategy, so the orchestrator meters it.
class AlternateStrategy : public ProofStrategy {
public:
    AlternateStrategy(NodeClient& node, ProofAssembler assembler);

    TransactionProofSet run(const ProofRequest& request) override;

    const char* name() const override { return "alternate"; }

    // Builds TxRecords from a decoded block; index 0 keeps its real wtxid,
    // the assembler zeroes the coinbase witness leaf itself
    static std::vector<TxRecord> records_from_block(const DecodedBlock& block);

private:
    NodeClient& node_;
    ProofAssembler assembler_;
};

// Block that should contain the request's transaction: the caller's hint,
// else the node's index, else the chain tip
std::string resolve_block_hash(NodeClient& node, const ProofRequest& request);

enum class FallbackAction {
    Surface,        // Report the failure to the caller
    UseAlternate    // Retry with the alternate strategy
};

// Fallback decision table keyed on the primary strategy's failure
FallbackAction fallback_for(ErrorKind kind);

} // namespace txproof

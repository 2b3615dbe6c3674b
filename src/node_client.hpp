#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "proof_types.hpp"

namespace txproof {

// A block as decoded by the node: metadata plus every transaction in order
struct NodeBlock {
    BlockRef ref;
    std::vector<TxRecord> transactions;
};

// Bitcoin full node RPC surface consumed by the proof strategies.
// Implementations bound every call in time and report failures as
// ProofError(NodeError); data the node returns in a shape the primary
// strategy cannot use is reported as UnsupportedTransactionFormat.
class NodeClient {
public:
    virtual ~NodeClient() = default;

    virtual std::string best_block_hash() = 0;

    // Hash of the block containing txid, std::nullopt if the node does not know it
    virtual std::optional<std::string> locate_block(const std::string& txid) = 0;

    // Block with all transactions decoded by the node (getblock verbosity 2)
    virtual NodeBlock get_block(const std::string& block_hash) = 0;

    // Metadata and serialized header only
    virtual BlockRef get_block_header(const std::string& block_hash) = 0;

    // Serialized block (getblock verbosity 0)
    virtual std::vector<uint8_t> get_raw_block(const std::string& block_hash) = 0;
};

} // namespace txproof

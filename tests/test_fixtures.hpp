#pragma once

// Builders for synthetic transactions and blocks used across the test suites

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "merkle.hpp"
#include "node_client.hpp"
#include "strategy.hpp"
#include "transaction_codec.hpp"
#include "witness_commitment.hpp"

namespace txproof::test {

using Bytes = std::vector<uint8_t>;

inline void append_le(Bytes& out, uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

inline void append_script(Bytes& out, const Bytes& script) {
    TransactionCodec::write_compact_size(out, script.size());
    out.insert(out.end(), script.begin(), script.end());
}

// One input spending <seed..seed>:seed, one OP_TRUE output
inline Bytes legacy_body(uint8_t seed) {
    Bytes body;
    body.push_back(0x01);
    body.insert(body.end(), HASH_SIZE, seed);
    append_le(body, seed, 4);
    append_script(body, Bytes{0x51, seed});
    append_le(body, 0xffffffff, 4);
    body.push_back(0x01);
    append_le(body, 50'000 + seed, 8);
    append_script(body, Bytes{0x51});
    return body;
}

inline Bytes legacy_tx(uint8_t seed, int32_t version = 1) {
    Bytes tx;
    append_le(tx, static_cast<uint32_t>(version), 4);
    Bytes body = legacy_body(seed);
    tx.insert(tx.end(), body.begin(), body.end());
    append_le(tx, 0, 4);
    return tx;
}

// Same body as legacy_tx(seed) plus a two-item witness
inline Bytes segwit_tx(uint8_t seed, int32_t version = 2) {
    Bytes tx;
    append_le(tx, static_cast<uint32_t>(version), 4);
    tx.push_back(TX_MARKER);
    tx.push_back(TX_FLAG);
    Bytes body = legacy_body(seed);
    tx.insert(tx.end(), body.begin(), body.end());
    tx.push_back(0x02);
    append_script(tx, Bytes(71, seed));
    append_script(tx, Bytes(33, static_cast<uint8_t>(seed + 1)));
    append_le(tx, 0, 4);
    return tx;
}

inline Bytes commitment_script(const Hash256& commitment) {
    Bytes script(WITNESS_COMMITMENT_MARKER.begin(), WITNESS_COMMITMENT_MARKER.end());
    script.insert(script.end(), commitment.begin(), commitment.end());
    return script;
}

// Coinbase with an optional BIP141 commitment output. With a reserved
// value the coinbase uses segwit serialization and carries it as its
// single witness item.
inline Bytes coinbase_tx(const std::optional<Hash256>& commitment,
                         const std::optional<Hash256>& reserved = std::nullopt) {
    Bytes tx;
    append_le(tx, 1, 4);
    if (reserved) {
        tx.push_back(TX_MARKER);
        tx.push_back(TX_FLAG);
    }
    tx.push_back(0x01);
    tx.insert(tx.end(), HASH_SIZE, 0x00);
    append_le(tx, 0xffffffff, 4);
    append_script(tx, Bytes{0x03, 0xa0, 0x86, 0x01});
    append_le(tx, 0xffffffff, 4);

    tx.push_back(commitment ? 0x02 : 0x01);
    append_le(tx, 625'000'000, 8);
    append_script(tx, Bytes{0x51});
    if (commitment) {
        append_le(tx, 0, 8);
        append_script(tx, commitment_script(*commitment));
    }

    if (reserved) {
        tx.push_back(0x01);
        append_script(tx, Bytes(reserved->begin(), reserved->end()));
    }
    append_le(tx, 0, 4);
    return tx;
}

struct TestBlock {
    BlockRef ref;
    std::vector<TxRecord> records;
    Bytes raw;
    std::vector<Hash256> txid_leaves;
    std::vector<Hash256> wtxid_leaves;   // Coinbase leaf zeroed
};

inline TxRecord record_for(const Bytes& raw) {
    ParsedTransaction tx = TransactionCodec::decode(raw);
    TxRecord record;
    record.txid_display = HashUtils::to_display_hex(TransactionCodec::txid(tx));
    record.wtxid_display = HashUtils::to_display_hex(TransactionCodec::wtxid(tx));
    record.raw_hex = HexUtils::encode(raw);
    return record;
}

inline TestBlock make_block(const std::vector<Bytes>& transactions, uint32_t height = 100) {
    TestBlock block;
    for (size_t i = 0; i < transactions.size(); ++i) {
        ParsedTransaction tx = TransactionCodec::decode(transactions[i]);
        block.txid_leaves.push_back(TransactionCodec::txid(tx));
        block.wtxid_leaves.push_back(i == 0 ? Hash256{} : TransactionCodec::wtxid(tx));
        block.records.push_back(record_for(transactions[i]));
    }

    const Hash256 root = *MerkleEngine::build_root(block.txid_leaves);

    Bytes header;
    append_le(header, 0x20000000, 4);
    header.insert(header.end(), HASH_SIZE, 0x11);
    header.insert(header.end(), root.begin(), root.end());
    append_le(header, 1700000000, 4);
    append_le(header, 0x1d00ffff, 4);
    append_le(header, height, 4);

    block.ref.hash = HashUtils::to_display_hex(HashUtils::double_sha256(header));
    block.ref.height = height;
    block.ref.merkle_root_display = HashUtils::to_display_hex(root);
    block.ref.header_bytes = header;

    block.raw = header;
    TransactionCodec::write_compact_size(block.raw, transactions.size());
    for (const auto& tx : transactions) {
        block.raw.insert(block.raw.end(), tx.begin(), tx.end());
    }
    return block;
}

// Block of coinbase + others whose coinbase commits to the witness root
inline TestBlock make_segwit_block(const std::vector<Bytes>& others,
                                   bool with_commitment = true,
                                   const Hash256& reserved = Hash256{}) {
    std::vector<Hash256> wtxid_leaves{Hash256{}};
    for (const auto& raw : others) {
        wtxid_leaves.push_back(TransactionCodec::wtxid(TransactionCodec::decode(raw)));
    }
    const Hash256 witness_root = *MerkleEngine::build_root(wtxid_leaves);

    std::optional<Hash256> commitment;
    if (with_commitment) {
        commitment = WitnessCommitmentResolver::compute_commitment(witness_root, reserved);
    }

    std::vector<Bytes> transactions{coinbase_tx(commitment, reserved)};
    transactions.insert(transactions.end(), others.begin(), others.end());
    return make_block(transactions);
}

// Coinbase, one legacy and one segwit transaction
inline TestBlock three_tx_block() {
    return make_segwit_block({legacy_tx(0x21), segwit_tx(0x42)});
}

// In-memory NodeClient serving TestBlocks
class FakeNode : public NodeClient {
public:
    void add(const TestBlock& block) {
        blocks_[block.ref.hash] = block;
        for (const auto& record : block.records) {
            locations_[record.txid_display] = block.ref.hash;
        }
        tip_ = block.ref.hash;
    }

    std::string best_block_hash() override { return tip_; }

    std::optional<std::string> locate_block(const std::string& txid) override {
        ++locate_calls;
        if (!index_enabled) {
            return std::nullopt;
        }
        auto it = locations_.find(txid);
        if (it == locations_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    NodeBlock get_block(const std::string& block_hash) override {
        ++get_block_calls;
        if (decoded_unsupported) {
            throw ProofError(ErrorKind::UnsupportedTransactionFormat, "Node returned undecoded transactions");
        }
        const TestBlock& block = find(block_hash);
        return NodeBlock{block.ref, block.records};
    }

    BlockRef get_block_header(const std::string& block_hash) override {
        return find(block_hash).ref;
    }

    std::vector<uint8_t> get_raw_block(const std::string& block_hash) override {
        ++raw_block_calls;
        return find(block_hash).raw;
    }

    bool index_enabled = true;
    bool decoded_unsupported = false;
    std::atomic<int> locate_calls{0};
    std::atomic<int> get_block_calls{0};
    std::atomic<int> raw_block_calls{0};

private:
    const TestBlock& find(const std::string& block_hash) const {
        auto it = blocks_.find(block_hash);
        if (it == blocks_.end()) {
            throw ProofError(ErrorKind::NodeError, "Block not found: " + block_hash);
        }
        return it->second;
    }

    std::map<std::string, TestBlock> blocks_;
    std::map<std::string, std::string> locations_;
    std::string tip_;
};

// Strategy whose behaviour is supplied by the test
class ScriptedStrategy : public ProofStrategy {
public:
    using Body = std::function<TransactionProofSet(const ProofRequest&)>;

    ScriptedStrategy(const char* name, Body body, std::atomic<int>& calls)
        : name_(name), body_(std::move(body)), calls_(calls) {}

    TransactionProofSet run(const ProofRequest& request) override {
        ++calls_;
        return body_(request);
    }

    const char* name() const override { return name_; }

private:
    const char* name_;
    Body body_;
    std::atomic<int>& calls_;
};

inline TransactionProofSet stub_proof(const std::string& txid) {
    TransactionProofSet proof;
    proof.txid = txid;
    proof.inclusion = LegacyInclusion{};
    return proof;
}

// Predicate for BOOST_CHECK_EXCEPTION
inline std::function<bool(const ProofError&)> has_kind(ErrorKind kind) {
    return [kind](const ProofError& e) { return e.kind() == kind; };
}

inline std::string txid_of(uint8_t seed) {
    return std::string(64, "0123456789abcdef"[seed & 0x0f]);
}

} // namespace txproof::test

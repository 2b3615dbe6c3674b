#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "hash_utils.hpp"

namespace txproof {

// Multi-byte integers are kept exactly as they appear on the wire
// (little-endian) so they can be handed to verifiers unmodified.
// The *_value() helpers decode them when a number is needed.

struct TxInput {
    Hash256 prev_hash;                   // Previous output txid, internal order
    std::array<uint8_t, 4> prev_index;   // Previous output index
    std::vector<uint8_t> script_sig;     // Unlocking script
    std::array<uint8_t, 4> sequence;

    uint32_t prev_index_value() const;
    uint32_t sequence_value() const;
};

struct TxOutput {
    std::array<uint8_t, 8> value;        // Amount in satoshis
    std::vector<uint8_t> script_pubkey;  // Locking script

    uint64_t value_sats() const;
};

struct ParsedTransaction {
    std::array<uint8_t, 4> version;
    bool segwit = false;
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    std::vector<std::vector<std::vector<uint8_t>>> witnesses;  // One stack per input
    std::vector<uint8_t> witness_bytes;  // Raw witness section, empty for legacy
    std::array<uint8_t, 4> locktime;

    // Full serialization and the byte range covering input count through
    // the last output, used to rebuild the witness-stripped form
    std::vector<uint8_t> raw;
    size_t body_begin = 0;
    size_t body_end = 0;

    int32_t version_value() const;
    uint32_t locktime_value() const;
};

struct DecodedBlock {
    std::vector<uint8_t> header;
    std::vector<ParsedTransaction> transactions;
};

// Cursor over a byte buffer. Every read is bounds checked and fails with
// MalformedTransaction instead of reading past the end.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    std::span<const uint8_t> read(size_t count);
    uint8_t read_byte();
    uint8_t peek(size_t ahead = 0) const;
    uint64_t read_compact_size();

    template <size_t N>
    std::array<uint8_t, N> read_array() {
        auto bytes = read(N);
        std::array<uint8_t, N> out;
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }
    std::span<const uint8_t> slice(size_t begin, size_t end) const { return data_.subspan(begin, end - begin); }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

// TransactionCodec decodes the Bitcoin transaction wire format (legacy and
// BIP144 segwit serialization) and the raw block format built on top of it
class TransactionCodec {
public:
    // Decodes one complete transaction; trailing bytes are an error
    static ParsedTransaction decode(std::span<const uint8_t> raw);

    static ParsedTransaction decode_hex(const std::string& raw_hex);

    // Decodes the transaction starting at the reader's position
    static ParsedTransaction read(ByteReader& reader);

    // Decodes a serialized block: 80-byte header, tx count, transactions
    static DecodedBlock decode_block(std::span<const uint8_t> raw);

    // version || inputs || outputs || locktime, without marker, flag and witness
    static std::vector<uint8_t> strip_witness(const ParsedTransaction& tx);

    // Transaction ids in internal byte order
    static Hash256 txid(const ParsedTransaction& tx);
    static Hash256 wtxid(const ParsedTransaction& tx);

    static void write_compact_size(std::vector<uint8_t>& out, uint64_t value);

private:
    TransactionCodec() = delete;

    static std::vector<uint8_t> read_script(ByteReader& reader);
    static uint64_t read_count(ByteReader& reader, size_t min_item_size, const char* what);
};

} // namespace txproof

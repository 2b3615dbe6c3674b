#include "transaction_codec.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"

namespace txproof {

namespace {

template <size_t N>
uint64_t little_endian_value(const std::array<uint8_t, N>& bytes) {
    uint64_t value = 0;
    for (size_t i = 0; i < N; ++i) {
        value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
    }
    return value;
}

} // namespace

uint32_t TxInput::prev_index_value() const { return static_cast<uint32_t>(little_endian_value(prev_index)); }
uint32_t TxInput::sequence_value() const { return static_cast<uint32_t>(little_endian_value(sequence)); }
uint64_t TxOutput::value_sats() const { return little_endian_value(value); }
int32_t ParsedTransaction::version_value() const { return static_cast<int32_t>(little_endian_value(version)); }
uint32_t ParsedTransaction::locktime_value() const { return static_cast<uint32_t>(little_endian_value(locktime)); }

// ByteReader

std::span<const uint8_t> ByteReader::read(size_t count) {
    if (count > remaining()) {
        throw ProofError(ErrorKind::MalformedTransaction,
            "Unexpected end of data: need " + std::to_string(count) + " bytes at offset " +
            std::to_string(pos_) + ", " + std::to_string(remaining()) + " left");
    }
    auto out = data_.subspan(pos_, count);
    pos_ += count;
    return out;
}

uint8_t ByteReader::read_byte() {
    return read(1)[0];
}

uint8_t ByteReader::peek(size_t ahead) const {
    if (ahead >= remaining()) {
        throw ProofError(ErrorKind::MalformedTransaction,
            "Unexpected end of data at offset " + std::to_string(pos_ + ahead));
    }
    return data_[pos_ + ahead];
}

// Read a CompactSize unsigned integer
// https://en.bitcoin.it/wiki/Protocol_documentation#Variable_length_integer
//
// - < 0xfd       : the byte itself
// - 0xfd + 2 bytes: uint16 (little-endian)
// - 0xfe + 4 bytes: uint32
// - 0xff + 8 bytes: uint64
//
// Values that would fit in a shorter form are rejected, as Bitcoin Core does.
uint64_t ByteReader::read_compact_size() {
    const uint8_t prefix = read_byte();
    if (prefix < COMPACT_SIZE_U16) {
        return prefix;
    }

    size_t width = 0;
    uint64_t minimum = 0;
    if (prefix == COMPACT_SIZE_U16) {
        width = 2;
        minimum = COMPACT_SIZE_U16;
    } else if (prefix == COMPACT_SIZE_U32) {
        width = 4;
        minimum = 0x10000;
    } else {
        width = 8;
        minimum = 0x100000000ULL;
    }

    auto bytes = read(width);
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
    }

    if (value < minimum) {
        throw ProofError(ErrorKind::MalformedTransaction,
            "Non-canonical compact size at offset " + std::to_string(pos_ - width - 1));
    }
    return value;
}

// TransactionCodec

void TransactionCodec::write_compact_size(std::vector<uint8_t>& out, uint64_t value) {
    auto append_le = [&out](uint64_t v, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    };

    if (value < COMPACT_SIZE_U16) {
        out.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        out.push_back(COMPACT_SIZE_U16);
        append_le(value, 2);
    } else if (value <= 0xffffffffULL) {
        out.push_back(COMPACT_SIZE_U32);
        append_le(value, 4);
    } else {
        out.push_back(COMPACT_SIZE_U64);
        append_le(value, 8);
    }
}

// An element count can never exceed what the remaining bytes could hold,
// which keeps a corrupt count from triggering a huge allocation
uint64_t TransactionCodec::read_count(ByteReader& reader, size_t min_item_size, const char* what) {
    const uint64_t count = reader.read_compact_size();
    if (count > reader.remaining() / min_item_size) {
        throw ProofError(ErrorKind::MalformedTransaction,
            std::string("Declared ") + what + " count " + std::to_string(count) +
            " exceeds remaining data");
    }
    return count;
}

std::vector<uint8_t> TransactionCodec::read_script(ByteReader& reader) {
    const uint64_t length = reader.read_compact_size();
    if (length > reader.remaining()) {
        throw ProofError(ErrorKind::MalformedTransaction,
            "Script length " + std::to_string(length) + " exceeds remaining data");
    }
    auto bytes = reader.read(static_cast<size_t>(length));
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

// Decode a transaction in network serialization
// https://github.com/bitcoin/bips/blob/master/bip-0144.mediawiki
//
// Legacy layout:
// - [4 bytes]  : version
// - [varint]   : input count
// - inputs     : prev txid (32) | prev index (4) | script (varint + bytes) | sequence (4)
// - [varint]   : output count
// - outputs    : value (8) | script (varint + bytes)
// - [4 bytes]  : locktime
//
// Segwit layout inserts marker 0x00 and flag 0x01 after the version and a
// witness section (one stack per input) before the locktime. Each stack
// is an item count followed by length-prefixed items.
ParsedTransaction TransactionCodec::read(ByteReader& reader) {
    const size_t start = reader.position();
    ParsedTransaction tx;

    tx.version = reader.read_array<4>();

    if (reader.peek() == TX_MARKER) {
        const uint8_t flag = reader.peek(1);
        if (flag != TX_FLAG) {
            throw ProofError(ErrorKind::UnsupportedTransactionFormat,
                "Unknown witness flag 0x" + HexUtils::encode(std::span<const uint8_t>(&flag, 1)));
        }
        reader.read(2);
        tx.segwit = true;
    }

    tx.body_begin = reader.position() - start;

    const uint64_t input_count = read_count(reader, 41, "input");
    tx.inputs.reserve(static_cast<size_t>(input_count));
    for (uint64_t i = 0; i < input_count; ++i) {
        TxInput input;
        input.prev_hash = reader.read_array<32>();
        input.prev_index = reader.read_array<4>();
        input.script_sig = read_script(reader);
        input.sequence = reader.read_array<4>();
        tx.inputs.push_back(std::move(input));
    }

    const uint64_t output_count = read_count(reader, 9, "output");
    tx.outputs.reserve(static_cast<size_t>(output_count));
    for (uint64_t i = 0; i < output_count; ++i) {
        TxOutput output;
        output.value = reader.read_array<8>();
        output.script_pubkey = read_script(reader);
        tx.outputs.push_back(std::move(output));
    }

    tx.body_end = reader.position() - start;

    if (tx.segwit) {
        const size_t witness_start = reader.position();
        tx.witnesses.reserve(tx.inputs.size());
        for (size_t i = 0; i < tx.inputs.size(); ++i) {
            const uint64_t item_count = read_count(reader, 1, "witness item");
            std::vector<std::vector<uint8_t>> stack;
            stack.reserve(static_cast<size_t>(item_count));
            for (uint64_t j = 0; j < item_count; ++j) {
                stack.push_back(read_script(reader));
            }
            tx.witnesses.push_back(std::move(stack));
        }
        auto section = reader.slice(witness_start, reader.position());
        tx.witness_bytes.assign(section.begin(), section.end());
    }

    tx.locktime = reader.read_array<4>();

    auto raw = reader.slice(start, reader.position());
    tx.raw.assign(raw.begin(), raw.end());
    return tx;
}

ParsedTransaction TransactionCodec::decode(std::span<const uint8_t> raw) {
    ByteReader reader(raw);
    ParsedTransaction tx = read(reader);
    if (reader.remaining() != 0) {
        throw ProofError(ErrorKind::MalformedTransaction,
            std::to_string(reader.remaining()) + " trailing bytes after locktime");
    }
    return tx;
}

ParsedTransaction TransactionCodec::decode_hex(const std::string& raw_hex) {
    std::vector<uint8_t> raw;
    try {
        raw = HexUtils::decode(raw_hex);
    } catch (const ProofError& e) {
        throw ProofError(ErrorKind::MalformedTransaction, std::string("Transaction hex: ") + e.what());
    }
    return decode(raw);
}

// Decode a serialized block
// https://en.bitcoin.it/wiki/Protocol_documentation#block
//
// - [80 bytes] : block header
// - [varint]   : transaction count
// - transactions, back to back
DecodedBlock TransactionCodec::decode_block(std::span<const uint8_t> raw) {
    ByteReader reader(raw);
    DecodedBlock block;

    auto header = reader.read(BLOCK_HEADER_SIZE);
    block.header.assign(header.begin(), header.end());

    // Smallest possible transaction: version, two counts, locktime
    const uint64_t tx_count = read_count(reader, 10, "transaction");
    block.transactions.reserve(static_cast<size_t>(tx_count));
    for (uint64_t i = 0; i < tx_count; ++i) {
        block.transactions.push_back(read(reader));
    }

    if (reader.remaining() != 0) {
        throw ProofError(ErrorKind::MalformedTransaction,
            std::to_string(reader.remaining()) + " trailing bytes after last block transaction");
    }
    return block;
}

// The txid commits to the legacy serialization only, so the marker, flag
// and witness section are cut out. The body is copied byte for byte from
// the original encoding.
std::vector<uint8_t> TransactionCodec::strip_witness(const ParsedTransaction& tx) {
    if (!tx.segwit) {
        return tx.raw;
    }

    std::vector<uint8_t> stripped;
    stripped.reserve(4 + (tx.body_end - tx.body_begin) + 4);
    stripped.insert(stripped.end(), tx.raw.begin(), tx.raw.begin() + 4);
    stripped.insert(stripped.end(), tx.raw.begin() + tx.body_begin, tx.raw.begin() + tx.body_end);
    stripped.insert(stripped.end(), tx.raw.end() - 4, tx.raw.end());
    return stripped;
}

Hash256 TransactionCodec::txid(const ParsedTransaction& tx) {
    return HashUtils::double_sha256(strip_witness(tx));
}

Hash256 TransactionCodec::wtxid(const ParsedTransaction& tx) {
    return HashUtils::double_sha256(tx.raw);
}

} // namespace txproof

#include "transaction_codec.hpp"

#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "test_fixtures.hpp"

#include <boost/test/unit_test.hpp>

using namespace txproof;
using namespace txproof::test;

// Coinbase of the genesis block
static const std::string GENESIS_COINBASE_HEX =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff4d04ffff001d0104"
    "455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72206f6e206272696e6b206f662073"
    "65636f6e64206261696c6f757420666f722062616e6b73ffffffff0100f2052a01000000434104678afdb0fe554827"
    "1967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d"
    "578a4c702b6bf11d5fac00000000";

static const std::string GENESIS_HEADER_HEX =
    "0100000000000000000000000000000000000000000000000000000000000000000000003ba3edfd7a7b12b27ac72c3e"
    "67768f617fc81bc3888a51323a9fb8aa4b1e5e4a29ab5f49ffff001d1dac2b7c";

BOOST_AUTO_TEST_SUITE(transaction_codec_tests)

BOOST_AUTO_TEST_CASE(decode_genesis_coinbase)
{
    ParsedTransaction tx = TransactionCodec::decode_hex(GENESIS_COINBASE_HEX);

    BOOST_CHECK_EQUAL(tx.version_value(), 1);
    BOOST_CHECK(!tx.segwit);
    BOOST_REQUIRE_EQUAL(tx.inputs.size(), 1U);
    BOOST_CHECK(HashUtils::is_zero(tx.inputs[0].prev_hash));
    BOOST_CHECK_EQUAL(tx.inputs[0].prev_index_value(), 0xffffffffU);
    BOOST_CHECK_EQUAL(tx.inputs[0].script_sig.size(), 0x4dU);
    BOOST_CHECK_EQUAL(tx.inputs[0].sequence_value(), 0xffffffffU);
    BOOST_REQUIRE_EQUAL(tx.outputs.size(), 1U);
    BOOST_CHECK_EQUAL(tx.outputs[0].value_sats(), 5'000'000'000ULL);
    BOOST_CHECK_EQUAL(tx.outputs[0].script_pubkey.size(), 0x43U);
    BOOST_CHECK_EQUAL(tx.locktime_value(), 0U);
    BOOST_CHECK(tx.witness_bytes.empty());

    BOOST_CHECK_EQUAL(HashUtils::to_display_hex(TransactionCodec::txid(tx)),
                      "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
    BOOST_CHECK(TransactionCodec::txid(tx) == TransactionCodec::wtxid(tx));
    BOOST_CHECK(TransactionCodec::strip_witness(tx) == tx.raw);
}

BOOST_AUTO_TEST_CASE(decode_genesis_block)
{
    auto raw = HexUtils::decode(GENESIS_HEADER_HEX + "01" + GENESIS_COINBASE_HEX);
    DecodedBlock block = TransactionCodec::decode_block(raw);

    BOOST_CHECK_EQUAL(HexUtils::encode(block.header), GENESIS_HEADER_HEX);
    BOOST_CHECK_EQUAL(HashUtils::to_display_hex(HashUtils::double_sha256(block.header)),
                      "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f");
    BOOST_REQUIRE_EQUAL(block.transactions.size(), 1U);
    BOOST_CHECK_EQUAL(HexUtils::encode(block.transactions[0].raw), GENESIS_COINBASE_HEX);
}

BOOST_AUTO_TEST_CASE(segwit_transaction)
{
    Bytes raw = segwit_tx(0x42);
    ParsedTransaction tx = TransactionCodec::decode(raw);

    BOOST_CHECK(tx.segwit);
    BOOST_CHECK_EQUAL(tx.version_value(), 2);
    BOOST_REQUIRE_EQUAL(tx.witnesses.size(), 1U);
    BOOST_REQUIRE_EQUAL(tx.witnesses[0].size(), 2U);
    BOOST_CHECK_EQUAL(tx.witnesses[0][0].size(), 71U);
    BOOST_CHECK_EQUAL(tx.witnesses[0][1].size(), 33U);
    // count byte + two length-prefixed items
    BOOST_CHECK_EQUAL(tx.witness_bytes.size(), 1U + 1U + 71U + 1U + 33U);
    BOOST_CHECK(tx.raw == raw);

    // Stripping the witness gives the legacy serialization of the same body
    Bytes legacy = legacy_tx(0x42, 2);
    BOOST_CHECK(TransactionCodec::strip_witness(tx) == legacy);
    BOOST_CHECK(TransactionCodec::txid(tx) == HashUtils::double_sha256(legacy));
    BOOST_CHECK(TransactionCodec::wtxid(tx) == HashUtils::double_sha256(raw));
    BOOST_CHECK(TransactionCodec::txid(tx) != TransactionCodec::wtxid(tx));
}

BOOST_AUTO_TEST_CASE(coinbase_reserved_value_witness)
{
    Hash256 reserved{};
    reserved[0] = 0x07;
    ParsedTransaction tx = TransactionCodec::decode(coinbase_tx(std::nullopt, reserved));
    BOOST_CHECK(tx.segwit);
    BOOST_REQUIRE_EQUAL(tx.witnesses.size(), 1U);
    BOOST_REQUIRE_EQUAL(tx.witnesses[0].size(), 1U);
    BOOST_CHECK(Bytes(reserved.begin(), reserved.end()) == tx.witnesses[0][0]);
}

BOOST_AUTO_TEST_CASE(compact_size_widths)
{
    for (uint64_t value : {uint64_t{0}, uint64_t{0xfc}, uint64_t{0xfd}, uint64_t{0xffff},
                           uint64_t{0x10000}, uint64_t{0xffffffff}, uint64_t{0x100000000}}) {
        Bytes encoded;
        TransactionCodec::write_compact_size(encoded, value);
        ByteReader reader(encoded);
        BOOST_CHECK_EQUAL(reader.read_compact_size(), value);
        BOOST_CHECK_EQUAL(reader.remaining(), 0U);
    }

    Bytes encoded;
    TransactionCodec::write_compact_size(encoded, 300);
    BOOST_CHECK(encoded == (Bytes{0xfd, 0x2c, 0x01}));
}

BOOST_AUTO_TEST_CASE(non_canonical_compact_size)
{
    Bytes encoded{0xfd, 0x10, 0x00};
    ByteReader reader(encoded);
    BOOST_CHECK_EXCEPTION(reader.read_compact_size(), ProofError, has_kind(ErrorKind::MalformedTransaction));
}

BOOST_AUTO_TEST_CASE(large_script_uses_three_byte_length)
{
    // 300-byte scriptSig forces a 0xfd length prefix
    Bytes tx;
    append_le(tx, 1, 4);
    tx.push_back(0x01);
    tx.insert(tx.end(), HASH_SIZE, 0x33);
    append_le(tx, 0, 4);
    append_script(tx, Bytes(300, 0xab));
    append_le(tx, 0xffffffff, 4);
    tx.push_back(0x01);
    append_le(tx, 1000, 8);
    append_script(tx, Bytes{0x51});
    append_le(tx, 0, 4);

    ParsedTransaction parsed = TransactionCodec::decode(tx);
    BOOST_REQUIRE_EQUAL(parsed.inputs.size(), 1U);
    BOOST_CHECK_EQUAL(parsed.inputs[0].script_sig.size(), 300U);
    BOOST_CHECK_EQUAL(parsed.outputs[0].value_sats(), 1000U);
}

BOOST_AUTO_TEST_CASE(truncated_transaction)
{
    Bytes raw = segwit_tx(0x10);
    for (size_t cut : {size_t{3}, size_t{10}, raw.size() / 2, raw.size() - 1}) {
        Bytes truncated(raw.begin(), raw.begin() + cut);
        BOOST_CHECK_EXCEPTION(TransactionCodec::decode(truncated), ProofError,
                              has_kind(ErrorKind::MalformedTransaction));
    }
}

BOOST_AUTO_TEST_CASE(trailing_bytes)
{
    Bytes raw = legacy_tx(0x10);
    raw.push_back(0x00);
    BOOST_CHECK_EXCEPTION(TransactionCodec::decode(raw), ProofError, has_kind(ErrorKind::MalformedTransaction));

    TestBlock block = make_block({legacy_tx(0x01)});
    block.raw.push_back(0x00);
    BOOST_CHECK_EXCEPTION(TransactionCodec::decode_block(block.raw), ProofError,
                          has_kind(ErrorKind::MalformedTransaction));
}

BOOST_AUTO_TEST_CASE(count_exceeding_data)
{
    Bytes raw;
    append_le(raw, 1, 4);
    raw.push_back(0xfe);
    append_le(raw, 1'000'000, 4);
    raw.insert(raw.end(), 16, 0x00);
    BOOST_CHECK_EXCEPTION(TransactionCodec::decode(raw), ProofError, has_kind(ErrorKind::MalformedTransaction));
}

BOOST_AUTO_TEST_CASE(unknown_witness_flag)
{
    Bytes raw = segwit_tx(0x10);
    raw[5] = 0x02;
    BOOST_CHECK_EXCEPTION(TransactionCodec::decode(raw), ProofError,
                          has_kind(ErrorKind::UnsupportedTransactionFormat));
}

BOOST_AUTO_TEST_CASE(invalid_hex)
{
    BOOST_CHECK_EXCEPTION(TransactionCodec::decode_hex("0100zz"), ProofError,
                          has_kind(ErrorKind::MalformedTransaction));
    BOOST_CHECK_EXCEPTION(TransactionCodec::decode_hex("010"), ProofError,
                          has_kind(ErrorKind::MalformedTransaction));
}

BOOST_AUTO_TEST_CASE(block_with_mixed_transactions)
{
    TestBlock block = three_tx_block();
    DecodedBlock decoded = TransactionCodec::decode_block(block.raw);

    BOOST_REQUIRE_EQUAL(decoded.transactions.size(), 3U);
    BOOST_CHECK(decoded.header == block.ref.header_bytes);
    for (size_t i = 0; i < decoded.transactions.size(); ++i) {
        BOOST_CHECK(TransactionCodec::txid(decoded.transactions[i]) == block.txid_leaves[i]);
    }
    BOOST_CHECK(!decoded.transactions[1].segwit);
    BOOST_CHECK(decoded.transactions[2].segwit);
}

BOOST_AUTO_TEST_SUITE_END()

#include "bitcoin_cli.hpp"

#include "test_fixtures.hpp"

#include <boost/test/unit_test.hpp>

using namespace txproof;
using namespace txproof::test;

// getblock <hash> 2 shaped reply for a TestBlock
static nlohmann::json verbose_block(const TestBlock& block)
{
    nlohmann::json txs = nlohmann::json::array();
    for (const auto& record : block.records) {
        txs.push_back({{"txid", record.txid_display}, {"hash", record.wtxid_display}, {"hex", record.raw_hex}});
    }
    return {
        {"hash", block.ref.hash},
        {"height", block.ref.height},
        {"merkleroot", block.ref.merkle_root_display},
        {"tx", txs}
    };
}

BOOST_AUTO_TEST_SUITE(bitcoin_cli_tests)

BOOST_AUTO_TEST_CASE(parse_verbose_block)
{
    TestBlock block = three_tx_block();
    NodeBlock parsed = BitcoinCliNodeClient::parse_verbose_block(verbose_block(block), block.ref.header_bytes);

    BOOST_CHECK_EQUAL(parsed.ref.hash, block.ref.hash);
    BOOST_CHECK_EQUAL(parsed.ref.height, block.ref.height);
    BOOST_CHECK_EQUAL(parsed.ref.merkle_root_display, block.ref.merkle_root_display);
    BOOST_CHECK(parsed.ref.header_bytes == block.ref.header_bytes);
    BOOST_REQUIRE_EQUAL(parsed.transactions.size(), 3U);
    for (size_t i = 0; i < 3; ++i) {
        BOOST_CHECK_EQUAL(parsed.transactions[i].txid_display, block.records[i].txid_display);
        BOOST_CHECK_EQUAL(parsed.transactions[i].wtxid_display, block.records[i].wtxid_display);
        BOOST_CHECK_EQUAL(parsed.transactions[i].raw_hex, block.records[i].raw_hex);
    }
}

BOOST_AUTO_TEST_CASE(undecoded_transactions_are_unsupported)
{
    TestBlock block = three_tx_block();

    nlohmann::json ids_only = verbose_block(block);
    ids_only["tx"] = nlohmann::json::array({block.records[0].txid_display});
    BOOST_CHECK_EXCEPTION(BitcoinCliNodeClient::parse_verbose_block(ids_only, {}), ProofError,
                          has_kind(ErrorKind::UnsupportedTransactionFormat));

    nlohmann::json no_hash = verbose_block(block);
    no_hash["tx"][1].erase("hash");
    BOOST_CHECK_EXCEPTION(BitcoinCliNodeClient::parse_verbose_block(no_hash, {}), ProofError,
                          has_kind(ErrorKind::UnsupportedTransactionFormat));

    nlohmann::json no_hex = verbose_block(block);
    no_hex["tx"][2].erase("hex");
    BOOST_CHECK_EXCEPTION(BitcoinCliNodeClient::parse_verbose_block(no_hex, {}), ProofError,
                          has_kind(ErrorKind::UnsupportedTransactionFormat));
}

BOOST_AUTO_TEST_CASE(incomplete_reply_is_node_error)
{
    TestBlock block = three_tx_block();
    nlohmann::json reply = verbose_block(block);
    reply.erase("merkleroot");
    BOOST_CHECK_EXCEPTION(BitcoinCliNodeClient::parse_verbose_block(reply, {}), ProofError,
                          has_kind(ErrorKind::NodeError));

    nlohmann::json header = {{"hash", block.ref.hash}, {"merkleroot", block.ref.merkle_root_display}};
    BOOST_CHECK_EXCEPTION(BitcoinCliNodeClient::parse_block_header(header, {}), ProofError,
                          has_kind(ErrorKind::NodeError));
}

BOOST_AUTO_TEST_CASE(rpc_error_code_extraction)
{
    auto code = BitcoinCLI::rpc_error_code(
        "error code: -5\nerror message:\nNo such mempool or blockchain transaction.");
    BOOST_REQUIRE(code.has_value());
    BOOST_CHECK_EQUAL(*code, -5);
    BOOST_CHECK(!BitcoinCLI::rpc_error_code("could not connect to the server").has_value());
}

BOOST_AUTO_TEST_CASE(shell_quoting)
{
    BOOST_CHECK_EQUAL(BitcoinCLI::shell_quote("getblock"), "'getblock'");
    BOOST_CHECK_EQUAL(BitcoinCLI::shell_quote("it's"), "'it'\\''s'");
}

BOOST_AUTO_TEST_CASE(hash_arguments_are_validated)
{
    BitcoinCliNodeClient client(RpcConfig{});
    BOOST_CHECK_EXCEPTION(client.get_block("not-a-hash; rm -rf /"), ProofError,
                          has_kind(ErrorKind::InvalidArgument));
    BOOST_CHECK_EXCEPTION(client.locate_block("abc"), ProofError, has_kind(ErrorKind::InvalidArgument));
}

BOOST_AUTO_TEST_SUITE_END()

#include "bitcoin_cli.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include <array>
#include <memory>
#include <cstdio>
#include <sys/wait.h>

namespace txproof {

using json = nlohmann::json;

namespace {

void require_hash(const std::string& value, const char* what) {
    if (!HexUtils::is_hash_hex(value)) {
        throw ProofError(ErrorKind::InvalidArgument,
            std::string("Invalid ") + what + " '" + value + "': expected 64 hex characters");
    }
}

std::string required_string(const json& j, const char* key, const char* context) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        throw ProofError(ErrorKind::NodeError,
            std::string("Node reply for ") + context + " lacks string field '" + key + "'");
    }
    return j.at(key).get<std::string>();
}

uint32_t required_height(const json& j, const char* context) {
    if (!j.contains("height") || !j.at("height").is_number_unsigned()) {
        throw ProofError(ErrorKind::NodeError,
            std::string("Node reply for ") + context + " lacks numeric field 'height'");
    }
    return j.at("height").get<uint32_t>();
}

} // namespace

std::string BitcoinCLI::shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string BitcoinCLI::build_command(const std::vector<std::string>& args) const {
    std::string cmd = shell_quote(config_.cli_path);
    cmd += " " + shell_quote("-chain=" + config_.chain);
    cmd += " " + shell_quote("-rpcconnect=" + config_.host);
    cmd += " " + shell_quote("-rpcport=" + std::to_string(config_.port));
    cmd += " " + shell_quote("-rpcclienttimeout=" + std::to_string(config_.timeout_seconds));
    if (!config_.user.empty()) {
        cmd += " " + shell_quote("-rpcuser=" + config_.user);
        cmd += " " + shell_quote("-rpcpassword=" + config_.password);
    }
    for (const auto& arg : args) {
        cmd += " " + shell_quote(arg);
    }
    cmd += " 2>&1";  // Capture stderr too
    return cmd;
}

BitcoinCLI::Result BitcoinCLI::run(const std::vector<std::string>& args) const {
    const std::string full_cmd = build_command(args);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(
        popen(full_cmd.c_str(), "r"),
        pclose
    );

    if (!pipe) {
        throw ProofError(ErrorKind::NodeError,
            "Failed to execute " + config_.cli_path + ". Make sure it is installed and in your PATH.");
    }

    Result result;
    std::array<char, 4096> buffer;
    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(pipe.release());
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

    // Remove trailing newlines
    while (!result.output.empty() && (result.output.back() == '\n' || result.output.back() == '\r')) {
        result.output.pop_back();
    }

    return result;
}

std::string BitcoinCLI::execute(const std::vector<std::string>& args) const {
    const std::string method = args.empty() ? std::string("<none>") : args.front();
    Result result = run(args);

    if (result.exit_code != 0) {
        throw ProofError(ErrorKind::NodeError,
            "bitcoin-cli " + method + " failed with exit code " +
            std::to_string(result.exit_code) + ". Output: " + result.output);
    }

    if (result.output.empty()) {
        throw ProofError(ErrorKind::NodeError, "Empty response from bitcoin-cli " + method);
    }

    return result.output;
}

json BitcoinCLI::execute_json(const std::vector<std::string>& args) const {
    std::string output = execute(args);
    try {
        return json::parse(output);
    } catch (const json::exception& e) {
        throw ProofError(ErrorKind::NodeError,
            std::string("Failed to parse JSON response: ") + e.what());
    }
}

std::optional<int> BitcoinCLI::rpc_error_code(const std::string& output) {
    static const std::string tag = "error code: ";
    auto pos = output.find(tag);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoi(output.substr(pos + tag.size()));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// BitcoinCliNodeClient

std::string BitcoinCliNodeClient::best_block_hash() {
    std::string hash = HexUtils::normalize(cli_.execute({"getbestblockhash"}));
    if (!HexUtils::is_hash_hex(hash)) {
        throw ProofError(ErrorKind::NodeError, "Unexpected getbestblockhash reply: " + hash);
    }
    return hash;
}

// getrawtransaction <txid> true needs -txindex (or the tx in the mempool).
// RPC error -5 means the node does not know the transaction.
std::optional<std::string> BitcoinCliNodeClient::locate_block(const std::string& txid) {
    require_hash(txid, "txid");

    auto result = cli_.run({"getrawtransaction", txid, "true"});
    if (result.exit_code != 0) {
        if (BitcoinCLI::rpc_error_code(result.output) == -5) {
            Log::debug("Node does not know transaction " + txid);
            return std::nullopt;
        }
        throw ProofError(ErrorKind::NodeError,
            "bitcoin-cli getrawtransaction failed with exit code " +
            std::to_string(result.exit_code) + ". Output: " + result.output);
    }

    try {
        json tx = json::parse(result.output);
        if (tx.contains("blockhash") && tx.at("blockhash").is_string()) {
            return HexUtils::normalize(tx.at("blockhash").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ProofError(ErrorKind::NodeError,
            std::string("Failed to parse getrawtransaction response: ") + e.what());
    }

    // Known but unconfirmed
    return std::nullopt;
}

std::vector<uint8_t> BitcoinCliNodeClient::fetch_header_bytes(const std::string& block_hash) {
    try {
        auto header = HexUtils::decode(cli_.execute({"getblockheader", block_hash, "false"}));
        if (header.size() != BLOCK_HEADER_SIZE) {
            throw ProofError(ErrorKind::NodeError,
                "Header for " + block_hash + " is " + std::to_string(header.size()) + " bytes");
        }
        return header;
    } catch (const ProofError& e) {
        if (e.kind() == ErrorKind::InvalidArgument) {
            throw ProofError(ErrorKind::NodeError, std::string("Header hex: ") + e.what());
        }
        throw;
    }
}

NodeBlock BitcoinCliNodeClient::get_block(const std::string& block_hash) {
    require_hash(block_hash, "block hash");
    json block = cli_.execute_json({"getblock", block_hash, "2"});
    return parse_verbose_block(block, fetch_header_bytes(block_hash));
}

BlockRef BitcoinCliNodeClient::get_block_header(const std::string& block_hash) {
    require_hash(block_hash, "block hash");
    json header = cli_.execute_json({"getblockheader", block_hash, "true"});
    return parse_block_header(header, fetch_header_bytes(block_hash));
}

std::vector<uint8_t> BitcoinCliNodeClient::get_raw_block(const std::string& block_hash) {
    require_hash(block_hash, "block hash");
    std::string block_hex = cli_.execute({"getblock", block_hash, "0"});
    try {
        return HexUtils::decode(block_hex);
    } catch (const ProofError& e) {
        throw ProofError(ErrorKind::NodeError, std::string("Raw block hex: ") + e.what());
    }
}

BlockRef BitcoinCliNodeClient::parse_block_header(const json& header, std::vector<uint8_t> header_bytes) {
    BlockRef ref;
    ref.hash = HexUtils::normalize(required_string(header, "hash", "block header"));
    ref.height = required_height(header, "block header");
    ref.merkle_root_display = HexUtils::normalize(required_string(header, "merkleroot", "block header"));
    ref.header_bytes = std::move(header_bytes);
    return ref;
}

// getblock <hash> 2 returns every transaction decoded, including:
// - "txid": id without witness
// - "hash": id including witness (equal to txid for legacy transactions)
// - "hex" : serialized transaction
// Nodes predating segwit omit "hash", and pruned or filtered replies may
// omit "hex"; such blocks cannot be proven from this reply alone.
NodeBlock BitcoinCliNodeClient::parse_verbose_block(const json& block, std::vector<uint8_t> header_bytes) {
    NodeBlock result;
    result.ref = parse_block_header(block, std::move(header_bytes));

    if (!block.contains("tx") || !block.at("tx").is_array()) {
        throw ProofError(ErrorKind::NodeError, "Node reply for block " + result.ref.hash + " lacks 'tx' array");
    }

    const auto& txs = block.at("tx");
    result.transactions.reserve(txs.size());
    for (const auto& tx : txs) {
        if (!tx.is_object()) {
            throw ProofError(ErrorKind::UnsupportedTransactionFormat,
                "Block " + result.ref.hash + " was not returned with decoded transactions");
        }

        TxRecord record;
        record.txid_display = HexUtils::normalize(required_string(tx, "txid", "transaction"));

        if (!tx.contains("hash") || !tx.at("hash").is_string()) {
            throw ProofError(ErrorKind::UnsupportedTransactionFormat,
                "Node did not report wtxid for " + record.txid_display);
        }
        if (!tx.contains("hex") || !tx.at("hex").is_string()) {
            throw ProofError(ErrorKind::UnsupportedTransactionFormat,
                "Node did not report raw hex for " + record.txid_display);
        }

        record.wtxid_display = HexUtils::normalize(tx.at("hash").get<std::string>());
        record.raw_hex = tx.at("hex").get<std::string>();
        result.transactions.push_back(std::move(record));
    }

    return result;
}

} // namespace txproof

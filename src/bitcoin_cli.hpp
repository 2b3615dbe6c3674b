/**
 * Bitcoin CLI Interface
 *
 * Wraps the bitcoin-cli command line tool and exposes it as a NodeClient.
 * bitcoin-cli handles RPC authentication, transport and the per-call
 * timeout (-rpcclienttimeout); this class builds the command line, runs it
 * and turns the JSON replies into BlockRef / TxRecord values.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "node_client.hpp"

namespace txproof {

/**
 * BitcoinCLI class
 *
 * Executes bitcoin-cli commands against the configured node.
 *
 * Features:
 * Connection flags (host, port, credentials, chain, timeout) from RpcConfig
 * Captures stdout and stderr of the command
 * Reports failures as ProofError(NodeError), keeping the RPC error code
 */
class BitcoinCLI {
public:
    // Exit status and combined stdout/stderr of one invocation
    struct Result {
        int exit_code = 0;
        std::string output;
    };

    explicit BitcoinCLI(RpcConfig config) : config_(std::move(config)) {}

    // Run a command without interpreting its exit status
    Result run(const std::vector<std::string>& args) const;

    /**
     * Execute a bitcoin-cli command and return its trimmed output
     *
     * Parameters:
     * args - RPC method and arguments; every argument is shell-quoted
     *
     * Throws:
     * ProofError(NodeError) if the command fails; the RPC error code printed
     * by bitcoin-cli ("error code: -5") is available via rpc_error_code()
     */
    std::string execute(const std::vector<std::string>& args) const;

    // Execute and parse the output as JSON
    nlohmann::json execute_json(const std::vector<std::string>& args) const;

    // Extracts N from "error code: N" in bitcoin-cli error output
    static std::optional<int> rpc_error_code(const std::string& output);

    static std::string shell_quote(const std::string& arg);

private:
    std::string build_command(const std::vector<std::string>& args) const;

    RpcConfig config_;
};

// NodeClient backed by bitcoin-cli
class BitcoinCliNodeClient : public NodeClient {
public:
    explicit BitcoinCliNodeClient(const RpcConfig& config) : cli_(config) {}

    std::string best_block_hash() override;
    std::optional<std::string> locate_block(const std::string& txid) override;
    NodeBlock get_block(const std::string& block_hash) override;
    BlockRef get_block_header(const std::string& block_hash) override;
    std::vector<uint8_t> get_raw_block(const std::string& block_hash) override;

    // Converts a getblock verbosity 2 reply. Transactions without "hash" or
    // "hex" fields are reported as UnsupportedTransactionFormat.
    static NodeBlock parse_verbose_block(const nlohmann::json& block, std::vector<uint8_t> header_bytes);

    // Converts a getblockheader verbose reply
    static BlockRef parse_block_header(const nlohmann::json& header, std::vector<uint8_t> header_bytes);

private:
    std::vector<uint8_t> fetch_header_bytes(const std::string& block_hash);

    BitcoinCLI cli_;
};

} // namespace txproof

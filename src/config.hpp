#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "consts.hpp"
#include "log.hpp"
#include "proof_assembler.hpp"

namespace txproof {

// How to reach the node through bitcoin-cli
struct RpcConfig {
    std::string cli_path = "bitcoin-cli";
    std::string host = "127.0.0.1";
    uint16_t port = DEFAULT_RPC_PORT;
    std::string user;
    std::string password;
    std::string chain = "main";          // main, test, testnet4, signet, regtest
    int timeout_seconds = DEFAULT_RPC_TIMEOUT_SECONDS;
};

// Quota for the alternate (raw block) strategy, per caller
struct AlternateQuota {
    size_t max_requests = DEFAULT_ALTERNATE_QUOTA;
    std::chrono::seconds window = DEFAULT_ALTERNATE_WINDOW;
};

struct Config {
    RpcConfig rpc;
    size_t worker_threads = DEFAULT_WORKER_THREADS;
    AlternateQuota alternate_quota;
    CommitmentPolicy commitment_policy = CommitmentPolicy::Fail;
    // Transaction versions the primary strategy accepts from the node
    std::vector<int32_t> primary_tx_versions = {1, 2};
    LogLevel log_level = LogLevel::Info;

    // Reads a JSON config file; keys that are absent keep their defaults
    static Config from_file(const std::string& path);

    // Parses a JSON document on top of the defaults
    static Config from_json(const nlohmann::json& j);

    // Applies RPC_HOST, RPC_PORT, RPC_USER, RPC_PASS and TXPROOF_* overrides
    void apply_env();

    // Rejects values that cannot work (zero workers, zero quota, ...)
    void validate() const;
};

} // namespace txproof

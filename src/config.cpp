#include "config.hpp"
#include "error.hpp"
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <fstream>

namespace txproof {

using json = nlohmann::json;

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

unsigned long parse_number(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        unsigned long number = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return number;
    } catch (const std::exception&) {
        throw ProofError(ErrorKind::InvalidArgument, name + " must be a non-negative integer, got '" + value + "'");
    }
}

} // namespace

// Config file layout:
// {
//   "rpc": { "cli": "bitcoin-cli", "host": "127.0.0.1", "port": 8332,
//            "user": "", "password": "", "chain": "main", "timeout_seconds": 30 },
//   "worker_threads": 4,
//   "alternate_quota": { "max_requests": 5, "window_seconds": 3600 },
//   "commitment_policy": "fail",
//   "primary_tx_versions": [1, 2],
//   "log_level": "info"
// }
Config Config::from_json(const json& j) {
    Config config;
    try {
        if (j.contains("rpc")) {
            const auto& rpc = j.at("rpc");
            config.rpc.cli_path = rpc.value("cli", config.rpc.cli_path);
            config.rpc.host = rpc.value("host", config.rpc.host);
            config.rpc.port = rpc.value("port", config.rpc.port);
            config.rpc.user = rpc.value("user", config.rpc.user);
            config.rpc.password = rpc.value("password", config.rpc.password);
            config.rpc.chain = rpc.value("chain", config.rpc.chain);
            config.rpc.timeout_seconds = rpc.value("timeout_seconds", config.rpc.timeout_seconds);
        }

        config.worker_threads = j.value("worker_threads", config.worker_threads);

        if (j.contains("alternate_quota")) {
            const auto& quota = j.at("alternate_quota");
            config.alternate_quota.max_requests = quota.value("max_requests", config.alternate_quota.max_requests);
            config.alternate_quota.window = std::chrono::seconds(
                quota.value("window_seconds", static_cast<int64_t>(config.alternate_quota.window.count())));
        }

        if (j.contains("commitment_policy")) {
            config.commitment_policy = parse_commitment_policy(j.at("commitment_policy").get<std::string>());
        }

        if (j.contains("primary_tx_versions")) {
            config.primary_tx_versions = j.at("primary_tx_versions").get<std::vector<int32_t>>();
        }

        if (j.contains("log_level")) {
            config.log_level = Log::parse_level(j.at("log_level").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ProofError(ErrorKind::InvalidArgument, std::string("Invalid config: ") + e.what());
    }

    return config;
}

Config Config::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ProofError(ErrorKind::InvalidArgument, "Failed to open config file " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ProofError(ErrorKind::InvalidArgument, "Failed to parse config file " + path + ": " + e.what());
    }
    return from_json(j);
}

// Environment variable names for the node connection match the ones the
// service has always been deployed with (RPC_HOST, RPC_PORT, ...)
void Config::apply_env() {
    if (auto v = env("RPC_HOST")) rpc.host = *v;
    if (auto v = env("RPC_PORT")) {
        auto port = parse_number("RPC_PORT", *v);
        if (port == 0 || port > 65535) {
            throw ProofError(ErrorKind::InvalidArgument, "RPC_PORT out of range: " + *v);
        }
        rpc.port = static_cast<uint16_t>(port);
    }
    if (auto v = env("RPC_USER")) rpc.user = *v;
    if (auto v = env("RPC_PASS")) rpc.password = *v;
    if (auto v = env("TXPROOF_CHAIN")) rpc.chain = *v;
    if (auto v = env("TXPROOF_CLI")) rpc.cli_path = *v;
    if (auto v = env("TXPROOF_RPC_TIMEOUT")) {
        rpc.timeout_seconds = static_cast<int>(parse_number("TXPROOF_RPC_TIMEOUT", *v));
    }
    if (auto v = env("TXPROOF_WORKERS")) worker_threads = parse_number("TXPROOF_WORKERS", *v);
    if (auto v = env("TXPROOF_ALT_QUOTA")) alternate_quota.max_requests = parse_number("TXPROOF_ALT_QUOTA", *v);
    if (auto v = env("TXPROOF_ALT_WINDOW")) {
        alternate_quota.window = std::chrono::seconds(parse_number("TXPROOF_ALT_WINDOW", *v));
    }
    if (auto v = env("TXPROOF_COMMITMENT_POLICY")) commitment_policy = parse_commitment_policy(*v);
    if (auto v = env("TXPROOF_LOG_LEVEL")) log_level = Log::parse_level(*v);
}

void Config::validate() const {
    if (worker_threads == 0) {
        throw ProofError(ErrorKind::InvalidArgument, "worker_threads must be at least 1");
    }
    if (alternate_quota.max_requests == 0) {
        throw ProofError(ErrorKind::InvalidArgument, "alternate_quota.max_requests must be at least 1");
    }
    if (alternate_quota.window.count() <= 0) {
        throw ProofError(ErrorKind::InvalidArgument, "alternate_quota.window_seconds must be positive");
    }
    if (rpc.timeout_seconds <= 0) {
        throw ProofError(ErrorKind::InvalidArgument, "rpc.timeout_seconds must be positive");
    }
    if (primary_tx_versions.empty()) {
        throw ProofError(ErrorKind::InvalidArgument, "primary_tx_versions must not be empty");
    }
}

} // namespace txproof

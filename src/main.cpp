// Transaction Inclusion Proof Tool
//
// This file is the entry point for txproof, a command line tool that builds
// Merkle inclusion proofs for Bitcoin transactions. It talks to a Bitcoin
// Core node through bitcoin-cli and prints, for every requested transaction,
// a JSON document that an on-chain or off-chain verifier can check against
// the block header alone.
//
// Key Features:
// - Proves legacy transactions against the header's Merkle root.
// - Proves segwit transactions against the witness Merkle root and the
//   BIP141 commitment carried by the coinbase.
// - Falls back to decoding the raw block locally when the node's decoded
//   view of a transaction cannot be used.
// - Runs all requested proofs concurrently and deduplicates repeated txids.
//
// Usage:
//   txproof [--config FILE] [--caller ID] [--alternate] <txid>[:<blockhash>]...
//
// The exit status is non-zero when any of the requested proofs failed.

#include "bitcoin_cli.hpp"
#include "config.hpp"
#include "log.hpp"
#include "proof_formatter.hpp"
#include "proof_orchestrator.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

struct Arguments {
    std::string config_path;
    std::string caller = "cli";
    bool force_alternate = false;
    std::vector<txproof::ProofRequest> requests;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--caller ID] [--alternate] <txid>[:<blockhash>]..." << std::endl;
}

// Splits "<txid>[:<blockhash>]" into a request
txproof::ProofRequest parse_target(const std::string& target) {
    txproof::ProofRequest request;
    auto separator = target.find(':');
    if (separator == std::string::npos) {
        request.txid = target;
    } else {
        request.txid = target.substr(0, separator);
        request.block_hash = target.substr(separator + 1);
    }
    return request;
}

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;
    std::vector<std::string> targets;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--caller") {
            if (i + 1 >= argc) {
                throw txproof::ProofError(txproof::ErrorKind::InvalidArgument, arg + " needs a value");
            }
            (arg == "--config" ? args.config_path : args.caller) = argv[++i];
        } else if (arg == "--alternate") {
            args.force_alternate = true;
        } else if (arg.starts_with("--")) {
            throw txproof::ProofError(txproof::ErrorKind::InvalidArgument, "Unknown option: " + arg);
        } else {
            targets.push_back(arg);
        }
    }

    if (targets.empty()) {
        throw txproof::ProofError(txproof::ErrorKind::InvalidArgument, "No transaction ids given");
    }

    for (const auto& target : targets) {
        auto request = parse_target(target);
        request.caller = args.caller;
        request.force_alternate = args.force_alternate;
        args.requests.push_back(std::move(request));
    }
    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const txproof::ProofError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    try {
        // Defaults, then the config file, then the environment
        txproof::Config config = args.config_path.empty()
            ? txproof::Config{}
            : txproof::Config::from_file(args.config_path);
        config.apply_env();
        config.validate();
        txproof::Log::set_level(config.log_level);

        // The node client must outlive the orchestrator and its workers
        txproof::BitcoinCliNodeClient node(config.rpc);
        auto orchestrator = txproof::ProofOrchestrator::from_config(node, config);

        // Start every job up front so they run concurrently
        std::vector<std::string> job_ids;
        bool failed = false;
        for (const auto& request : args.requests) {
            try {
                job_ids.push_back(orchestrator->start_job(request));
            } catch (const txproof::ProofError& e) {
                failed = true;
                std::cerr << "Error: " << request.txid << ": " << txproof::to_string(e.kind())
                          << ": " << e.what() << std::endl;
            }
        }

        // Poll each job until it settles, printing results in request order
        for (const auto& job_id : job_ids) {
            txproof::JobSnapshot snapshot = orchestrator->poll_job(job_id);
            while (snapshot.status == txproof::JobStatus::Pending ||
                   snapshot.status == txproof::JobStatus::Running) {
                std::this_thread::sleep_for(POLL_INTERVAL);
                snapshot = orchestrator->poll_job(job_id);
            }

            if (snapshot.status == txproof::JobStatus::Failed) {
                failed = true;
                std::cerr << "Error: " << snapshot.txid << ": "
                          << (snapshot.error ? txproof::to_string(*snapshot.error) : "unknown")
                          << ": " << snapshot.error_message << std::endl;
                continue;
            }

            std::cout << std::setw(4) << txproof::ProofFormatter::to_json(*snapshot.result) << std::endl;
        }

        return failed ? 1 : 0;

    } catch (const std::exception& e) {
        // Central error handling for configuration and setup failures
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "config.hpp"
#include "error.hpp"
#include "node_client.hpp"
#include "proof_types.hpp"
#include "rate_limiter.hpp"
#include "strategy.hpp"
#include "worker_pool.hpp"

namespace txproof {

using ProofHandle = std::shared_ptr<const TransactionProofSet>;

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed
};

const char* to_string(JobStatus status);

// Point-in-time view of a job for pollers
struct JobSnapshot {
    std::string job_id;
    std::string txid;
    JobStatus status = JobStatus::Pending;
    ProofHandle result;                                  // Set when Completed
    std::optional<ErrorKind> error;                      // Set when Failed
    std::string error_message;
    std::optional<std::chrono::seconds> retry_after;     // Set for RateLimited
    std::string strategy;                                // Strategy that produced the outcome
    std::chrono::milliseconds elapsed{0};
};

struct OrchestratorOptions {
    size_t worker_threads = DEFAULT_WORKER_THREADS;
    AlternateQuota alternate_quota;
    RateLimiter::NowFn clock = &RateLimiter::Clock::now;
};

/**
 * ProofOrchestrator
 *
 * Runs proof computations as jobs keyed by txid.
 *
 * - At most one computation per txid is in flight; concurrent requests for
 *   the same txid share it and all observe the same result or error.
 * - Completed proofs are cached for the lifetime of the process. Proofs of
 *   confirmed transactions never change.
 * - Failed jobs are not cached; the next request starts a fresh job.
 * - The primary strategy runs first. Failures the fallback table maps to
 *   UseAlternate are retried once with the alternate strategy, charged
 *   against the caller's quota.
 *
 * Locks are held only for table updates, never while a strategy runs.
 */
class ProofOrchestrator {
public:
    ProofOrchestrator(std::unique_ptr<ProofStrategy> primary,
                      std::unique_ptr<ProofStrategy> alternate,
                      const OrchestratorOptions& options);

    // Wires the primary and alternate strategies against node
    static std::unique_ptr<ProofOrchestrator> from_config(NodeClient& node, const Config& config);

    ProofOrchestrator(const ProofOrchestrator&) = delete;
    ProofOrchestrator& operator=(const ProofOrchestrator&) = delete;

    // Blocks until the proof for request.txid is available.
    // Throws the job's ProofError when it fails.
    ProofHandle request_proof(const ProofRequest& request);

    // Starts (or joins) the job for request.txid and returns its id.
    // One job record is kept per txid: a cached txid returns the id of the
    // job that produced the cached proof.
    std::string start_job(const ProofRequest& request);

    // Throws ProofError(JobNotFound) for unknown ids
    JobSnapshot poll_job(const std::string& job_id) const;

    // Administrative resets. A job still running for a cleared txid
    // finishes for its existing waiters but no longer fills the cache.
    void clear_cached(const std::string& txid);
    void clear_all();

    size_t cache_size() const;
    size_t inflight_count() const;
    size_t job_count() const;

private:
    struct ProofJob {
        std::string id;
        std::string txid;
        JobStatus status = JobStatus::Pending;
        std::promise<ProofHandle> promise;
        std::shared_future<ProofHandle> future;
        std::chrono::steady_clock::time_point started_at;
        std::optional<std::chrono::steady_clock::time_point> finished_at;
        ProofHandle result;
        std::optional<ErrorKind> error;
        std::string error_message;
        std::optional<std::chrono::seconds> retry_after;
        std::string strategy;
    };

    static ProofRequest normalize(const ProofRequest& request);

    // Returns the job serving request, creating and scheduling it if needed.
    // Must be called with mutex_ held.
    std::shared_ptr<ProofJob> acquire_job_locked(const ProofRequest& request);
    std::shared_ptr<ProofJob> new_job_locked(const std::string& txid);
    // Drops the finished job record kept for txid, if any
    void forget_finished_job_locked(const std::string& txid);

    void execute(const std::shared_ptr<ProofJob>& job, const ProofRequest& request);
    ProofHandle run_pipeline(const ProofRequest& request, std::string& strategy_used);
    ProofHandle run_alternate(const ProofRequest& request, std::string& strategy_used);

    std::unique_ptr<ProofStrategy> primary_;
    std::unique_ptr<ProofStrategy> alternate_;
    RateLimiter alternate_limiter_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProofHandle> cache_;                   // txid -> proof
    std::unordered_map<std::string, std::shared_ptr<ProofJob>> inflight_;  // txid -> running job
    std::unordered_map<std::string, std::shared_ptr<ProofJob>> jobs_;      // job id -> job
    std::unordered_map<std::string, std::string> latest_job_;              // txid -> newest job id
    uint64_t next_job_id_ = 1;

    // Declared last so queued jobs finish before the tables above go away
    WorkerPool pool_;
};

} // namespace txproof

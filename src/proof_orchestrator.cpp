#include "proof_orchestrator.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include <exception>

namespace txproof {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

ProofOrchestrator::ProofOrchestrator(std::unique_ptr<ProofStrategy> primary,
                                     std::unique_ptr<ProofStrategy> alternate,
                                     const OrchestratorOptions& options)
    : primary_(std::move(primary))
    , alternate_(std::move(alternate))
    , alternate_limiter_(options.alternate_quota.max_requests, options.alternate_quota.window, options.clock)
    , pool_(options.worker_threads)
{
    if (!primary_ || !alternate_) {
        throw ProofError(ErrorKind::InvalidArgument, "ProofOrchestrator needs both a primary and an alternate strategy");
    }
}

std::unique_ptr<ProofOrchestrator> ProofOrchestrator::from_config(NodeClient& node, const Config& config) {
    ProofAssembler assembler(config.commitment_policy);
    OrchestratorOptions options{
        .worker_threads = config.worker_threads,
        .alternate_quota = config.alternate_quota,
    };
    return std::make_unique<ProofOrchestrator>(
        std::make_unique<PrimaryStrategy>(node, assembler, config.primary_tx_versions),
        std::make_unique<AlternateStrategy>(node, assembler),
        options);
}

ProofRequest ProofOrchestrator::normalize(const ProofRequest& request) {
    if (!HexUtils::is_hash_hex(request.txid)) {
        throw ProofError(ErrorKind::InvalidArgument, "Invalid txid: '" + request.txid + "'");
    }

    ProofRequest normalized = request;
    normalized.txid = HexUtils::normalize(request.txid);

    if (normalized.block_hash && normalized.block_hash->empty()) {
        normalized.block_hash.reset();
    }
    if (normalized.block_hash) {
        if (!HexUtils::is_hash_hex(*normalized.block_hash)) {
            throw ProofError(ErrorKind::InvalidArgument, "Invalid block hash: '" + *normalized.block_hash + "'");
        }
        normalized.block_hash = HexUtils::normalize(*normalized.block_hash);
    }

    if (normalized.caller.empty()) {
        normalized.caller = "anonymous";
    }
    return normalized;
}

ProofHandle ProofOrchestrator::request_proof(const ProofRequest& request) {
    const ProofRequest normalized = normalize(request);

    std::shared_future<ProofHandle> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = cache_.find(normalized.txid);
        if (cached != cache_.end()) {
            Log::debug("Cache hit for " + normalized.txid);
            return cached->second;
        }
        future = acquire_job_locked(normalized)->future;
    }

    // Rethrows the job's ProofError for every waiter
    return future.get();
}

std::string ProofOrchestrator::start_job(const ProofRequest& request) {
    const ProofRequest normalized = normalize(request);

    std::lock_guard<std::mutex> lock(mutex_);
    return acquire_job_locked(normalized)->id;
}

void ProofOrchestrator::forget_finished_job_locked(const std::string& txid) {
    auto latest = latest_job_.find(txid);
    if (latest == latest_job_.end()) {
        return;
    }
    auto job = jobs_.find(latest->second);
    if (job != jobs_.end()) {
        const JobStatus status = job->second->status;
        if (status != JobStatus::Completed && status != JobStatus::Failed) {
            return;  // still running; it is dropped when it finishes
        }
        jobs_.erase(job);
    }
    latest_job_.erase(latest);
}

std::shared_ptr<ProofOrchestrator::ProofJob> ProofOrchestrator::new_job_locked(const std::string& txid) {
    forget_finished_job_locked(txid);

    auto job = std::make_shared<ProofJob>();
    job->id = "job-" + std::to_string(next_job_id_++);
    job->txid = txid;
    job->future = job->promise.get_future().share();
    job->started_at = std::chrono::steady_clock::now();
    jobs_[job->id] = job;
    latest_job_[txid] = job->id;
    return job;
}

std::shared_ptr<ProofOrchestrator::ProofJob> ProofOrchestrator::acquire_job_locked(const ProofRequest& request) {
    // Cached: hand back the job that produced the proof, or a completed record
    auto cached = cache_.find(request.txid);
    if (cached != cache_.end()) {
        auto latest = latest_job_.find(request.txid);
        if (latest != latest_job_.end()) {
            auto existing = jobs_.find(latest->second);
            if (existing != jobs_.end() && existing->second->result == cached->second) {
                return existing->second;
            }
        }

        auto job = new_job_locked(request.txid);
        job->status = JobStatus::Completed;
        job->result = cached->second;
        job->strategy = "cache";
        job->finished_at = job->started_at;
        job->promise.set_value(cached->second);
        Log::debug("Job " + job->id + " served from cache for " + request.txid);
        return job;
    }

    // Someone is already computing this txid: share their job
    auto running = inflight_.find(request.txid);
    if (running != inflight_.end()) {
        Log::debug("Joining in-flight job " + running->second->id + " for " + request.txid);
        return running->second;
    }

    // A forced alternate run that the quota would refuse fails before any job exists
    if (request.force_alternate) {
        RateLimiter::Decision decision = alternate_limiter_.check(request.caller);
        if (!decision.allowed) {
            throw ProofError(ErrorKind::RateLimited,
                "Alternate quota exhausted for caller '" + request.caller + "'",
                decision.retry_after);
        }
    }

    auto job = new_job_locked(request.txid);
    inflight_[request.txid] = job;
    Log::info("Started " + job->id + " for " + request.txid);

    try {
        pool_.submit([this, job, request] { execute(job, request); });
    } catch (const ProofError&) {
        inflight_.erase(request.txid);
        jobs_.erase(job->id);
        latest_job_.erase(request.txid);
        throw;
    }
    return job;
}

void ProofOrchestrator::execute(const std::shared_ptr<ProofJob>& job, const ProofRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->status = JobStatus::Running;
    }

    std::string strategy_used;
    ProofHandle result;
    std::exception_ptr failure;
    std::optional<ErrorKind> kind;
    std::string message;
    std::optional<std::chrono::seconds> retry_after;

    try {
        result = run_pipeline(request, strategy_used);
    } catch (const ProofError& e) {
        failure = std::current_exception();
        kind = e.kind();
        message = e.what();
        retry_after = e.retry_after();
    } catch (const std::exception& e) {
        ProofError wrapped(ErrorKind::Internal, e.what());
        failure = std::make_exception_ptr(wrapped);
        kind = ErrorKind::Internal;
        message = wrapped.what();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->strategy = strategy_used;
        job->finished_at = std::chrono::steady_clock::now();

        auto current = inflight_.find(job->txid);
        const bool still_owner = current != inflight_.end() && current->second == job;

        if (failure) {
            job->status = JobStatus::Failed;
            job->error = kind;
            job->error_message = message;
            job->retry_after = retry_after;
        } else {
            job->status = JobStatus::Completed;
            job->result = result;
            if (still_owner) {
                cache_[job->txid] = result;
            }
        }

        if (still_owner) {
            inflight_.erase(current);
        }

        // A newer job replaced this one after a clear; nobody can poll it any more
        auto latest = latest_job_.find(job->txid);
        if (latest == latest_job_.end() || latest->second != job->id) {
            jobs_.erase(job->id);
        }
    }

    if (failure) {
        Log::warn(job->id + " failed for " + job->txid + ": " + to_string(*kind) + ": " + message);
        job->promise.set_exception(failure);
    } else {
        Log::info(job->id + " completed for " + job->txid + " via " + strategy_used);
        job->promise.set_value(result);
    }
}

ProofHandle ProofOrchestrator::run_pipeline(const ProofRequest& request, std::string& strategy_used) {
    if (request.force_alternate) {
        return run_alternate(request, strategy_used);
    }

    try {
        strategy_used = primary_->name();
        return std::make_shared<const TransactionProofSet>(primary_->run(request));
    } catch (const ProofError& e) {
        if (fallback_for(e.kind()) != FallbackAction::UseAlternate) {
            throw;
        }
        Log::warn("Primary strategy could not handle " + request.txid + " (" + e.what() +
                  "); falling back to alternate");
    }

    return run_alternate(request, strategy_used);
}

ProofHandle ProofOrchestrator::run_alternate(const ProofRequest& request, std::string& strategy_used) {
    strategy_used = alternate_->name();

    RateLimiter::Decision decision = alternate_limiter_.try_acquire(request.caller);
    if (!decision.allowed) {
        throw ProofError(ErrorKind::RateLimited,
            "Alternate quota exhausted for caller '" + request.caller + "'",
            decision.retry_after);
    }

    return std::make_shared<const TransactionProofSet>(alternate_->run(request));
}

JobSnapshot ProofOrchestrator::poll_job(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = jobs_.find(job_id);
    if (found == jobs_.end()) {
        throw ProofError(ErrorKind::JobNotFound, "Unknown job id: " + job_id);
    }

    const ProofJob& job = *found->second;
    JobSnapshot snapshot;
    snapshot.job_id = job.id;
    snapshot.txid = job.txid;
    snapshot.status = job.status;
    snapshot.result = job.result;
    snapshot.error = job.error;
    snapshot.error_message = job.error_message;
    snapshot.retry_after = job.retry_after;
    snapshot.strategy = job.strategy;

    const auto end = job.finished_at.value_or(std::chrono::steady_clock::now());
    snapshot.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - job.started_at);
    return snapshot;
}

void ProofOrchestrator::clear_cached(const std::string& txid) {
    const std::string key = HexUtils::normalize(txid);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(key);
    inflight_.erase(key);
    forget_finished_job_locked(key);
    Log::info("Cleared cached proof for " + key);
}

void ProofOrchestrator::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    inflight_.clear();
    for (auto it = latest_job_.begin(); it != latest_job_.end();) {
        auto job = jobs_.find(it->second);
        if (job != jobs_.end() && job->second->status != JobStatus::Completed &&
            job->second->status != JobStatus::Failed) {
            ++it;
            continue;
        }
        if (job != jobs_.end()) {
            jobs_.erase(job);
        }
        it = latest_job_.erase(it);
    }
    Log::info("Cleared all cached proofs");
}

size_t ProofOrchestrator::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

size_t ProofOrchestrator::inflight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_.size();
}

size_t ProofOrchestrator::job_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

} // namespace txproof

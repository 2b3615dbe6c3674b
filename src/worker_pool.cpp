#include "worker_pool.hpp"
#include "error.hpp"
#include "log.hpp"

namespace txproof {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        throw ProofError(ErrorKind::InvalidArgument, "WorkerPool needs at least one thread");
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    ready_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ProofError(ErrorKind::Internal, "WorkerPool is shutting down");
        }
        tasks_.push_back(std::move(task));
    }
    ready_.notify_one();
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        // Tasks report their own failures; anything escaping is a bug
        try {
            task();
        } catch (const std::exception& e) {
            Log::error(std::string("Worker task threw: ") + e.what());
        }
    }
}

} // namespace txproof

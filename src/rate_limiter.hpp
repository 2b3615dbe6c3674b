#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace txproof {

// Per-caller quota over a rolling time window.
// Each caller may be granted max_requests within any span of `window`.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Decision {
        bool allowed = false;
        std::chrono::seconds retry_after{0};   // Only meaningful when denied
    };

    RateLimiter(size_t max_requests, std::chrono::seconds window, NowFn now = &Clock::now);

    // Records a grant for caller if the quota allows it
    Decision try_acquire(const std::string& caller);

    // Checks the quota without recording anything
    Decision check(const std::string& caller) const;

    // Grants still counted against caller's current window
    size_t in_window(const std::string& caller) const;

private:
    Decision evaluate(std::deque<Clock::time_point>& grants, Clock::time_point now) const;
    void prune(std::deque<Clock::time_point>& grants, Clock::time_point now) const;

    size_t max_requests_;
    std::chrono::seconds window_;
    NowFn now_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, std::deque<Clock::time_point>> grants_;
};

} // namespace txproof

#include "rate_limiter.hpp"

namespace txproof {

RateLimiter::RateLimiter(size_t max_requests, std::chrono::seconds window, NowFn now)
    : max_requests_(max_requests)
    , window_(window)
    , now_(std::move(now))
{}

void RateLimiter::prune(std::deque<Clock::time_point>& grants, Clock::time_point now) const {
    while (!grants.empty() && now - grants.front() >= window_) {
        grants.pop_front();
    }
}

// The oldest grant in the window is the next one to expire, so the wait
// is the time until it leaves the window, rounded up to whole seconds
RateLimiter::Decision RateLimiter::evaluate(std::deque<Clock::time_point>& grants, Clock::time_point now) const {
    prune(grants, now);

    Decision decision;
    if (grants.size() < max_requests_) {
        decision.allowed = true;
        return decision;
    }

    auto wait = window_ - (now - grants.front());
    auto seconds = std::chrono::ceil<std::chrono::seconds>(wait);
    decision.retry_after = seconds.count() > 0 ? seconds : std::chrono::seconds(1);
    return decision;
}

RateLimiter::Decision RateLimiter::try_acquire(const std::string& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    auto& grants = grants_[caller];

    Decision decision = evaluate(grants, now);
    if (decision.allowed) {
        grants.push_back(now);
    }
    return decision;
}

RateLimiter::Decision RateLimiter::check(const std::string& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    if (it == grants_.end()) {
        return Decision{true, std::chrono::seconds(0)};
    }
    return evaluate(it->second, now_());
}

size_t RateLimiter::in_window(const std::string& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    if (it == grants_.end()) {
        return 0;
    }
    prune(it->second, now_());
    return it->second.size();
}

} // namespace txproof

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "config/config_schema.hpp"

namespace gexec::admission {

struct RateLimiterOptions {
    double rate_per_second = 5.0;
    int burst = 10;
    // Buckets untouched this long, and already refilled, are dropped.
    std::chrono::seconds idle_evict{600};
    std::size_t max_keys = 10000;

    static RateLimiterOptions FromConfig(const gexec::config::RateLimitConfig& config);
};

// Token bucket per caller key. New keys start with a full bucket.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit RateLimiter(RateLimiterOptions options, NowFn now = {});

    bool Allow(const std::string& key);

    std::size_t TrackedKeys() const;

private:
    struct Bucket {
        double tokens = 0.0;
        Clock::time_point last_refill;
    };

    void Refill(Bucket& bucket, Clock::time_point now) const;
    bool IsIdle(const Bucket& bucket, Clock::time_point now) const;
    void SweepIdle(Clock::time_point now);
    void EvictLeastRecent();

    RateLimiterOptions options_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
    Clock::time_point last_sweep_;
};

// First X-Forwarded-For entry when present, otherwise the peer address.
std::string CallerKey(const std::string& forwarded_for, const std::string& remote_addr);

}  // namespace gexec::admission

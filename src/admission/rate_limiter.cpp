#include "admission/rate_limiter.hpp"

#include <algorithm>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gexec::admission {
namespace {

constexpr double kEpsilon = 1e-9;

}  // namespace

RateLimiterOptions RateLimiterOptions::FromConfig(const gexec::config::RateLimitConfig& config) {
    RateLimiterOptions options{};
    options.rate_per_second = config.rate_per_second;
    options.burst = config.burst;
    options.idle_evict = std::chrono::seconds(config.idle_evict_s);
    options.max_keys = config.max_keys > 0 ? static_cast<std::size_t>(config.max_keys) : 1;
    return options;
}

RateLimiter::RateLimiter(RateLimiterOptions options, NowFn now)
    : options_(std::move(options))
    , now_(now ? std::move(now) : NowFn([] { return Clock::now(); }))
    , last_sweep_(now_()) {}

void RateLimiter::Refill(Bucket& bucket, Clock::time_point now) const {
    if (now <= bucket.last_refill) {
        return;
    }
    const std::chrono::duration<double> elapsed = now - bucket.last_refill;
    bucket.tokens = std::min(
        static_cast<double>(options_.burst),
        bucket.tokens + elapsed.count() * options_.rate_per_second);
    bucket.last_refill = now;
}

// An idle bucket that is already full behaves exactly like a new one.
bool RateLimiter::IsIdle(const Bucket& bucket, Clock::time_point now) const {
    if (now - bucket.last_refill < options_.idle_evict) {
        return false;
    }
    const std::chrono::duration<double> elapsed = now - bucket.last_refill;
    return bucket.tokens + elapsed.count() * options_.rate_per_second + kEpsilon >=
        static_cast<double>(options_.burst);
}

void RateLimiter::SweepIdle(Clock::time_point now) {
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (IsIdle(it->second, now)) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
    last_sweep_ = now;
}

void RateLimiter::EvictLeastRecent() {
    const auto oldest = std::min_element(buckets_.begin(), buckets_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second.last_refill < rhs.second.last_refill;
    });
    if (oldest != buckets_.end()) {
        utils::LogDebug("limiter", "evicting least recent caller", {{"key", oldest->first}});
        buckets_.erase(oldest);
    }
}

bool RateLimiter::Allow(const std::string& key) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);

    if (now - last_sweep_ >= options_.idle_evict) {
        SweepIdle(now);
    }

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        if (buckets_.size() >= options_.max_keys) {
            SweepIdle(now);
            if (buckets_.size() >= options_.max_keys) {
                EvictLeastRecent();
            }
        }
        it = buckets_.emplace(key, Bucket{static_cast<double>(options_.burst), now}).first;
    } else {
        Refill(it->second, now);
    }

    auto& bucket = it->second;
    if (bucket.tokens + kEpsilon >= 1.0) {
        bucket.tokens = std::max(0.0, bucket.tokens - 1.0);
        return true;
    }
    return false;
}

std::size_t RateLimiter::TrackedKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

std::string CallerKey(const std::string& forwarded_for, const std::string& remote_addr) {
    const auto first = utils::Trim(forwarded_for.substr(0, forwarded_for.find(',')));
    if (!first.empty()) {
        return first;
    }
    return remote_addr;
}

}  // namespace gexec::admission

#pragma once

#include <atomic>
#include <cstdint>

namespace gexec::metrics {

struct MetricsSnapshot {
    std::uint64_t total_requests = 0;
    std::uint64_t total_errors = 0;
};

class Metrics {
public:
    void IncrementRequest() { total_requests_.fetch_add(1, std::memory_order_relaxed); }
    void IncrementError() { total_errors_.fetch_add(1, std::memory_order_relaxed); }

    MetricsSnapshot Snapshot() const {
        MetricsSnapshot snapshot{};
        snapshot.total_requests = total_requests_.load(std::memory_order_relaxed);
        snapshot.total_errors = total_errors_.load(std::memory_order_relaxed);
        return snapshot;
    }

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> total_errors_{0};
};

}  // namespace gexec::metrics

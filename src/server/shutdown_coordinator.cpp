#include "server/shutdown_coordinator.hpp"

#include <string>

#include "utils/logging.hpp"

namespace gexec::server {

const char* ToString(ServiceState state) {
    switch (state) {
        case ServiceState::kRunning: return "running";
        case ServiceState::kDraining: return "draining";
        case ServiceState::kStopped: return "stopped";
    }
    return "unknown";
}

ShutdownCoordinator::InflightGuard::~InflightGuard() {
    if (owner_) {
        owner_->Leave();
    }
}

ShutdownCoordinator::ShutdownCoordinator(sandbox::InstanceRegistry& registry)
    : registry_(registry) {}

std::optional<ShutdownCoordinator::InflightGuard> ShutdownCoordinator::TryEnter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != ServiceState::kRunning) {
        return std::nullopt;
    }
    ++inflight_;
    return std::optional<InflightGuard>(InflightGuard(*this));
}

void ShutdownCoordinator::Leave() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inflight_ > 0) {
            --inflight_;
        }
    }
    drained_cv_.notify_all();
}

void ShutdownCoordinator::BeginDrain() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto expected = ServiceState::kRunning;
    if (state_.compare_exchange_strong(expected, ServiceState::kDraining)) {
        utils::LogInfo("shutdown", "draining", {{"inflight", std::to_string(inflight_)}});
    }
}

bool ShutdownCoordinator::AwaitDrain(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, grace, [this] { return inflight_ == 0; });
}

std::size_t ShutdownCoordinator::Shutdown(std::chrono::milliseconds grace) {
    BeginDrain();
    const bool drained = AwaitDrain(grace);
    std::size_t reclaimed = 0;
    if (!drained) {
        utils::LogWarn("shutdown", "grace period elapsed, reclaiming registered instances",
                       {{"inflight", std::to_string(Inflight())},
                        {"registered", std::to_string(registry_.Size())}});
        reclaimed = registry_.CleanupAll();
    }
    state_.store(ServiceState::kStopped);
    utils::LogInfo("shutdown", "stopped",
                   {{"drained", drained ? "true" : "false"}, {"reclaimed", std::to_string(reclaimed)}});
    return reclaimed;
}

std::size_t ShutdownCoordinator::Inflight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_;
}

}  // namespace gexec::server

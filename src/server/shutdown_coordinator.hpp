#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

#include "sandbox/instance_registry.hpp"

namespace gexec::server {

enum class ServiceState {
    kRunning,
    kDraining,
    kStopped
};

const char* ToString(ServiceState state);

// Running -> Draining -> Stopped. Requests hold an InflightGuard while they
// run; shutdown waits for them up to a grace period and then sweeps the
// registry for anything still alive.
class ShutdownCoordinator {
public:
    class InflightGuard {
    public:
        InflightGuard(InflightGuard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        InflightGuard& operator=(InflightGuard&&) = delete;
        InflightGuard(const InflightGuard&) = delete;
        InflightGuard& operator=(const InflightGuard&) = delete;
        ~InflightGuard();

    private:
        friend class ShutdownCoordinator;
        explicit InflightGuard(ShutdownCoordinator& owner) : owner_(&owner) {}

        ShutdownCoordinator* owner_;
    };

    explicit ShutdownCoordinator(sandbox::InstanceRegistry& registry);

    // Empty once draining has begun.
    std::optional<InflightGuard> TryEnter();

    void BeginDrain();

    // True when every in-flight request finished within grace.
    bool AwaitDrain(std::chrono::milliseconds grace);

    // BeginDrain + AwaitDrain, then the registry sweep if the drain was not
    // confirmed. Returns the number of instances the sweep reclaimed.
    std::size_t Shutdown(std::chrono::milliseconds grace);

    ServiceState State() const { return state_.load(); }
    std::size_t Inflight() const;

private:
    void Leave();

    sandbox::InstanceRegistry& registry_;
    std::atomic<ServiceState> state_{ServiceState::kRunning};
    mutable std::mutex mutex_;
    std::condition_variable drained_cv_;
    std::size_t inflight_ = 0;
};

}  // namespace gexec::server

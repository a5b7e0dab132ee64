#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "runtime/runtime_client.hpp"

namespace gexec::sandbox {

// Bookkeeping of every live container so a shutdown sweep can reach
// instances it does not own. The lock is held only for map operations;
// runtime calls always happen outside it.
class InstanceRegistry {
public:
    InstanceRegistry() = default;
    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    void Register(const std::string& instance_id, std::shared_ptr<runtime::RuntimeClient> client);

    // Marks the instance as being torn down. Only the first caller wins, so
    // kill and remove are issued once per instance.
    bool Claim(const std::string& instance_id);

    void Unregister(const std::string& instance_id);

    // Blocks until instance_id is no longer registered. An owner that lost
    // Claim to a sweep waits here so its client outlives the sweep's kill
    // and remove.
    void AwaitRelease(const std::string& instance_id);

    // Kills, removes and disconnects every unclaimed instance; returns how
    // many were reclaimed. Safe to call repeatedly.
    std::size_t CleanupAll();

    bool Contains(const std::string& instance_id) const;
    std::size_t Size() const;

private:
    struct Entry {
        std::shared_ptr<runtime::RuntimeClient> client;
        bool claimed = false;
    };

    mutable std::mutex mutex_;
    std::condition_variable released_cv_;
    std::unordered_map<std::string, Entry> instances_;
};

}  // namespace gexec::sandbox

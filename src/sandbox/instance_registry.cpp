#include "sandbox/instance_registry.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "utils/logging.hpp"

namespace gexec::sandbox {

void InstanceRegistry::Register(const std::string& instance_id,
                                std::shared_ptr<runtime::RuntimeClient> client) {
    std::lock_guard<std::mutex> lock(mutex_);
    instances_[instance_id] = Entry{std::move(client), false};
}

bool InstanceRegistry::Claim(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance_id);
    if (it == instances_.end() || it->second.claimed) {
        return false;
    }
    it->second.claimed = true;
    return true;
}

void InstanceRegistry::Unregister(const std::string& instance_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.erase(instance_id);
    }
    released_cv_.notify_all();
}

void InstanceRegistry::AwaitRelease(const std::string& instance_id) {
    std::unique_lock<std::mutex> lock(mutex_);
    released_cv_.wait(lock, [this, &instance_id] {
        return instances_.find(instance_id) == instances_.end();
    });
}

std::size_t InstanceRegistry::CleanupAll() {
    std::vector<std::pair<std::string, std::shared_ptr<runtime::RuntimeClient>>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [instance_id, entry] : instances_) {
            if (entry.claimed) {
                continue;
            }
            entry.claimed = true;
            pending.emplace_back(instance_id, entry.client);
        }
    }

    for (const auto& [instance_id, client] : pending) {
        utils::LogInfo("registry", "reclaiming instance", {{"id", instance_id}});
        if (client) {
            try {
                client->Kill(instance_id);
                client->Remove(instance_id);
                client->Close();
            } catch (const std::exception& ex) {
                utils::LogWarn("registry", "reclaim error ignored", {{"id", instance_id}, {"error", ex.what()}});
            }
        }
        // Always released: an owner may be blocked in AwaitRelease.
        Unregister(instance_id);
    }
    return pending.size();
}

bool InstanceRegistry::Contains(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.find(instance_id) != instances_.end();
}

std::size_t InstanceRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

}  // namespace gexec::sandbox

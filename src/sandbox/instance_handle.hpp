#pragma once

#include <memory>
#include <string>

#include "runtime/runtime_client.hpp"
#include "sandbox/instance_registry.hpp"

namespace gexec::sandbox {

// Owns one created container. Construction registers it; Teardown (or the
// destructor) kills, removes and unregisters it exactly once.
class InstanceHandle {
public:
    InstanceHandle(std::string instance_id,
                   std::shared_ptr<runtime::RuntimeClient> client,
                   InstanceRegistry& registry);
    ~InstanceHandle();

    InstanceHandle(const InstanceHandle&) = delete;
    InstanceHandle& operator=(const InstanceHandle&) = delete;

    const std::string& Id() const { return instance_id_; }
    bool TornDown() const { return torn_down_; }

    void Teardown();

private:
    std::string instance_id_;
    std::shared_ptr<runtime::RuntimeClient> client_;
    InstanceRegistry& registry_;
    bool torn_down_ = false;
};

}  // namespace gexec::sandbox

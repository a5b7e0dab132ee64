#include "sandbox/instance_handle.hpp"

#include <exception>
#include <utility>

#include "utils/logging.hpp"

namespace gexec::sandbox {

InstanceHandle::InstanceHandle(std::string instance_id,
                               std::shared_ptr<runtime::RuntimeClient> client,
                               InstanceRegistry& registry)
    : instance_id_(std::move(instance_id))
    , client_(std::move(client))
    , registry_(registry) {
    registry_.Register(instance_id_, client_);
}

InstanceHandle::~InstanceHandle() {
    Teardown();
}

void InstanceHandle::Teardown() {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;
    if (registry_.Claim(instance_id_)) {
        try {
            client_->Kill(instance_id_);
            client_->Remove(instance_id_);
        } catch (const std::exception& ex) {
            utils::LogWarn("sandbox", "teardown error ignored", {{"id", instance_id_}, {"error", ex.what()}});
        }
        registry_.Unregister(instance_id_);
    } else {
        // A shutdown sweep claimed the instance and is killing it through our
        // client; the caller must not close that client before it is done.
        registry_.AwaitRelease(instance_id_);
    }
    utils::LogDebug("sandbox", "instance torn down", {{"id", instance_id_}});
}

}  // namespace gexec::sandbox

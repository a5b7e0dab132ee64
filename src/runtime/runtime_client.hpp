#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace gexec::runtime {

// Thrown by every fallible RuntimeClient operation. status is the HTTP
// status returned by the runtime, or 0 when the call never got a response.
class RuntimeError : public std::runtime_error {
public:
    explicit RuntimeError(const std::string& message, int status = 0)
        : std::runtime_error(message)
        , status_(status) {}

    int Status() const { return status_; }

private:
    int status_ = 0;
};

struct ResourceLimits {
    std::int64_t memory_bytes = 0;
    long cpu_quota = 0;
    long cpu_period = 0;
};

struct InstanceSpec {
    std::string image;
    std::vector<std::string> command;
    std::string working_dir;
    ResourceLimits limits;
    bool network_disabled = true;
};

struct CapturedOutput {
    std::string stdout_data;
    std::string stderr_data;
};

// Output of one attached instance. Collection starts at attach time so the
// instance never blocks on a full pipe; ReadAll waits for end of stream.
class OutputStream {
public:
    virtual ~OutputStream() = default;
    virtual CapturedOutput ReadAll(std::chrono::milliseconds timeout) = 0;
    virtual void Close() = 0;
};

// Lifecycle contract of the container runtime. Kill, Remove and Close are
// best effort: they never throw and treat "already gone" as success.
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    virtual bool ImageExists(const std::string& image) = 0;
    // Gives up with a RuntimeError after limit.
    virtual void PullImage(const std::string& image, std::chrono::milliseconds limit) = 0;
    virtual std::string CreateInstance(const InstanceSpec& spec) = 0;
    virtual void CopyFile(const std::string& instance_id,
                          const std::string& directory,
                          const std::string& file_name,
                          const std::string& contents) = 0;
    virtual std::unique_ptr<OutputStream> AttachOutput(const std::string& instance_id) = 0;
    virtual void Start(const std::string& instance_id) = 0;
    // Blocks until the instance stops; gives up with a RuntimeError after limit.
    virtual int WaitTerminal(const std::string& instance_id, std::chrono::milliseconds limit) = 0;
    virtual int Inspect(const std::string& instance_id) = 0;
    virtual void Kill(const std::string& instance_id) = 0;
    virtual void Remove(const std::string& instance_id) = 0;
    virtual void Close() = 0;
};

using RuntimeClientFactory = std::function<std::shared_ptr<RuntimeClient>()>;

RuntimeClientFactory MakeDockerClientFactory(const gexec::config::Config& config);

}  // namespace gexec::runtime

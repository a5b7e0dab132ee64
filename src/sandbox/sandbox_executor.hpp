#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "runtime/runtime_client.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/instance_registry.hpp"

namespace gexec::sandbox {

struct ExecutorOptions {
    std::chrono::milliseconds default_timeout{60000};
    std::chrono::milliseconds max_timeout{300000};
    // Bound on every teardown call and on draining output once the program stopped.
    std::chrono::milliseconds teardown_timeout{10000};
    std::int64_t memory_bytes = 256ll * 1024 * 1024;
    long cpu_quota = 50000;
    long cpu_period = 100000;
    std::string work_dir = "/tmp";
    std::map<std::string, gexec::config::LanguageConfig> languages;

    static ExecutorOptions FromConfig(const gexec::config::Config& config);
};

// Runs one request in a fresh container: resolve image, pull on miss,
// create, copy the source in, attach, start, wait against the deadline,
// drain output, inspect. The container is torn down on every path.
class SandboxExecutor {
public:
    SandboxExecutor(ExecutorOptions options,
                    runtime::RuntimeClientFactory client_factory,
                    InstanceRegistry& registry);

    ExecutionResult Run(const ExecutionRequest& request);

    // Checks that need no runtime call: non-empty source, known language,
    // timeout within bounds.
    std::optional<ExecutionFailure> Validate(const ExecutionRequest& request) const;

    std::chrono::milliseconds EffectiveTimeout(const ExecutionRequest& request) const;

    const ExecutorOptions& Options() const { return options_; }

private:
    ExecutionResult Execute(const ExecutionRequest& request,
                            const gexec::config::LanguageConfig& language,
                            std::chrono::milliseconds timeout,
                            const std::shared_ptr<runtime::RuntimeClient>& client);

    ExecutorOptions options_;
    runtime::RuntimeClientFactory client_factory_;
    InstanceRegistry& registry_;
};

}  // namespace gexec::sandbox

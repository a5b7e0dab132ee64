#include "runtime/runtime_client.hpp"

#include "runtime/docker_client.hpp"

namespace gexec::runtime {

RuntimeClientFactory MakeDockerClientFactory(const gexec::config::Config& config) {
    DockerClientOptions options{};
    options.socket_path = config.runtime.docker_socket;
    options.api_version = config.runtime.api_version;
    options.call_timeout = std::chrono::milliseconds(config.sandbox.teardown_timeout_ms);
    options.pull_timeout = std::chrono::milliseconds(config.sandbox.pull_timeout_ms);
    return [options]() -> std::shared_ptr<RuntimeClient> {
        return std::make_shared<DockerClient>(options);
    };
}

}  // namespace gexec::runtime

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/http/verb.hpp>

#include "runtime/runtime_client.hpp"

namespace gexec::runtime {

struct DockerClientOptions {
    std::string socket_path = "/var/run/docker.sock";
    // e.g. "v1.43"; empty uses the daemon's default API version.
    std::string api_version;
    std::chrono::milliseconds call_timeout{10000};
    // Upper bound on a pull even when the caller allows longer.
    std::chrono::milliseconds pull_timeout{300000};
};

// Docker Engine API over the daemon's unix socket. Every call opens its own
// connection, so one client may be used from several threads.
class DockerClient : public RuntimeClient {
public:
    // Pings the daemon; throws RuntimeError when it is unreachable.
    explicit DockerClient(DockerClientOptions options);
    ~DockerClient() override;

    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image, std::chrono::milliseconds limit) override;
    std::string CreateInstance(const InstanceSpec& spec) override;
    void CopyFile(const std::string& instance_id,
                  const std::string& directory,
                  const std::string& file_name,
                  const std::string& contents) override;
    std::unique_ptr<OutputStream> AttachOutput(const std::string& instance_id) override;
    void Start(const std::string& instance_id) override;
    int WaitTerminal(const std::string& instance_id, std::chrono::milliseconds limit) override;
    int Inspect(const std::string& instance_id) override;
    void Kill(const std::string& instance_id) override;
    void Remove(const std::string& instance_id) override;
    void Close() override;

    static std::string BuildCreateBody(const InstanceSpec& spec);

private:
    struct HttpResult {
        int status = 0;
        std::string body;
    };

    HttpResult Request(boost::beast::http::verb verb,
                       const std::string& target,
                       std::string body,
                       const std::string& content_type,
                       std::chrono::milliseconds timeout);
    std::string Target(const std::string& path) const;
    void EnsureOpen() const;

    DockerClientOptions options_;
    std::atomic<bool> closed_{false};
};

std::string UrlEncode(const std::string& value);

// Extracts "message" from a Docker error body, falling back to the raw body.
std::string DockerErrorMessage(const std::string& body);

}  // namespace gexec::runtime

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "admission/rate_limiter.hpp"
#include "httplib.h"
#include "metrics/metrics.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/shutdown_coordinator.hpp"

namespace gexec::server {

struct ParsedRequest {
    std::optional<sandbox::ExecutionRequest> request;
    std::string error;
};

// Decodes an /execute body; error is set when the body is not usable.
ParsedRequest ParseExecuteBody(const std::string& body);

nlohmann::json ResultToJson(const sandbox::ExecutionResult& result);

class HttpServer {
public:
    HttpServer(sandbox::SandboxExecutor& executor,
               admission::RateLimiter& limiter,
               metrics::Metrics& metrics,
               ShutdownCoordinator& coordinator,
               std::size_t worker_threads);

    void HandlePing(const httplib::Request& req, httplib::Response& res);
    void HandleMetrics(const httplib::Request& req, httplib::Response& res);
    void HandleExecute(const httplib::Request& req, httplib::Response& res);

    bool Bind(const std::string& host, int port);
    // Binds an ephemeral port and returns it, or -1.
    int BindToAnyPort(const std::string& host);
    // Serves until Stop; Bind must have succeeded.
    bool Serve();
    void Stop();

private:
    using Handler = void (HttpServer::*)(const httplib::Request&, httplib::Response&);

    void Route(const std::string& path, Handler handler);

    sandbox::SandboxExecutor& executor_;
    admission::RateLimiter& limiter_;
    metrics::Metrics& metrics_;
    ShutdownCoordinator& coordinator_;
    httplib::Server server_;
};

}  // namespace gexec::server

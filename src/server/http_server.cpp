#include "server/http_server.hpp"

#include <algorithm>
#include <chrono>

#include "utils/logging.hpp"

namespace gexec::server {
namespace {

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    // Program output is arbitrary bytes; invalid UTF-8 is replaced, not rejected.
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

void WriteError(httplib::Response& res, int status, const std::string& message) {
    WriteJson(res, status, nlohmann::json{{"error", message}});
}

}  // namespace

ParsedRequest ParseExecuteBody(const std::string& body) {
    ParsedRequest parsed{};
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        parsed.error = "invalid JSON";
        return parsed;
    }

    sandbox::ExecutionRequest request{};
    if (json.contains("language")) {
        if (!json["language"].is_string()) {
            parsed.error = "language must be a string";
            return parsed;
        }
        request.language = json["language"].get<std::string>();
    }
    if (json.contains("source_code")) {
        if (!json["source_code"].is_string()) {
            parsed.error = "source_code must be a string";
            return parsed;
        }
        request.source_code = json["source_code"].get<std::string>();
    }
    if (json.contains("timeout_ms") && !json["timeout_ms"].is_null()) {
        if (!json["timeout_ms"].is_number_integer()) {
            parsed.error = "timeout_ms must be an integer";
            return parsed;
        }
        request.timeout = std::chrono::milliseconds(json["timeout_ms"].get<long long>());
    }
    parsed.request = std::move(request);
    return parsed;
}

nlohmann::json ResultToJson(const sandbox::ExecutionResult& result) {
    if (!result.Ok()) {
        return nlohmann::json{{"error", result.failure->message}};
    }
    return nlohmann::json{
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"exit_code", result.exit_code},
        {"error", ""}};
}

HttpServer::HttpServer(sandbox::SandboxExecutor& executor,
                       admission::RateLimiter& limiter,
                       metrics::Metrics& metrics,
                       ShutdownCoordinator& coordinator,
                       std::size_t worker_threads)
    : executor_(executor)
    , limiter_(limiter)
    , metrics_(metrics)
    , coordinator_(coordinator) {
    const auto threads = std::max<std::size_t>(worker_threads, 1);
    server_.new_task_queue = [threads]() { return new httplib::ThreadPool(threads); };
    Route("/ping", &HttpServer::HandlePing);
    Route("/metrics", &HttpServer::HandleMetrics);
    Route("/execute", &HttpServer::HandleExecute);
}

// Every method is routed so a wrong one gets 405 instead of 404.
void HttpServer::Route(const std::string& path, Handler handler) {
    auto bound = [this, handler](const httplib::Request& req, httplib::Response& res) {
        (this->*handler)(req, res);
    };
    server_.Get(path, bound);
    server_.Post(path, bound);
    server_.Put(path, bound);
    server_.Patch(path, bound);
    server_.Delete(path, bound);
    server_.Options(path, bound);
}

void HttpServer::HandlePing(const httplib::Request& req, httplib::Response& res) {
    if (req.method != "GET") {
        WriteError(res, 405, "method not allowed");
        return;
    }
    WriteJson(res, 200, nlohmann::json{{"status", "ok"}});
}

void HttpServer::HandleMetrics(const httplib::Request& req, httplib::Response& res) {
    if (req.method != "GET") {
        WriteError(res, 405, "method not allowed");
        return;
    }
    const auto snapshot = metrics_.Snapshot();
    WriteJson(res, 200, nlohmann::json{
        {"total_requests", snapshot.total_requests},
        {"total_errors", snapshot.total_errors}});
}

void HttpServer::HandleExecute(const httplib::Request& req, httplib::Response& res) {
    metrics_.IncrementRequest();

    if (req.method != "POST") {
        metrics_.IncrementError();
        WriteError(res, 405, "method not allowed");
        return;
    }

    auto guard = coordinator_.TryEnter();
    if (!guard) {
        metrics_.IncrementError();
        WriteError(res, 503, "server is shutting down");
        return;
    }

    const auto caller = admission::CallerKey(req.get_header_value("X-Forwarded-For"), req.remote_addr);
    if (!limiter_.Allow(caller)) {
        metrics_.IncrementError();
        utils::LogInfo("http", "request denied by rate limit", {{"caller", caller}});
        WriteError(res, 429, "too many requests");
        return;
    }

    const auto parsed = ParseExecuteBody(req.body);
    if (!parsed.request) {
        metrics_.IncrementError();
        WriteError(res, 400, parsed.error);
        return;
    }

    const auto result = executor_.Run(*parsed.request);
    if (!result.Ok()) {
        metrics_.IncrementError();
        WriteJson(res, 400, ResultToJson(result));
        return;
    }
    WriteJson(res, 200, ResultToJson(result));
}

bool HttpServer::Bind(const std::string& host, int port) {
    if (!server_.bind_to_port(host, port)) {
        utils::LogError("http", "failed to bind", {{"host", host}, {"port", std::to_string(port)}});
        return false;
    }
    utils::LogInfo("http", "listening", {{"host", host}, {"port", std::to_string(port)}});
    return true;
}

int HttpServer::BindToAnyPort(const std::string& host) {
    const int port = server_.bind_to_any_port(host);
    if (port < 0) {
        utils::LogError("http", "failed to bind", {{"host", host}});
        return -1;
    }
    utils::LogInfo("http", "listening", {{"host", host}, {"port", std::to_string(port)}});
    return port;
}

bool HttpServer::Serve() {
    return server_.listen_after_bind();
}

void HttpServer::Stop() {
    server_.stop();
}

}  // namespace gexec::server

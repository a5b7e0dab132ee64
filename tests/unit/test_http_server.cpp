#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "admission/rate_limiter.hpp"
#include "config/config_schema.hpp"
#include "fake_runtime_client.hpp"
#include "httplib.h"
#include "metrics/metrics.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/instance_registry.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

namespace {

using gexec::server::HttpServer;
using gexec::server::ParseExecuteBody;
using gexec::test_support::FakeBehavior;
using gexec::test_support::FakeRuntimeClient;

gexec::sandbox::ExecutorOptions MakeExecutorOptions() {
    gexec::sandbox::ExecutorOptions options{};
    options.default_timeout = std::chrono::milliseconds(2000);
    options.max_timeout = std::chrono::milliseconds(5000);
    options.teardown_timeout = std::chrono::milliseconds(500);
    options.languages = gexec::config::DefaultLanguages();
    return options;
}

gexec::admission::RateLimiterOptions MakeLimiterOptions(int burst) {
    gexec::admission::RateLimiterOptions options{};
    options.rate_per_second = 0.001;
    options.burst = burst;
    return options;
}

class HttpServerTest : public ::testing::Test {
protected:
    explicit HttpServerTest(int burst = 100)
        : client_(std::make_shared<FakeRuntimeClient>(Behavior()))
        , executor_(MakeExecutorOptions(), [this]() { return client_; }, registry_)
        , limiter_(MakeLimiterOptions(burst))
        , coordinator_(registry_)
        , server_(executor_, limiter_, metrics_, coordinator_, 4) {}

    static FakeBehavior Behavior() {
        FakeBehavior behavior{};
        behavior.stdout_data = "4\n";
        return behavior;
    }

    static httplib::Request MakeRequest(const std::string& method, const std::string& body = "") {
        httplib::Request req;
        req.method = method;
        req.body = body;
        req.remote_addr = "10.0.0.1";
        return req;
    }

    httplib::Response Execute(const httplib::Request& req) {
        httplib::Response res;
        server_.HandleExecute(req, res);
        return res;
    }

    std::shared_ptr<FakeRuntimeClient> client_;
    gexec::sandbox::InstanceRegistry registry_;
    gexec::sandbox::SandboxExecutor executor_;
    gexec::admission::RateLimiter limiter_;
    gexec::metrics::Metrics metrics_;
    gexec::server::ShutdownCoordinator coordinator_;
    HttpServer server_;
};

class TightLimitHttpServerTest : public HttpServerTest {
protected:
    TightLimitHttpServerTest()
        : HttpServerTest(2) {}
};

TEST_F(HttpServerTest, PingReportsOk) {
    httplib::Response res;
    server_.HandlePing(MakeRequest("GET"), res);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(nlohmann::json::parse(res.body), (nlohmann::json{{"status", "ok"}}));
    EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
}

TEST_F(HttpServerTest, WrongMethodIsRejected) {
    httplib::Response ping;
    server_.HandlePing(MakeRequest("POST"), ping);
    EXPECT_EQ(ping.status, 405);

    const auto execute = Execute(MakeRequest("GET"));
    EXPECT_EQ(execute.status, 405);
    EXPECT_EQ(client_->TotalCalls(), 0);
}

TEST_F(HttpServerTest, ExecuteReturnsProgramOutput) {
    const auto res = Execute(MakeRequest("POST", R"({"language":"python","source_code":"print(2+2)"})"));

    ASSERT_EQ(res.status, 200);
    const auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["stdout"], "4\n");
    EXPECT_EQ(body["stderr"], "");
    EXPECT_EQ(body["exit_code"], 0);
    EXPECT_EQ(body["error"], "");
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(HttpServerTest, InvalidJsonIsBadRequest) {
    const auto res = Execute(MakeRequest("POST", "{not json"));
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(nlohmann::json::parse(res.body)["error"], "invalid JSON");
    EXPECT_EQ(client_->TotalCalls(), 0);
}

TEST_F(HttpServerTest, UnsupportedLanguageIsBadRequest) {
    const auto res = Execute(MakeRequest("POST", R"({"language":"ruby","source_code":"puts 1"})"));
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(nlohmann::json::parse(res.body)["error"], "unsupported language: ruby");
    EXPECT_EQ(client_->TotalCalls(), 0);
}

TEST_F(HttpServerTest, MetricsCountRequestsAndErrors) {
    Execute(MakeRequest("POST", R"({"language":"python","source_code":"print(2+2)"})"));
    Execute(MakeRequest("POST", R"({"language":"python","source_code":""})"));
    Execute(MakeRequest("POST", "[]"));

    httplib::Response res;
    server_.HandleMetrics(MakeRequest("GET"), res);
    ASSERT_EQ(res.status, 200);
    const auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["total_requests"], 3);
    EXPECT_EQ(body["total_errors"], 2);
}

TEST_F(HttpServerTest, PingAndMetricsAreNotCounted) {
    httplib::Response ping;
    server_.HandlePing(MakeRequest("GET"), ping);
    httplib::Response metrics;
    server_.HandleMetrics(MakeRequest("GET"), metrics);
    EXPECT_EQ(metrics_.Snapshot().total_requests, 0u);
}

TEST_F(HttpServerTest, DrainingServerRefusesWork) {
    coordinator_.BeginDrain();
    const auto res = Execute(MakeRequest("POST", R"({"language":"python","source_code":"print(2+2)"})"));
    EXPECT_EQ(res.status, 503);
    EXPECT_EQ(client_->TotalCalls(), 0);
    EXPECT_EQ(metrics_.Snapshot().total_errors, 1u);
}

TEST_F(TightLimitHttpServerTest, BurstExhaustionIsTooManyRequests) {
    const std::string body = R"({"language":"python","source_code":"print(2+2)"})";
    EXPECT_EQ(Execute(MakeRequest("POST", body)).status, 200);
    EXPECT_EQ(Execute(MakeRequest("POST", body)).status, 200);

    const auto denied = Execute(MakeRequest("POST", body));
    EXPECT_EQ(denied.status, 429);
    EXPECT_EQ(nlohmann::json::parse(denied.body)["error"], "too many requests");
    EXPECT_EQ(client_->creates.load(), 2);

    auto other = MakeRequest("POST", body);
    other.remote_addr = "10.0.0.2";
    EXPECT_EQ(Execute(other).status, 200);
}

TEST_F(TightLimitHttpServerTest, ForwardedForIdentifiesCaller) {
    const std::string body = R"({"language":"python","source_code":"print(2+2)"})";
    auto req = MakeRequest("POST", body);
    req.set_header("X-Forwarded-For", "203.0.113.9, 10.0.0.1");
    EXPECT_EQ(Execute(req).status, 200);
    EXPECT_EQ(Execute(req).status, 200);
    EXPECT_EQ(Execute(req).status, 429);
    EXPECT_EQ(Execute(MakeRequest("POST", body)).status, 200);
}

TEST(HttpServerPoolTest, PingAnswersWhileExecuteCallsAreRunning) {
    // More slow calls than httplib's default pool would hold.
    constexpr int kSlowCalls = 12;
    FakeBehavior behavior{};
    behavior.run_duration = std::chrono::milliseconds(1500);
    auto client = std::make_shared<FakeRuntimeClient>(behavior);
    gexec::sandbox::InstanceRegistry registry;
    gexec::sandbox::SandboxExecutor executor(MakeExecutorOptions(), [client]() { return client; }, registry);
    gexec::admission::RateLimiter limiter(MakeLimiterOptions(100));
    gexec::metrics::Metrics metrics;
    gexec::server::ShutdownCoordinator coordinator(registry);
    HttpServer server(executor, limiter, metrics, coordinator, kSlowCalls + 4);

    const int port = server.BindToAnyPort("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread serving([&server]() { server.Serve(); });

    std::vector<int> statuses(kSlowCalls, 0);
    std::vector<std::thread> callers;
    for (int i = 0; i < kSlowCalls; ++i) {
        callers.emplace_back([&statuses, i, port]() {
            httplib::Client caller("127.0.0.1", port);
            caller.set_read_timeout(10, 0);
            const auto res = caller.Post(
                "/execute", R"({"language":"python","source_code":"pass","timeout_ms":3000})", "application/json");
            if (res) {
                statuses[i] = res->status;
            }
        });
    }

    const auto wait_until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (client->starts.load() < kSlowCalls && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(client->starts.load(), kSlowCalls);

    httplib::Client ping("127.0.0.1", port);
    ping.set_connection_timeout(1, 0);
    ping.set_read_timeout(1, 0);
    const auto started = std::chrono::steady_clock::now();
    const auto pong = ping.Get("/ping");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(pong);
    EXPECT_EQ(pong->status, 200);
    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_EQ(client->Killed().size(), 0u);

    for (auto& caller : callers) {
        caller.join();
    }
    server.Stop();
    serving.join();

    for (const int status : statuses) {
        EXPECT_EQ(status, 200);
    }
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ParseExecuteBodyTest, ReadsAllFields) {
    const auto parsed = ParseExecuteBody(R"({"language":"go","source_code":"package main","timeout_ms":1500})");
    ASSERT_TRUE(parsed.request.has_value());
    EXPECT_EQ(parsed.request->language, "go");
    EXPECT_EQ(parsed.request->source_code, "package main");
    EXPECT_EQ(parsed.request->timeout, std::chrono::milliseconds(1500));
}

TEST(ParseExecuteBodyTest, MissingTimeoutMeansDefault) {
    const auto parsed = ParseExecuteBody(R"({"language":"go","source_code":"x","timeout_ms":null})");
    ASSERT_TRUE(parsed.request.has_value());
    EXPECT_EQ(parsed.request->timeout.count(), 0);
}

TEST(ParseExecuteBodyTest, RejectsWrongTypes) {
    EXPECT_EQ(ParseExecuteBody("").error, "invalid JSON");
    EXPECT_EQ(ParseExecuteBody("\"text\"").error, "invalid JSON");
    EXPECT_EQ(ParseExecuteBody(R"({"language":1})").error, "language must be a string");
    EXPECT_EQ(ParseExecuteBody(R"({"source_code":[]})").error, "source_code must be a string");
    EXPECT_EQ(ParseExecuteBody(R"({"timeout_ms":"10"})").error, "timeout_ms must be an integer");
    EXPECT_EQ(ParseExecuteBody(R"({"timeout_ms":1.5})").error, "timeout_ms must be an integer");
}

TEST(ResultToJsonTest, FailureCarriesOnlyError) {
    const auto failed = gexec::sandbox::ExecutionResult::Failed(
        gexec::sandbox::ErrorKind::kExecutionTimeout, "execution timed out");
    EXPECT_EQ(gexec::server::ResultToJson(failed), (nlohmann::json{{"error", "execution timed out"}}));
}

}  // namespace

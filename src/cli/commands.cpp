#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "admission/rate_limiter.hpp"
#include "config/config_loader.hpp"
#include "metrics/metrics.hpp"
#include "runtime/runtime_client.hpp"
#include "sandbox/instance_registry.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void ApplyLogging(const gexec::config::Config& config) {
    gexec::utils::LogConfig log_config{};
    log_config.min_level = gexec::utils::ParseLogLevel(config.log.level, gexec::utils::LogLevel::kInfo);
    gexec::utils::SetLogConfig(log_config);
}

int RunServer() {
    const auto config = gexec::config::LoadConfig();
    ApplyLogging(config);

    gexec::sandbox::InstanceRegistry registry;
    gexec::metrics::Metrics metrics;
    gexec::admission::RateLimiter limiter(gexec::admission::RateLimiterOptions::FromConfig(config.rate_limit));
    gexec::sandbox::SandboxExecutor executor(
        gexec::sandbox::ExecutorOptions::FromConfig(config),
        gexec::runtime::MakeDockerClientFactory(config),
        registry);
    gexec::server::ShutdownCoordinator coordinator(registry);
    gexec::server::HttpServer http(
        executor, limiter, metrics, coordinator, static_cast<std::size_t>(std::max(config.server.threads, 1)));

    if (!http.Bind(config.server.host, config.server.port)) {
        return 1;
    }

    InstallSignalHandlers();
    std::thread http_thread([&http]() {
        if (!http.Serve()) {
            gexec::utils::LogError("http", "server loop exited with an error");
        }
    });
    gexec::utils::LogInfo("gexec", "server started, press Ctrl+C to stop");

    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    gexec::utils::LogInfo("gexec", "shutting down", {{"signal", std::to_string(g_signal)}});

    const auto grace = std::chrono::seconds(config.shutdown.grace_period_s);
    const auto hard_deadline = grace + 2 * std::chrono::milliseconds(config.sandbox.teardown_timeout_ms)
        + std::chrono::seconds(5);
    std::thread([hard_deadline] {
        std::this_thread::sleep_for(hard_deadline);
        std::_Exit(130);
    }).detach();

    coordinator.Shutdown(grace);
    http.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    // A create that completed after the sweep is still registered here.
    registry.CleanupAll();
    gexec::utils::LogInfo("gexec", "server exited");
    return 0;
}

int RunOnce(const std::string& language, const std::string& path, const std::string& timeout_ms) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        std::cerr << "Failed to open " << path << std::endl;
        return 1;
    }
    std::ostringstream source;
    source << input.rdbuf();

    const auto config = gexec::config::LoadConfig();
    ApplyLogging(config);

    gexec::sandbox::ExecutionRequest request{};
    request.language = language;
    request.source_code = source.str();
    if (!timeout_ms.empty()) {
        try {
            request.timeout = std::chrono::milliseconds(std::stoll(timeout_ms));
        } catch (const std::exception&) {
            std::cerr << "Invalid timeout: " << timeout_ms << std::endl;
            return 1;
        }
    }

    gexec::sandbox::InstanceRegistry registry;
    gexec::sandbox::SandboxExecutor executor(
        gexec::sandbox::ExecutorOptions::FromConfig(config),
        gexec::runtime::MakeDockerClientFactory(config),
        registry);
    const auto result = executor.Run(request);
    if (!result.Ok()) {
        std::cerr << "Error: " << result.failure->message << std::endl;
        return 1;
    }
    std::cout << result.stdout_data << std::flush;
    std::cerr << result.stderr_data << std::flush;
    return result.exit_code;
}

void PrintUsage() {
    std::cout << "Usage: gexec serve | gexec exec <language> <file> [timeout_ms]" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "serve") {
        return RunServer();
    }

    const std::string command = argv[1];
    if (command == "exec" && (argc == 4 || argc == 5)) {
        return RunOnce(argv[2], argv[3], argc == 5 ? argv[4] : "");
    }

    PrintUsage();
    return 1;
}

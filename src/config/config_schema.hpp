#pragma once

#include <map>
#include <string>
#include <vector>

namespace gexec::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    // Request worker threads; slow /execute calls hold one each.
    int threads = 64;
};

// How one language is run: the image, the file the source is written to
// inside the container, and the argv that runs it (file path appended).
struct LanguageConfig {
    std::string image;
    std::string source_file;
    std::vector<std::string> command;
};

struct SandboxConfig {
    int default_timeout_ms = 60000;
    int max_timeout_ms = 300000;
    int max_memory_mb = 256;
    long cpu_quota = 50000;
    long cpu_period = 100000;
    int teardown_timeout_ms = 10000;
    int pull_timeout_ms = 300000;
    std::string work_dir = "/tmp";
    std::map<std::string, LanguageConfig> languages;
};

struct RuntimeConfig {
    std::string docker_socket = "/var/run/docker.sock";
    std::string api_version;
};

struct RateLimitConfig {
    double rate_per_second = 5.0;
    int burst = 10;
    int idle_evict_s = 600;
    int max_keys = 10000;
};

struct ShutdownConfig {
    int grace_period_s = 30;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    RuntimeConfig runtime;
    RateLimitConfig rate_limit;
    ShutdownConfig shutdown;
    LogSettings log;
};

std::map<std::string, LanguageConfig> DefaultLanguages();

}  // namespace gexec::config

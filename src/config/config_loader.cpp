#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gexec::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("GEXEC_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".gexec" / "config.json";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value", {{"value", value}});
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-numeric value", {{"value", value}});
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Languages given only as an image name get a command guessed from the
// language name.
LanguageConfig InferLanguage(const std::string& language, const std::string& image) {
    const auto lowered = utils::ToLower(language);
    LanguageConfig config{};
    config.image = image;
    if (lowered.rfind("py", 0) == 0) {
        config.source_file = "main.py";
        config.command = {"python"};
    } else if (lowered.rfind("go", 0) == 0) {
        config.source_file = "main.go";
        config.command = {"go", "run"};
    } else {
        config.source_file = "main.txt";
        config.command = {language};
    }
    return config;
}

void ApplyLanguageFromJson(Config& config, const std::string& name, const nlohmann::json& source) {
    if (source.is_string()) {
        config.sandbox.languages[name] = InferLanguage(name, source.get<std::string>());
        return;
    }
    if (!source.is_object() || !source.contains("image") || !source["image"].is_string()) {
        utils::LogWarn("config", "skipping language without image", {{"language", name}});
        return;
    }
    auto language = InferLanguage(name, source["image"].get<std::string>());
    if (source.contains("sourceFile") && source["sourceFile"].is_string()) {
        language.source_file = source["sourceFile"].get<std::string>();
    }
    if (source.contains("command") && source["command"].is_array()) {
        language.command.clear();
        for (const auto& arg : source["command"]) {
            if (arg.is_string()) {
                language.command.push_back(arg.get<std::string>());
            }
        }
    }
    config.sandbox.languages[name] = std::move(language);
}

template <typename T>
void ReadNumber(const nlohmann::json& object, const char* key, T& target) {
    if (object.contains(key) && object[key].is_number()) {
        target = object[key].get<T>();
    }
}

}  // namespace

std::map<std::string, LanguageConfig> DefaultLanguages() {
    std::map<std::string, LanguageConfig> languages;
    languages["python"] = InferLanguage("python", "python:3.9-slim");
    languages["py"] = InferLanguage("py", "python:3.9-slim");
    languages["golang"] = InferLanguage("golang", "golang:1.24-alpine");
    languages["go"] = InferLanguage("go", "golang:1.24-alpine");
    return languages;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        ReadNumber(server, "port", config.server.port);
        ReadNumber(server, "threads", config.server.threads);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadNumber(sandbox, "defaultTimeoutMs", config.sandbox.default_timeout_ms);
        ReadNumber(sandbox, "maxTimeoutMs", config.sandbox.max_timeout_ms);
        ReadNumber(sandbox, "maxMemoryMb", config.sandbox.max_memory_mb);
        ReadNumber(sandbox, "cpuQuota", config.sandbox.cpu_quota);
        ReadNumber(sandbox, "cpuPeriod", config.sandbox.cpu_period);
        ReadNumber(sandbox, "teardownTimeoutMs", config.sandbox.teardown_timeout_ms);
        ReadNumber(sandbox, "pullTimeoutMs", config.sandbox.pull_timeout_ms);
        if (sandbox.contains("workDir") && sandbox["workDir"].is_string()) {
            config.sandbox.work_dir = sandbox["workDir"].get<std::string>();
        }
        if (sandbox.contains("languages") && sandbox["languages"].is_object()) {
            config.sandbox.languages.clear();
            for (const auto& item : sandbox["languages"].items()) {
                ApplyLanguageFromJson(config, item.key(), item.value());
            }
        }
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        if (runtime.contains("dockerSocket") && runtime["dockerSocket"].is_string()) {
            config.runtime.docker_socket = runtime["dockerSocket"].get<std::string>();
        }
        if (runtime.contains("apiVersion") && runtime["apiVersion"].is_string()) {
            config.runtime.api_version = runtime["apiVersion"].get<std::string>();
        }
    }

    if (data.contains("rateLimit") && data["rateLimit"].is_object()) {
        const auto& rate_limit = data["rateLimit"];
        ReadNumber(rate_limit, "ratePerSecond", config.rate_limit.rate_per_second);
        ReadNumber(rate_limit, "burst", config.rate_limit.burst);
        ReadNumber(rate_limit, "idleEvictS", config.rate_limit.idle_evict_s);
        ReadNumber(rate_limit, "maxKeys", config.rate_limit.max_keys);
    }

    if (data.contains("shutdown") && data["shutdown"].is_object()) {
        ReadNumber(data["shutdown"], "gracePeriodS", config.shutdown.grace_period_s);
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.level = log["level"].get<std::string>();
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto host = GetEnvFallback("GEXEC_SERVER__HOST", "GEXEC_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("GEXEC_SERVER__PORT", "GEXEC_SERVER_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto threads = GetEnvFallback("GEXEC_SERVER__THREADS", "GEXEC_SERVER_THREADS");
    if (!threads.empty()) {
        config.server.threads = ParseInt(threads, config.server.threads);
    }

    const auto default_timeout = GetEnvFallback(
        "GEXEC_SANDBOX__DEFAULT_TIMEOUT_MS",
        "GEXEC_SANDBOX_DEFAULT_TIMEOUT_MS");
    if (!default_timeout.empty()) {
        config.sandbox.default_timeout_ms = ParseInt(default_timeout, config.sandbox.default_timeout_ms);
    }

    const auto max_timeout = GetEnvFallback(
        "GEXEC_SANDBOX__MAX_TIMEOUT_MS",
        "GEXEC_SANDBOX_MAX_TIMEOUT_MS");
    if (!max_timeout.empty()) {
        config.sandbox.max_timeout_ms = ParseInt(max_timeout, config.sandbox.max_timeout_ms);
    }

    const auto max_memory = GetEnvFallback(
        "GEXEC_SANDBOX__MAX_MEMORY_MB",
        "GEXEC_SANDBOX_MAX_MEMORY_MB");
    if (!max_memory.empty()) {
        config.sandbox.max_memory_mb = ParseInt(max_memory, config.sandbox.max_memory_mb);
    }

    const auto cpu_quota = GetEnvFallback("GEXEC_SANDBOX__CPU_QUOTA", "GEXEC_SANDBOX_CPU_QUOTA");
    if (!cpu_quota.empty()) {
        config.sandbox.cpu_quota = ParseInt(cpu_quota, static_cast<int>(config.sandbox.cpu_quota));
    }

    const auto teardown_timeout = GetEnvFallback(
        "GEXEC_SANDBOX__TEARDOWN_TIMEOUT_MS",
        "GEXEC_SANDBOX_TEARDOWN_TIMEOUT_MS");
    if (!teardown_timeout.empty()) {
        config.sandbox.teardown_timeout_ms = ParseInt(teardown_timeout, config.sandbox.teardown_timeout_ms);
    }

    // GEXEC_LANGUAGES=python=python:3.11-slim,go=golang:1.24-alpine
    const auto languages = GetEnv("GEXEC_LANGUAGES");
    if (!languages.empty()) {
        config.sandbox.languages.clear();
        for (const auto& entry : SplitCsv(languages)) {
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
                utils::LogWarn("config", "ignoring malformed language entry", {{"entry", entry}});
                continue;
            }
            const auto name = entry.substr(0, eq);
            config.sandbox.languages[name] = InferLanguage(name, entry.substr(eq + 1));
        }
    }

    const auto docker_host = GetEnv("DOCKER_HOST");
    if (docker_host.rfind("unix://", 0) == 0) {
        config.runtime.docker_socket = docker_host.substr(7);
    }
    const auto docker_socket = GetEnvFallback(
        "GEXEC_RUNTIME__DOCKER_SOCKET",
        "GEXEC_RUNTIME_DOCKER_SOCKET");
    if (!docker_socket.empty()) {
        config.runtime.docker_socket = docker_socket;
    }

    const auto rate = GetEnvFallback(
        "GEXEC_RATE_LIMIT__RATE_PER_SECOND",
        "GEXEC_RATE_LIMIT_RATE_PER_SECOND");
    if (!rate.empty()) {
        config.rate_limit.rate_per_second = ParseDouble(rate, config.rate_limit.rate_per_second);
    }

    const auto burst = GetEnvFallback("GEXEC_RATE_LIMIT__BURST", "GEXEC_RATE_LIMIT_BURST");
    if (!burst.empty()) {
        config.rate_limit.burst = ParseInt(burst, config.rate_limit.burst);
    }

    const auto grace = GetEnvFallback(
        "GEXEC_SHUTDOWN__GRACE_PERIOD_S",
        "GEXEC_SHUTDOWN_GRACE_PERIOD_S");
    if (!grace.empty()) {
        config.shutdown.grace_period_s = ParseInt(grace, config.shutdown.grace_period_s);
    }

    const auto log_level = GetEnvFallback("GEXEC_LOG__LEVEL", "GEXEC_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

Config LoadConfigFrom(const std::filesystem::path& config_path) {
    Config config{};
    config.sandbox.languages = DefaultLanguages();

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "keeping defaults after parse error",
                           {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace gexec::config

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gexec::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Renders "LEVEL [tag] message key=value ...". Values containing spaces are quoted.
std::string FormatLogMessage(const LogMessage& message);

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const LogFields& fields = {});

inline void LogDebug(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kDebug, tag, message, fields);
}

inline void LogInfo(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kInfo, tag, message, fields);
}

inline void LogWarn(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kWarn, tag, message, fields);
}

inline void LogError(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kError, tag, message, fields);
}

}  // namespace gexec::utils

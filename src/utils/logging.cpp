#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gexec::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config{};

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"' || c == '=';
    });
}

std::string Quote(const std::string& value) {
    std::string quoted = "\"";
    for (const char c : value) {
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
            quoted.push_back(c);
        } else if (c == '\n') {
            quoted.append("\\n");
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_config;
}

std::string FormatLogMessage(const LogMessage& message) {
    std::ostringstream line;
    line << ToString(message.level) << " [" << message.tag << "] " << message.message;
    for (const auto& [key, value] : message.fields) {
        line << ' ' << key << '=' << (NeedsQuoting(value) ? Quote(value) : value);
    }
    return line.str();
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const LogFields& fields) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::cerr << FormatLogMessage(LogMessage{level, tag, message, fields}) << std::endl;
}

}  // namespace gexec::utils

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace gexec::sandbox {

enum class ErrorKind {
    kValidation,
    kAdmissionDenied,
    kRuntimeUnavailable,
    kImagePullFailed,
    kInstanceCreateFailed,
    kPayloadCopyFailed,
    kAttachFailed,
    kStartFailed,
    kWaitFailed,
    kExecutionTimeout,
    kOutputReadFailed,
    kInspectFailed
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kValidation: return "validation_error";
        case ErrorKind::kAdmissionDenied: return "admission_denied";
        case ErrorKind::kRuntimeUnavailable: return "runtime_unavailable";
        case ErrorKind::kImagePullFailed: return "image_pull_failed";
        case ErrorKind::kInstanceCreateFailed: return "instance_create_failed";
        case ErrorKind::kPayloadCopyFailed: return "payload_copy_failed";
        case ErrorKind::kAttachFailed: return "attach_failed";
        case ErrorKind::kStartFailed: return "start_failed";
        case ErrorKind::kWaitFailed: return "wait_failed";
        case ErrorKind::kExecutionTimeout: return "execution_timeout";
        case ErrorKind::kOutputReadFailed: return "output_read_failed";
        case ErrorKind::kInspectFailed: return "inspect_failed";
    }
    return "unknown";
}

struct ExecutionRequest {
    std::string language;
    std::string source_code;
    // Zero means the configured default.
    std::chrono::milliseconds timeout{0};
};

struct ExecutionFailure {
    ErrorKind kind = ErrorKind::kValidation;
    std::string message;
};

struct ExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    std::optional<ExecutionFailure> failure;

    bool Ok() const { return !failure.has_value(); }

    static ExecutionResult Failed(ErrorKind kind, std::string message) {
        ExecutionResult result{};
        result.failure = ExecutionFailure{kind, std::move(message)};
        return result;
    }
};

}  // namespace gexec::sandbox

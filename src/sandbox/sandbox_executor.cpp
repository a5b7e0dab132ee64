#include "sandbox/sandbox_executor.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <utility>
#include <vector>

#include "sandbox/instance_handle.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gexec::sandbox {
namespace {

std::string JoinPath(const std::string& directory, const std::string& file_name) {
    if (directory.empty()) {
        return file_name;
    }
    if (directory.back() == '/') {
        return directory + file_name;
    }
    return directory + "/" + file_name;
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    // Rounded up so that a step given the remainder ends at or past the deadline.
    const auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool Expired(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

ExecutionResult TimedOut() {
    return ExecutionResult::Failed(ErrorKind::kExecutionTimeout, "execution timed out");
}

}  // namespace

ExecutorOptions ExecutorOptions::FromConfig(const gexec::config::Config& config) {
    ExecutorOptions options{};
    options.default_timeout = std::chrono::milliseconds(config.sandbox.default_timeout_ms);
    options.max_timeout = std::chrono::milliseconds(config.sandbox.max_timeout_ms);
    options.teardown_timeout = std::chrono::milliseconds(config.sandbox.teardown_timeout_ms);
    options.memory_bytes = static_cast<std::int64_t>(config.sandbox.max_memory_mb) * 1024 * 1024;
    options.cpu_quota = config.sandbox.cpu_quota;
    options.cpu_period = config.sandbox.cpu_period;
    options.work_dir = config.sandbox.work_dir;
    options.languages = config.sandbox.languages;
    return options;
}

SandboxExecutor::SandboxExecutor(ExecutorOptions options,
                                 runtime::RuntimeClientFactory client_factory,
                                 InstanceRegistry& registry)
    : options_(std::move(options))
    , client_factory_(std::move(client_factory))
    , registry_(registry) {}

std::optional<ExecutionFailure> SandboxExecutor::Validate(const ExecutionRequest& request) const {
    if (request.source_code.empty()) {
        return ExecutionFailure{ErrorKind::kValidation, "source_code cannot be empty"};
    }
    if (options_.languages.find(request.language) == options_.languages.end()) {
        return ExecutionFailure{ErrorKind::kValidation, "unsupported language: " + request.language};
    }
    if (request.timeout.count() < 0) {
        return ExecutionFailure{ErrorKind::kValidation, "timeout_ms must not be negative"};
    }
    if (request.timeout > options_.max_timeout) {
        return ExecutionFailure{
            ErrorKind::kValidation,
            "timeout_ms exceeds maximum of " + std::to_string(options_.max_timeout.count())};
    }
    return std::nullopt;
}

std::chrono::milliseconds SandboxExecutor::EffectiveTimeout(const ExecutionRequest& request) const {
    return request.timeout.count() > 0 ? request.timeout : options_.default_timeout;
}

ExecutionResult SandboxExecutor::Run(const ExecutionRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    if (const auto failure = Validate(request)) {
        utils::LogInfo("sandbox", "request rejected",
                       {{"language", request.language}, {"error", failure->message}});
        return ExecutionResult::Failed(failure->kind, failure->message);
    }

    const auto& language = options_.languages.at(request.language);
    const auto timeout = EffectiveTimeout(request);

    std::shared_ptr<runtime::RuntimeClient> client;
    try {
        client = client_factory_();
    } catch (const std::exception& ex) {
        utils::LogError("sandbox", "runtime unavailable", {{"error", ex.what()}});
        return ExecutionResult::Failed(
            ErrorKind::kRuntimeUnavailable, std::string("failed to create docker client: ") + ex.what());
    }
    if (!client) {
        return ExecutionResult::Failed(ErrorKind::kRuntimeUnavailable, "failed to create docker client");
    }

    utils::LogInfo("sandbox", "execution started",
                   {{"language", request.language},
                    {"image", language.image},
                    {"timeout_ms", std::to_string(timeout.count())}});
    auto result = Execute(request, language, timeout, client);
    client->Close();

    utils::LogInfo("sandbox", "execution finished",
                   {{"language", request.language},
                    {"outcome", result.Ok() ? "ok" : ToString(result.failure->kind)},
                    {"exit_code", std::to_string(result.exit_code)},
                    {"stdout_bytes", std::to_string(result.stdout_data.size())},
                    {"stderr_bytes", std::to_string(result.stderr_data.size())},
                    {"elapsed_ms", std::to_string(utils::ElapsedMs(started))}});
    return result;
}

ExecutionResult SandboxExecutor::Execute(const ExecutionRequest& request,
                                         const gexec::config::LanguageConfig& language,
                                         std::chrono::milliseconds timeout,
                                         const std::shared_ptr<runtime::RuntimeClient>& client) {
    // One deadline covers the pull, the wait and the output drain.
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    try {
        if (!client->ImageExists(language.image)) {
            client->PullImage(language.image, Remaining(deadline));
        }
    } catch (const std::exception& ex) {
        if (Expired(deadline)) {
            utils::LogInfo("sandbox", "deadline reached while pulling image", {{"image", language.image}});
            return TimedOut();
        }
        return ExecutionResult::Failed(
            ErrorKind::kImagePullFailed, std::string("failed to pull image: ") + ex.what());
    }

    runtime::InstanceSpec spec{};
    spec.image = language.image;
    spec.command = language.command;
    spec.command.push_back(JoinPath(options_.work_dir, language.source_file));
    spec.working_dir = options_.work_dir;
    spec.limits.memory_bytes = options_.memory_bytes;
    spec.limits.cpu_quota = options_.cpu_quota;
    spec.limits.cpu_period = options_.cpu_period;
    spec.network_disabled = true;

    std::string instance_id;
    try {
        instance_id = client->CreateInstance(spec);
    } catch (const std::exception& ex) {
        return ExecutionResult::Failed(
            ErrorKind::kInstanceCreateFailed, std::string("failed to create container: ") + ex.what());
    }

    InstanceHandle handle(instance_id, client, registry_);
    utils::LogInfo("sandbox", "instance created",
                   {{"id", instance_id}, {"image", language.image}, {"command", utils::Join(spec.command, " ")}});

    try {
        client->CopyFile(instance_id, options_.work_dir, language.source_file, request.source_code);
    } catch (const std::exception& ex) {
        return ExecutionResult::Failed(
            ErrorKind::kPayloadCopyFailed, std::string("failed to copy source into container: ") + ex.what());
    }

    std::unique_ptr<runtime::OutputStream> output;
    try {
        output = client->AttachOutput(instance_id);
    } catch (const std::exception& ex) {
        return ExecutionResult::Failed(
            ErrorKind::kAttachFailed, std::string("failed to attach to container: ") + ex.what());
    }

    try {
        client->Start(instance_id);
    } catch (const std::exception& ex) {
        return ExecutionResult::Failed(
            ErrorKind::kStartFailed, std::string("failed to start container: ") + ex.what());
    }

    // The waiter gives up on its own after the teardown allowance, so it
    // cannot outlive a hung runtime by more than that.
    const auto wait_limit = Remaining(deadline) + options_.teardown_timeout;
    auto waiter = std::async(std::launch::async, [client, instance_id, wait_limit]() {
        return client->WaitTerminal(instance_id, wait_limit);
    });

    if (waiter.wait_until(deadline) != std::future_status::ready) {
        utils::LogInfo("sandbox", "deadline reached, killing instance",
                       {{"id", instance_id}, {"timeout_ms", std::to_string(timeout.count())}});
        // Killing the instance is what releases the waiter.
        handle.Teardown();
        output->Close();
        waiter.wait();
        return TimedOut();
    }

    try {
        waiter.get();
    } catch (const std::exception& ex) {
        return ExecutionResult::Failed(
            ErrorKind::kWaitFailed, std::string("error waiting for container: ") + ex.what());
    }

    runtime::CapturedOutput captured;
    try {
        captured = output->ReadAll(Remaining(deadline));
    } catch (const std::exception& ex) {
        if (Expired(deadline)) {
            utils::LogInfo("sandbox", "deadline reached while draining output", {{"id", instance_id}});
            return TimedOut();
        }
        return ExecutionResult::Failed(
            ErrorKind::kOutputReadFailed, std::string("failed to read container output: ") + ex.what());
    }

    ExecutionResult result{};
    try {
        result.exit_code = client->Inspect(instance_id);
    } catch (const std::exception& ex) {
        return ExecutionResult::Failed(
            ErrorKind::kInspectFailed, std::string("failed to inspect container: ") + ex.what());
    }
    result.stdout_data = std::move(captured.stdout_data);
    result.stderr_data = std::move(captured.stderr_data);
    return result;
}

}  // namespace gexec::sandbox

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "runtime/runtime_client.hpp"

namespace gexec::test_support {

enum class FailAt {
    kNone,
    kImageCheck,
    kPull,
    kCreate,
    kCopy,
    kAttach,
    kStart,
    kWait,
    kReadOutput,
    kInspect
};

struct FakeBehavior {
    bool image_present = true;
    FailAt fail_at = FailAt::kNone;
    // How long the "program" runs before exiting on its own.
    std::chrono::milliseconds run_duration{0};
    // Time a pull or an output drain takes; either gives up at its limit.
    std::chrono::milliseconds pull_duration{0};
    std::chrono::milliseconds drain_duration{0};
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
};

class FakeOutputStream : public runtime::OutputStream {
public:
    FakeOutputStream(runtime::CapturedOutput output, bool fail, std::chrono::milliseconds drain_duration)
        : output_(std::move(output))
        , fail_(fail)
        , drain_duration_(drain_duration) {}

    runtime::CapturedOutput ReadAll(std::chrono::milliseconds limit) override {
        if (fail_) {
            throw runtime::RuntimeError("stream reset");
        }
        std::this_thread::sleep_for(std::min(drain_duration_, limit));
        if (drain_duration_ > limit) {
            throw runtime::RuntimeError("read timed out");
        }
        return output_;
    }

    void Close() override { closed = true; }

    bool closed = false;

private:
    runtime::CapturedOutput output_;
    bool fail_;
    std::chrono::milliseconds drain_duration_;
};

// Instrumented runtime: counts every call and simulates a program that runs
// for run_duration unless it is killed first.
class FakeRuntimeClient : public runtime::RuntimeClient {
public:
    explicit FakeRuntimeClient(FakeBehavior behavior = {})
        : behavior_(std::move(behavior)) {}

    bool ImageExists(const std::string& image) override {
        ++image_checks;
        MaybeFail(FailAt::kImageCheck, "image check failed");
        checked_image = image;
        return behavior_.image_present;
    }

    void PullImage(const std::string& image, std::chrono::milliseconds limit) override {
        ++pulls;
        MaybeFail(FailAt::kPull, "manifest unknown");
        pull_limit = limit;
        std::this_thread::sleep_for(std::min(behavior_.pull_duration, limit));
        if (behavior_.pull_duration > limit) {
            throw runtime::RuntimeError("pull timed out");
        }
        pulled_image = image;
    }

    std::string CreateInstance(const runtime::InstanceSpec& spec) override {
        const int sequence = ++creates;
        MaybeFail(FailAt::kCreate, "no space left on device");
        std::lock_guard<std::mutex> lock(mutex_);
        last_spec = spec;
        return "fake-" + std::to_string(sequence);
    }

    void CopyFile(const std::string& instance_id,
                  const std::string& directory,
                  const std::string& file_name,
                  const std::string& contents) override {
        ++copies;
        MaybeFail(FailAt::kCopy, "archive rejected");
        std::lock_guard<std::mutex> lock(mutex_);
        copied_files[instance_id + ":" + directory + "/" + file_name] = contents;
    }

    std::unique_ptr<runtime::OutputStream> AttachOutput(const std::string&) override {
        ++attaches;
        MaybeFail(FailAt::kAttach, "attach refused");
        return std::make_unique<FakeOutputStream>(
            runtime::CapturedOutput{behavior_.stdout_data, behavior_.stderr_data},
            behavior_.fail_at == FailAt::kReadOutput,
            behavior_.drain_duration);
    }

    void Start(const std::string&) override {
        ++starts;
        MaybeFail(FailAt::kStart, "exec format error");
    }

    int WaitTerminal(const std::string&, std::chrono::milliseconds limit) override {
        ++waits;
        MaybeFail(FailAt::kWait, "wait interrupted");
        std::unique_lock<std::mutex> lock(mutex_);
        const auto run_for = std::min(behavior_.run_duration, limit);
        if (wait_cv_.wait_for(lock, run_for, [this] { return killed_any_; })) {
            return 137;
        }
        return behavior_.exit_code;
    }

    int Inspect(const std::string&) override {
        ++inspects;
        MaybeFail(FailAt::kInspect, "no such container");
        return behavior_.exit_code;
    }

    void Kill(const std::string& instance_id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            killed.push_back(instance_id);
            killed_any_ = true;
        }
        wait_cv_.notify_all();
    }

    void Remove(const std::string& instance_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.push_back(instance_id);
    }

    void Close() override { ++closes; }

    int TotalCalls() const {
        return image_checks + pulls + creates + copies + attaches + starts + waits + inspects;
    }

    std::vector<std::string> Killed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return killed;
    }

    std::vector<std::string> Removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed;
    }

    std::atomic<int> image_checks{0};
    std::atomic<int> pulls{0};
    std::atomic<int> creates{0};
    std::atomic<int> copies{0};
    std::atomic<int> attaches{0};
    std::atomic<int> starts{0};
    std::atomic<int> waits{0};
    std::atomic<int> inspects{0};
    std::atomic<int> closes{0};

    std::string checked_image;
    std::string pulled_image;
    std::chrono::milliseconds pull_limit{0};
    runtime::InstanceSpec last_spec;
    std::map<std::string, std::string> copied_files;
    std::vector<std::string> killed;
    std::vector<std::string> removed;

private:
    void MaybeFail(FailAt step, const char* message) {
        if (behavior_.fail_at == step) {
            throw runtime::RuntimeError(message, 500);
        }
    }

    FakeBehavior behavior_;
    mutable std::mutex mutex_;
    std::condition_variable wait_cv_;
    bool killed_any_ = false;
};

}  // namespace gexec::test_support

#include "runtime/docker_client.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <sys/socket.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "nlohmann/json.hpp"
#include "runtime/docker_stream.hpp"
#include "runtime/tar_archive.hpp"
#include "utils/logging.hpp"

namespace gexec::runtime {
namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;

using LocalStream = beast::basic_stream<net::local::stream_protocol>;

constexpr std::uint64_t kMaxResponseBody = 64ull * 1024 * 1024;
constexpr const char* kUserAgent = "gexec/1.0";

struct ImageReference {
    std::string repository;
    std::string tag;
};

ImageReference SplitImageReference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};
    }
    const auto slash = image.rfind('/');
    const auto colon = image.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image.substr(0, colon), image.substr(colon + 1)};
    }
    return {image, "latest"};
}

void PrepareRequest(http::request<http::string_body>& request, const std::string& content_type) {
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, kUserAgent);
    if (!content_type.empty()) {
        request.set(http::field::content_type, content_type);
    }
    request.prepare_payload();
}

class DockerOutputStream : public OutputStream {
public:
    DockerOutputStream(std::unique_ptr<net::io_context> ioc,
                       LocalStream::socket_type socket,
                       std::string leftover)
        : ioc_(std::move(ioc))
        , socket_(std::move(socket)) {
        demuxer_.Feed(leftover);
        reader_ = std::thread([this]() { Pump(); });
    }

    ~DockerOutputStream() override {
        Close();
    }

    CapturedOutput ReadAll(std::chrono::milliseconds timeout) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!done_cv_.wait_for(lock, timeout, [this] { return done_; })) {
                lock.unlock();
                Close();
                throw RuntimeError("output stream did not reach end of stream");
            }
        }
        Join();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_.empty()) {
            throw RuntimeError(error_);
        }
        if (demuxer_.HasPartialFrame()) {
            throw RuntimeError("output stream ended inside a frame");
        }
        return demuxer_.Take();
    }

    void Close() override {
        closing_ = true;
        ::shutdown(socket_.native_handle(), SHUT_RDWR);
        Join();
        beast::error_code ignored;
        socket_.close(ignored);
    }

private:
    void Pump() {
        std::array<char, 16 * 1024> chunk{};
        for (;;) {
            beast::error_code ec;
            const auto read = socket_.read_some(net::buffer(chunk), ec);
            if (read > 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                demuxer_.Feed(chunk.data(), read);
            }
            if (ec) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (ec != net::error::eof && !closing_) {
                    error_ = "reading attached output: " + ec.message();
                }
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        done_cv_.notify_all();
    }

    void Join() {
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (reader_.joinable()) {
            reader_.join();
        }
    }

    std::unique_ptr<net::io_context> ioc_;
    LocalStream::socket_type socket_;
    std::thread reader_;
    std::mutex join_mutex_;
    std::mutex mutex_;
    std::condition_variable done_cv_;
    StreamDemuxer demuxer_;
    std::string error_;
    bool done_ = false;
    std::atomic<bool> closing_{false};
};

}  // namespace

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (const unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string DockerErrorMessage(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    return body;
}

DockerClient::DockerClient(DockerClientOptions options)
    : options_(std::move(options)) {
    const auto ping = Request(http::verb::get, "/_ping", {}, {}, options_.call_timeout);
    if (ping.status != 200) {
        throw RuntimeError("docker daemon ping failed: HTTP " + std::to_string(ping.status), ping.status);
    }
}

DockerClient::~DockerClient() = default;

std::string DockerClient::Target(const std::string& path) const {
    if (options_.api_version.empty()) {
        return path;
    }
    return "/" + options_.api_version + path;
}

void DockerClient::EnsureOpen() const {
    if (closed_.load()) {
        throw RuntimeError("docker client closed");
    }
}

DockerClient::HttpResult DockerClient::Request(http::verb verb,
                                               const std::string& target,
                                               std::string body,
                                               const std::string& content_type,
                                               std::chrono::milliseconds timeout) {
    EnsureOpen();
    net::io_context ioc;
    LocalStream stream(ioc);

    http::request<http::string_body> request{verb, Target(target), 11};
    request.body() = std::move(body);
    PrepareRequest(request, content_type);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBody);

    beast::error_code result;
    const char* stage = "connect";
    stream.expires_after(timeout);
    stream.async_connect(
        net::local::stream_protocol::endpoint(options_.socket_path),
        [&](beast::error_code ec) {
            if (ec) {
                result = ec;
                return;
            }
            stage = "write";
            stream.expires_after(timeout);
            http::async_write(stream, request, [&](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                    result = write_ec;
                    return;
                }
                stage = "read";
                stream.expires_after(timeout);
                http::async_read(stream, buffer, parser, [&](beast::error_code read_ec, std::size_t) {
                    result = read_ec;
                });
            });
        });
    ioc.run();

    if (result) {
        throw RuntimeError(std::string("docker ") + stage + " " + target + ": " + result.message());
    }
    beast::error_code ignored;
    stream.socket().shutdown(net::socket_base::shutdown_both, ignored);

    HttpResult response{};
    response.status = static_cast<int>(parser.get().result_int());
    response.body = parser.release().body();
    return response;
}

bool DockerClient::ImageExists(const std::string& image) {
    const auto response = Request(
        http::verb::get, "/images/" + UrlEncode(image) + "/json", {}, {}, options_.call_timeout);
    if (response.status == 200) {
        return true;
    }
    if (response.status == 404) {
        return false;
    }
    throw RuntimeError("inspect image " + image + ": " + DockerErrorMessage(response.body), response.status);
}

void DockerClient::PullImage(const std::string& image, std::chrono::milliseconds limit) {
    const auto reference = SplitImageReference(image);
    std::string target = "/images/create?fromImage=" + UrlEncode(reference.repository);
    if (!reference.tag.empty()) {
        target += "&tag=" + UrlEncode(reference.tag);
    }
    utils::LogInfo("docker", "pulling image", {{"image", image}});
    const auto response = Request(http::verb::post, target, {}, {}, std::min(limit, options_.pull_timeout));
    if (response.status != 200) {
        throw RuntimeError(DockerErrorMessage(response.body), response.status);
    }
    // The body is a stream of JSON progress objects; failures show up inline.
    std::istringstream progress(response.body);
    std::string line;
    while (std::getline(progress, line)) {
        auto event = nlohmann::json::parse(line, nullptr, false);
        if (event.is_object() && event.contains("error") && event["error"].is_string()) {
            throw RuntimeError(event["error"].get<std::string>(), response.status);
        }
    }
}

std::string DockerClient::BuildCreateBody(const InstanceSpec& spec) {
    nlohmann::json body;
    body["Image"] = spec.image;
    body["Cmd"] = spec.command;
    body["Tty"] = false;
    body["OpenStdin"] = false;
    body["AttachStdin"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["NetworkDisabled"] = spec.network_disabled;
    if (!spec.working_dir.empty()) {
        body["WorkingDir"] = spec.working_dir;
    }
    nlohmann::json host_config;
    if (spec.limits.memory_bytes > 0) {
        host_config["Memory"] = spec.limits.memory_bytes;
        host_config["MemorySwap"] = spec.limits.memory_bytes;
    }
    if (spec.limits.cpu_quota > 0) {
        host_config["CpuQuota"] = spec.limits.cpu_quota;
    }
    if (spec.limits.cpu_period > 0) {
        host_config["CpuPeriod"] = spec.limits.cpu_period;
    }
    if (spec.network_disabled) {
        host_config["NetworkMode"] = "none";
    }
    host_config["AutoRemove"] = false;
    body["HostConfig"] = host_config;
    return body.dump();
}

std::string DockerClient::CreateInstance(const InstanceSpec& spec) {
    const auto response = Request(
        http::verb::post, "/containers/create", BuildCreateBody(spec), "application/json", options_.call_timeout);
    if (response.status != 201) {
        throw RuntimeError(DockerErrorMessage(response.body), response.status);
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_object() || !json.contains("Id") || !json["Id"].is_string()) {
        throw RuntimeError("create response carries no container id", response.status);
    }
    return json["Id"].get<std::string>();
}

void DockerClient::CopyFile(const std::string& instance_id,
                            const std::string& directory,
                            const std::string& file_name,
                            const std::string& contents) {
    TarEntry entry{};
    entry.name = file_name;
    entry.contents = contents;
    entry.mtime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string archive;
    try {
        archive = BuildSingleFileTar(entry);
    } catch (const std::invalid_argument& ex) {
        throw RuntimeError(ex.what());
    }
    const auto response = Request(
        http::verb::put,
        "/containers/" + instance_id + "/archive?path=" + UrlEncode(directory),
        std::move(archive),
        "application/x-tar",
        options_.call_timeout);
    if (response.status != 200) {
        throw RuntimeError(DockerErrorMessage(response.body), response.status);
    }
}

std::unique_ptr<OutputStream> DockerClient::AttachOutput(const std::string& instance_id) {
    EnsureOpen();
    auto ioc = std::make_unique<net::io_context>();
    LocalStream stream(*ioc);

    http::request<http::string_body> request{
        http::verb::post,
        Target("/containers/" + instance_id + "/attach?logs=1&stream=1&stdout=1&stderr=1"),
        11};
    request.set(http::field::connection, "Upgrade");
    request.set(http::field::upgrade, "tcp");
    PrepareRequest(request, {});

    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    beast::error_code result;
    const char* stage = "connect";
    stream.expires_after(options_.call_timeout);
    stream.async_connect(
        net::local::stream_protocol::endpoint(options_.socket_path),
        [&](beast::error_code ec) {
            if (ec) {
                result = ec;
                return;
            }
            stage = "write";
            stream.expires_after(options_.call_timeout);
            http::async_write(stream, request, [&](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                    result = write_ec;
                    return;
                }
                stage = "read header";
                stream.expires_after(options_.call_timeout);
                http::async_read_header(stream, buffer, parser, [&](beast::error_code read_ec, std::size_t) {
                    result = read_ec;
                });
            });
        });
    ioc->run();

    if (result) {
        throw RuntimeError(std::string("docker attach ") + stage + ": " + result.message());
    }
    const auto status = static_cast<int>(parser.get().result_int());
    if (status != 101 && status != 200) {
        throw RuntimeError("attach rejected with HTTP " + std::to_string(status), status);
    }
    stream.expires_never();
    auto leftover = beast::buffers_to_string(buffer.data());
    return std::make_unique<DockerOutputStream>(std::move(ioc), stream.release_socket(), std::move(leftover));
}

void DockerClient::Start(const std::string& instance_id) {
    const auto response = Request(
        http::verb::post, "/containers/" + instance_id + "/start", {}, {}, options_.call_timeout);
    if (response.status != 204 && response.status != 304) {
        throw RuntimeError(DockerErrorMessage(response.body), response.status);
    }
}

int DockerClient::WaitTerminal(const std::string& instance_id, std::chrono::milliseconds limit) {
    const auto response = Request(
        http::verb::post, "/containers/" + instance_id + "/wait?condition=not-running", {}, {}, limit);
    if (response.status != 200) {
        throw RuntimeError(DockerErrorMessage(response.body), response.status);
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_object() || !json.contains("StatusCode") || !json["StatusCode"].is_number_integer()) {
        throw RuntimeError("wait response carries no status code", response.status);
    }
    if (json.contains("Error") && json["Error"].is_object()) {
        const auto message = json["Error"].value("Message", "");
        if (!message.empty()) {
            throw RuntimeError(message, response.status);
        }
    }
    return json["StatusCode"].get<int>();
}

int DockerClient::Inspect(const std::string& instance_id) {
    const auto response = Request(
        http::verb::get, "/containers/" + instance_id + "/json", {}, {}, options_.call_timeout);
    if (response.status != 200) {
        throw RuntimeError(DockerErrorMessage(response.body), response.status);
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_object() || !json.contains("State") || !json["State"].is_object()) {
        throw RuntimeError("inspect response carries no state", response.status);
    }
    const auto& state = json["State"];
    if (state.value("OOMKilled", false)) {
        utils::LogInfo("docker", "instance was killed for exceeding its memory cap", {{"id", instance_id}});
    }
    return state.value("ExitCode", -1);
}

void DockerClient::Kill(const std::string& instance_id) {
    try {
        const auto response = Request(
            http::verb::post, "/containers/" + instance_id + "/kill?signal=SIGKILL", {}, {}, options_.call_timeout);
        if (response.status == 204) {
            return;
        }
        if (response.status == 404 || response.status == 409) {
            utils::LogDebug("docker", "kill skipped, instance not running", {{"id", instance_id}});
            return;
        }
        utils::LogWarn("docker", "kill failed",
                       {{"id", instance_id}, {"status", std::to_string(response.status)},
                        {"error", DockerErrorMessage(response.body)}});
    } catch (const std::exception& ex) {
        utils::LogWarn("docker", "kill failed", {{"id", instance_id}, {"error", ex.what()}});
    }
}

void DockerClient::Remove(const std::string& instance_id) {
    try {
        const auto response = Request(
            http::verb::delete_, "/containers/" + instance_id + "?force=true&v=true", {}, {}, options_.call_timeout);
        if (response.status == 204) {
            return;
        }
        if (response.status == 404 || response.status == 409) {
            utils::LogDebug("docker", "remove skipped, instance already gone", {{"id", instance_id}});
            return;
        }
        utils::LogWarn("docker", "remove failed",
                       {{"id", instance_id}, {"status", std::to_string(response.status)},
                        {"error", DockerErrorMessage(response.body)}});
    } catch (const std::exception& ex) {
        utils::LogWarn("docker", "remove failed", {{"id", instance_id}, {"error", ex.what()}});
    }
}

void DockerClient::Close() {
    closed_.store(true);
}

}  // namespace gexec::runtime

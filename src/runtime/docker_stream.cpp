#include "runtime/docker_stream.hpp"

#include <cstdint>

namespace gexec::runtime {
namespace {

constexpr std::size_t kFrameHeaderSize = 8;

std::uint32_t ReadBigEndian32(const char* data) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
        (static_cast<std::uint32_t>(bytes[1]) << 16) |
        (static_cast<std::uint32_t>(bytes[2]) << 8) |
        static_cast<std::uint32_t>(bytes[3]);
}

}  // namespace

void StreamDemuxer::Feed(const char* data, std::size_t size) {
    pending_.append(data, size);
    std::size_t offset = 0;
    while (pending_.size() - offset >= kFrameHeaderSize) {
        const char stream = pending_[offset];
        const std::size_t length = ReadBigEndian32(pending_.data() + offset + 4);
        if (pending_.size() - offset - kFrameHeaderSize < length) {
            break;
        }
        const char* payload = pending_.data() + offset + kFrameHeaderSize;
        if (stream == 1) {
            output_.stdout_data.append(payload, length);
        } else if (stream == 2) {
            output_.stderr_data.append(payload, length);
        }
        offset += kFrameHeaderSize + length;
    }
    pending_.erase(0, offset);
}

CapturedOutput StreamDemuxer::Take() {
    CapturedOutput taken = std::move(output_);
    output_ = CapturedOutput{};
    return taken;
}

CapturedOutput DemuxDockerStream(const std::string& raw) {
    StreamDemuxer demuxer;
    demuxer.Feed(raw);
    return demuxer.Take();
}

}  // namespace gexec::runtime

#pragma once

#include <cstddef>
#include <string>

#include "runtime/runtime_client.hpp"

namespace gexec::runtime {

// Incremental decoder for Docker's multiplexed attach/logs stream: frames of
// an 8-byte header {stream, 0, 0, 0, size(big endian u32)} followed by
// size payload bytes. Stream 1 is stdout, 2 is stderr; stdin echo (0) is
// dropped.
class StreamDemuxer {
public:
    void Feed(const char* data, std::size_t size);
    void Feed(const std::string& data) { Feed(data.data(), data.size()); }

    // True when the input ended in the middle of a frame.
    bool HasPartialFrame() const { return !pending_.empty(); }

    const CapturedOutput& Output() const { return output_; }
    CapturedOutput Take();

private:
    std::string pending_;
    CapturedOutput output_;
};

CapturedOutput DemuxDockerStream(const std::string& raw);

}  // namespace gexec::runtime

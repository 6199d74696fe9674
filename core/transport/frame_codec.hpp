#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/message_lite.h>

#include "logging/logger.hpp"
#include "protocol.pb.h"

namespace wordserve {
namespace transport {

// Maximum frame payload: 1 MiB
constexpr uint32_t kMaxFrameSize = 1024u * 1024u;
constexpr size_t kFrameHeaderSize = 4;

// Frames are: uint32_le (payload length) + serialized protobuf payload.
// Returns false (and sets error) if the message cannot be serialized or is too large.
bool encode_frame(const google::protobuf::MessageLite &message, std::string &out, std::string &error);

// Accumulates raw stream bytes and cuts them into frame payloads.
// The length prefix makes the stream self-delimiting, so partial frames are
// simply kept until the rest arrives.
class FrameBuffer {
public:
    enum class Next {
        FRAME,      // payload filled
        NEED_MORE,  // incomplete frame buffered
        OVERSIZE    // length prefix above kMaxFrameSize; buffer discarded
    };

    void append(const uint8_t *data, size_t len);
    Next next(std::string &payload);
    void clear();
    size_t buffered() const { return buffer_.size() - read_pos_; }

private:
    std::string buffer_;
    size_t read_pos_ = 0;

    void compact();
};

// Decodes the engine's stdout stream into Response messages.
// Malformed frames and responses without an id are logged and dropped;
// nothing here throws.
class FrameDecoder {
public:
    struct Stats {
        uint64_t frames = 0;
        uint64_t parse_failures = 0;
        uint64_t unroutable = 0;
        uint64_t discarded_bytes = 0;
    };

    explicit FrameDecoder(logging::LoggerPtr logger);

    std::vector<engine::v1::Response> feed(const uint8_t *data, size_t len);
    std::vector<engine::v1::Response> feed(const std::string &chunk) {
        return feed(reinterpret_cast<const uint8_t *>(chunk.data()), chunk.size());
    }

    // Drop any buffered partial frame (new process, new stream)
    void reset();

    size_t buffered_bytes() const { return frames_.buffered(); }
    const Stats &stats() const { return stats_; }

private:
    logging::LoggerPtr logger_;
    FrameBuffer frames_;
    Stats stats_;
};

}  // namespace transport
}  // namespace wordserve

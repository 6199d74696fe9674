#include "frame_codec.hpp"

namespace wordserve {
namespace transport {

bool encode_frame(const google::protobuf::MessageLite &message, std::string &out, std::string &error) {
    std::string payload;
    if (!message.SerializeToString(&payload)) {
        error = "Failed to serialize " + message.GetTypeName();
        return false;
    }
    if (payload.size() > kMaxFrameSize) {
        error = "Frame too large: " + std::to_string(payload.size()) + " bytes";
        return false;
    }

    uint32_t len32 = static_cast<uint32_t>(payload.size());
    out.clear();
    out.reserve(kFrameHeaderSize + payload.size());
    out.push_back(static_cast<char>((len32 >> 0) & 0xFF));
    out.push_back(static_cast<char>((len32 >> 8) & 0xFF));
    out.push_back(static_cast<char>((len32 >> 16) & 0xFF));
    out.push_back(static_cast<char>((len32 >> 24) & 0xFF));
    out.append(payload);
    return true;
}

void FrameBuffer::append(const uint8_t *data, size_t len) {
    if (len == 0) {
        return;
    }
    compact();
    buffer_.append(reinterpret_cast<const char *>(data), len);
}

FrameBuffer::Next FrameBuffer::next(std::string &payload) {
    if (buffered() < kFrameHeaderSize) {
        return Next::NEED_MORE;
    }

    const auto *p = reinterpret_cast<const uint8_t *>(buffer_.data() + read_pos_);
    uint32_t len = (uint32_t(p[0]) << 0) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);

    if (len > kMaxFrameSize) {
        // No way to find the next frame boundary after a corrupt prefix
        clear();
        return Next::OVERSIZE;
    }

    if (buffered() < kFrameHeaderSize + len) {
        return Next::NEED_MORE;
    }

    payload.assign(buffer_, read_pos_ + kFrameHeaderSize, len);
    read_pos_ += kFrameHeaderSize + len;
    return Next::FRAME;
}

void FrameBuffer::clear() {
    buffer_.clear();
    read_pos_ = 0;
}

void FrameBuffer::compact() {
    if (read_pos_ == 0) {
        return;
    }
    buffer_.erase(0, read_pos_);
    read_pos_ = 0;
}

FrameDecoder::FrameDecoder(logging::LoggerPtr logger) : logger_(std::move(logger)) {}

std::vector<engine::v1::Response> FrameDecoder::feed(const uint8_t *data, size_t len) {
    std::vector<engine::v1::Response> out;
    frames_.append(data, len);

    std::string payload;
    while (true) {
        const size_t before = frames_.buffered();
        auto next = frames_.next(payload);
        if (next == FrameBuffer::Next::NEED_MORE) {
            break;
        }
        if (next == FrameBuffer::Next::OVERSIZE) {
            stats_.discarded_bytes += before;
            LOG_ERROR(*logger_, "[Codec] Frame length exceeds " << kMaxFrameSize << " bytes, discarded " << before
                                                               << " buffered bytes");
            break;
        }

        stats_.frames++;
        engine::v1::Response response;
        if (!response.ParseFromString(payload)) {
            stats_.parse_failures++;
            LOG_WARN(*logger_, "[Codec] Dropping malformed frame (" << payload.size() << " bytes)");
            continue;
        }

        if (response.id().empty()) {
            stats_.unroutable++;
            LOG_WARN(*logger_, "[Codec] Dropping unroutable response without id");
            continue;
        }

        out.push_back(std::move(response));
    }

    return out;
}

void FrameDecoder::reset() { frames_.clear(); }

}  // namespace transport
}  // namespace wordserve

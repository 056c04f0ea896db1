#include "framing.hpp"

namespace framing {

static void write_be32(uint32_t v, uint8_t out[4]) {
    out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(v & 0xFF);
}

static uint32_t read_be32(const uint8_t in[4]) {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

std::vector<uint8_t> build_frame(FrameType type, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> frame;
    frame.reserve(kHeaderSize + payload.size());

    frame.push_back(static_cast<uint8_t>(type));
    uint8_t len[4];
    write_be32(static_cast<uint32_t>(payload.size()), len);
    frame.insert(frame.end(), len, len + 4);
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

size_t parse_frame(const std::vector<uint8_t>& data, FrameType& type, std::vector<uint8_t>& payload) {
    if (data.size() < kHeaderSize) {
        return 0;
    }
    uint32_t len = read_be32(data.data() + 1);
    if (data.size() - kHeaderSize < len) {
        return 0;
    }
    type = static_cast<FrameType>(data[0]);
    payload.assign(data.begin() + kHeaderSize, data.begin() + kHeaderSize + len);
    return kHeaderSize + len;
}

}

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace framing {

enum class FrameType : uint8_t {
    SIGNAL = 1
};

// Simple frame format:
// [type:1][len:4 big-endian][payload:len]
constexpr size_t kHeaderSize = 5;

std::vector<uint8_t> build_frame(FrameType type, const std::vector<uint8_t>& payload);

// Parses one frame from the front of data. Returns the number of bytes
// consumed, or 0 if data does not hold a complete frame yet.
size_t parse_frame(const std::vector<uint8_t>& data, FrameType& type, std::vector<uint8_t>& payload);

}

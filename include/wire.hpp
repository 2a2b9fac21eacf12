#pragma once

#include "chunkflow.pb.h"
#include <array>
#include <cstdint>
#include <string>

namespace chunkflow {
namespace wire {

// Every message is a MessageWrapper preceded by its length (4 bytes, big endian)
const size_t HEADER_SIZE = 4;
// Chunk payload plus protobuf overhead
const uint32_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

using Header = std::array<uint8_t, HEADER_SIZE>;

// Throws std::length_error for messages above MAX_FRAME_SIZE
std::string encode_frame(const MessageWrapper& msg);

uint32_t decode_length(const Header& header);

} // namespace wire
} // namespace chunkflow

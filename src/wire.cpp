#include "wire.hpp"
#include <stdexcept>

namespace chunkflow {
namespace wire {

std::string encode_frame(const MessageWrapper& msg) {
    size_t body_size = msg.ByteSizeLong();
    if (body_size > MAX_FRAME_SIZE) {
        throw std::length_error("Message of " + std::to_string(body_size) + " bytes exceeds frame limit");
    }

    std::string frame(HEADER_SIZE, '\0');
    uint32_t length = static_cast<uint32_t>(body_size);
    frame[0] = static_cast<char>((length >> 24) & 0xff);
    frame[1] = static_cast<char>((length >> 16) & 0xff);
    frame[2] = static_cast<char>((length >> 8) & 0xff);
    frame[3] = static_cast<char>(length & 0xff);

    std::string body;
    msg.SerializeToString(&body);
    frame += body;
    return frame;
}

uint32_t decode_length(const Header& header) {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           static_cast<uint32_t>(header[3]);
}

} // namespace wire
} // namespace chunkflow

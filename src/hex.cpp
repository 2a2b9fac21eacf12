#include "chunkflow/hex.hpp"
#include <iomanip>
#include <sstream>

namespace chunkflow {
namespace util {

std::string to_hex(const std::string& s) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned char c : s) {
        hex_stream << std::setw(2) << static_cast<int>(c);
    }
    return hex_stream.str();
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(std::string(bytes.begin(), bytes.end()));
}

} // namespace util
} // namespace chunkflow

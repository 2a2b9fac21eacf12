#include "wire.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

using namespace chunkflow;

TEST(WireTest, FrameStartsWithBigEndianLength) {
    MessageWrapper msg;
    auto* request = msg.mutable_upload_chunk_req();
    request->set_chunk_index(7);
    request->set_file_id("abc");
    request->set_data(std::string(300, 'x'));

    std::string frame = wire::encode_frame(msg);
    ASSERT_GE(frame.size(), wire::HEADER_SIZE);

    wire::Header header;
    std::copy(frame.begin(), frame.begin() + wire::HEADER_SIZE, header.begin());
    uint32_t length = wire::decode_length(header);
    EXPECT_EQ(length, frame.size() - wire::HEADER_SIZE);
    EXPECT_EQ(static_cast<uint8_t>(frame[0]), 0u);
    EXPECT_EQ(static_cast<uint8_t>(frame[1]), 0u);

    MessageWrapper decoded;
    ASSERT_TRUE(decoded.ParseFromString(frame.substr(wire::HEADER_SIZE)));
    ASSERT_TRUE(decoded.has_upload_chunk_req());
    EXPECT_EQ(decoded.upload_chunk_req().chunk_index(), 7u);
    EXPECT_EQ(decoded.upload_chunk_req().data().size(), 300u);
}

TEST(WireTest, DecodesHeaderBytes) {
    wire::Header header{0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(wire::decode_length(header), 0x01020304u);
}

TEST(WireTest, EmptyMessageHasZeroLength) {
    MessageWrapper msg;
    std::string frame = wire::encode_frame(msg);
    EXPECT_EQ(frame, std::string(4, '\0'));
}

TEST(WireTest, RejectsOversizedMessages) {
    MessageWrapper msg;
    msg.mutable_upload_chunk_req()->set_data(std::string(wire::MAX_FRAME_SIZE + 1, 'x'));
    EXPECT_THROW(wire::encode_frame(msg), std::length_error);
}

#include "chunkflow/digest.hpp"
#include "chunkflow/hex.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace chunkflow;

TEST(HexTest, EncodesBytesAsLowercasePairs) {
    EXPECT_EQ(util::to_hex(std::string("\x01\xab\xff\x00", 4)), "01abff00");
    EXPECT_EQ(util::to_hex(std::vector<uint8_t>{0x0f, 0x10}), "0f10");
    EXPECT_EQ(util::to_hex(std::string()), "");
}

TEST(HexTest, RecognisesChecksums) {
    EXPECT_TRUE(util::is_checksum(std::string(64, 'a')));
    EXPECT_FALSE(util::is_checksum(std::string(63, 'a')));
    EXPECT_FALSE(util::is_checksum(std::string(64, 'A')));
    EXPECT_FALSE(util::is_checksum(std::string(62, '0') + "g0"));
}

TEST(DigestTest, MatchesKnownVectors) {
    std::string abc = "abc";
    EXPECT_EQ(util::sha256_hex(reinterpret_cast<const uint8_t*>(abc.data()), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(util::sha256_hex(std::vector<uint8_t>()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, IncrementalUpdatesMatchOneShot) {
    std::string text = "The quick brown fox jumps over the lazy dog";
    util::Sha256 sha;
    sha.update(text.data(), 10);
    sha.update(text.data() + 10, text.size() - 10);
    EXPECT_EQ(sha.hex_digest(),
              util::sha256_hex(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

TEST(DigestTest, CannotBeUsedAfterFinalize) {
    util::Sha256 sha;
    sha.update("x", 1);
    sha.hex_digest();
    EXPECT_THROW(sha.update("y", 1), std::logic_error);
    EXPECT_THROW(sha.hex_digest(), std::logic_error);
}

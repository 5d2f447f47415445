/**
 * @file keymap_test.cpp
 * @brief Unit tests for keymap buffer encoding
 */

#include "keymap.h"
#include "gtest/gtest.h"

#include <stdexcept>
#include <string>

namespace {

class KeymapTest : public ::testing::Test {
 protected:
  std::vector<uint32_t> keycodes_ = {0x0029, 0x0014, 0x412C, 0x7C00};
  std::vector<uint8_t> bytes_ = {0x00, 0x29, 0x00, 0x14, 0x41, 0x2C, 0x7C, 0x00};
};

}  // namespace

// ============================================================================
// ENCODE / DECODE
// ============================================================================

TEST_F(KeymapTest, EncodeIsBigEndian) {
  EXPECT_EQ(bytes_, encode_keymap(keycodes_));
  EXPECT_TRUE(encode_keymap({}).empty());
}

TEST_F(KeymapTest, EncodeRejectsHostOnlyValues) {
  EXPECT_THROW(encode_keymap({0x0004, 0x99100}), std::runtime_error);
  EXPECT_NO_THROW(encode_keymap({0xFFFF}));
}

TEST_F(KeymapTest, DecodeRestoresKeycodes) {
  std::vector<uint32_t> out;
  ASSERT_TRUE(decode_keymap(bytes_, out));
  EXPECT_EQ(keycodes_, out);
}

TEST_F(KeymapTest, DecodeRejectsOddLength) {
  std::vector<uint32_t> out;
  EXPECT_FALSE(decode_keymap({0x00, 0x29, 0x00}, out));
}

// ============================================================================
// HEX INPUT AND OUTPUT
// ============================================================================

TEST_F(KeymapTest, ParseHexBytes) {
  std::vector<uint8_t> out;
  ASSERT_TRUE(parse_hex_bytes("00 29 00 14 41 2c 7c 00", out));
  EXPECT_EQ(bytes_, out);

  ASSERT_TRUE(parse_hex_bytes("0x00,0x29, 0X00 ,14", out));
  EXPECT_EQ((std::vector<uint8_t>{0x00, 0x29, 0x00, 0x14}), out);

  ASSERT_TRUE(parse_hex_bytes("", out));
  EXPECT_TRUE(out.empty());
}

TEST_F(KeymapTest, ParseHexBytesRejectsNonBytes) {
  std::vector<uint8_t> out;
  EXPECT_FALSE(parse_hex_bytes("100", out));
  EXPECT_FALSE(parse_hex_bytes("zz", out));
  EXPECT_FALSE(parse_hex_bytes("0x", out));
}

TEST_F(KeymapTest, HexdumpSixteenBytesPerLine) {
  std::vector<uint8_t> bytes(18, 0xAB);
  bytes[16] = 0x01;

  testing::internal::CaptureStdout();
  hexdump_keymap(bytes, "Keymap:");
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ("Keymap:\n"
            "0000: ab ab ab ab ab ab ab ab ab ab ab ab ab ab ab ab\n"
            "0010: 01 ab\n",
            out);
}

#include <cstdint>
#include <limits>
#include <sstream>
#include <vector>

#include <packer/stream.hpp>
#include <packer/varint.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> encoded(uint64_t value) {
  auto result = packer::encodeVarint(value);
  return {result.bytes.begin(), result.bytes.begin() + result.length};
}

} // namespace

TEST(VarintTest, EncodeKnownValues) {
  EXPECT_EQ(encoded(0), (std::vector<uint8_t>{0x00}));
  EXPECT_EQ(encoded(1), (std::vector<uint8_t>{0x01}));
  EXPECT_EQ(encoded(127), (std::vector<uint8_t>{0x7F}));
  EXPECT_EQ(encoded(128), (std::vector<uint8_t>{0x80, 0x01}));
  EXPECT_EQ(encoded(300), (std::vector<uint8_t>{0xAC, 0x02}));
  EXPECT_EQ(encoded(std::numeric_limits<uint64_t>::max()).size(), packer::maxVarintLength);
}

TEST(VarintTest, BoundaryValuesSurviveEncoding) {
  const uint64_t values[] = {
      0,
      127,
      128,
      (uint64_t{1} << 32) - 1,
      (uint64_t{1} << 63) - 1,
      std::numeric_limits<uint64_t>::max(),
  };

  for (uint64_t value : values) {
    auto bytes = encoded(value);
    size_t length = 0;
    auto decoded = packer::decodeVarint(bytes, &length);
    ASSERT_TRUE(decoded.has_value()) << value;
    EXPECT_EQ(*decoded, value);
    EXPECT_EQ(length, bytes.size());
  }
}

TEST(VarintTest, DecodeStopsAtFirstCompleteValue) {
  std::vector<uint8_t> bytes = {0x80, 0x01, 0xFF, 0xFF};
  size_t length = 0;
  auto decoded = packer::decodeVarint(bytes, &length);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, 128);
  EXPECT_EQ(length, 2);
}

TEST(VarintTest, TruncatedInputFails) {
  std::vector<uint8_t> bytes = {0x80, 0x80};
  EXPECT_FALSE(packer::decodeVarint(bytes).has_value());
  EXPECT_FALSE(packer::decodeVarint({}).has_value());
}

TEST(VarintTest, OverflowFails) {
  // Eleven continuation bytes
  std::vector<uint8_t> tooLong(11, 0x80);
  tooLong.back() = 0x00;
  EXPECT_FALSE(packer::decodeVarint(tooLong).has_value());

  // Ten bytes, but the last one carries more than the top bit
  std::vector<uint8_t> tooWide(9, 0xFF);
  tooWide.push_back(0x02);
  EXPECT_FALSE(packer::decodeVarint(tooWide).has_value());
}

TEST(VarintTest, EncodingIsConstexpr) {
  constexpr auto value = packer::encodeVarint(128);
  static_assert(value.length == 2);
  static_assert(value.bytes[0] == 0x80 && value.bytes[1] == 0x01);
  SUCCEED();
}

TEST(VarintTest, StreamReaderReportsTruncationAndOverflow) {
  {
    std::istringstream in(std::string("\x80\x80", 2));
    packer::StreamReader reader(in);
    packer::Error error;
    EXPECT_FALSE(reader.readVarint("size", "a.txt", &error).has_value());
    EXPECT_EQ(error.kind, packer::ErrorKind::Format);
    EXPECT_EQ(error.path, "a.txt");
    EXPECT_EQ(error.offset, 0u);
  }
  {
    std::istringstream in(std::string(11, '\xFF'));
    packer::StreamReader reader(in);
    packer::Error error;
    EXPECT_FALSE(reader.readVarint("size", "a.txt", &error).has_value());
    EXPECT_EQ(error.kind, packer::ErrorKind::Format);
    EXPECT_NE(error.message.find("overflow"), std::string::npos);
  }
  {
    std::istringstream in(std::string("\xAC\x02\x05", 3));
    packer::StreamReader reader(in);
    auto first = reader.readVarint("size", "");
    auto second = reader.readVarint("size", "");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, 300);
    EXPECT_EQ(*second, 5);
    EXPECT_EQ(reader.offset(), 3);
  }
}

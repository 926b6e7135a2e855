#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace packer {

// Unsigned LEB128: 7 data bits per byte, least significant group first,
// high bit set on every byte except the last.

// A 64-bit value never needs more than 10 bytes
inline constexpr size_t maxVarintLength = 10;

struct EncodedVarint {
  std::array<uint8_t, maxVarintLength> bytes{};
  size_t length = 0;

  std::span<const uint8_t> view() const { return {bytes.data(), length}; }
};

inline constexpr EncodedVarint encodeVarint(uint64_t value) noexcept {
  EncodedVarint out;
  do {
    uint8_t byte = static_cast<uint8_t>(value & 0x7F);
    value >>= 7;
    if (value != 0) {
      byte |= 0x80;
    }
    out.bytes[out.length++] = byte;
  } while (value != 0);
  return out;
}

// Incremental decoder, fed one byte at a time by stream readers
class VarintDecoder {
public:
  enum class State {
    NeedMore,
    Done,
    Overflow,
  };

  constexpr State feed(uint8_t byte) noexcept {
    if (count_ == maxVarintLength) {
      return State::Overflow;
    }
    uint64_t group = byte & 0x7F;
    // The tenth byte may only carry the top bit of a 64-bit value
    if (count_ == maxVarintLength - 1 && group > 1) {
      return State::Overflow;
    }
    value_ |= group << (7 * count_);
    ++count_;
    if (byte & 0x80) {
      return count_ == maxVarintLength ? State::Overflow : State::NeedMore;
    }
    return State::Done;
  }

  constexpr uint64_t value() const noexcept { return value_; }
  constexpr size_t length() const noexcept { return count_; }

private:
  uint64_t value_ = 0;
  size_t count_ = 0;
};

// Decode a complete varint from the front of data.
// Returns std::nullopt if data ends mid-varint or the value overflows 64 bits.
inline constexpr std::optional<uint64_t> decodeVarint(std::span<const uint8_t> data,
                                                      size_t *outLength = nullptr) noexcept {
  VarintDecoder decoder;
  for (uint8_t byte : data) {
    switch (decoder.feed(byte)) {
    case VarintDecoder::State::NeedMore:
      continue;
    case VarintDecoder::State::Done:
      if (outLength) {
        *outLength = decoder.length();
      }
      return decoder.value();
    case VarintDecoder::State::Overflow:
      return std::nullopt;
    }
  }
  return std::nullopt;
}

} // namespace packer

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "codec.hpp"

namespace packer {

// USTAR header block (512 bytes), field offsets and widths
struct TarHeader {
  static constexpr size_t blockSize = 512;

  static constexpr size_t nameOffset = 0, nameSize = 100;
  static constexpr size_t modeOffset = 100, modeSize = 8;
  static constexpr size_t uidOffset = 108, uidSize = 8;
  static constexpr size_t gidOffset = 116, gidSize = 8;
  static constexpr size_t sizeOffset = 124, sizeSize = 12;
  static constexpr size_t mtimeOffset = 136, mtimeSize = 12;
  static constexpr size_t checksumOffset = 148, checksumSize = 8;
  static constexpr size_t typeflagOffset = 156;
  static constexpr size_t linknameOffset = 157, linknameSize = 100;
  static constexpr size_t magicOffset = 257, magicSize = 6;
  static constexpr size_t versionOffset = 263, versionSize = 2;
  static constexpr size_t prefixOffset = 345, prefixSize = 155;

  static constexpr char typeRegular = '0';
  static constexpr char typeRegularOld = '\0';
  static constexpr char typeSymlink = '2';
  static constexpr char typeDirectory = '5';

  using Block = std::array<uint8_t, blockSize>;

  // Unsigned sum of all header bytes with the checksum field read as spaces
  static uint32_t computeChecksum(std::span<const uint8_t, blockSize> block) noexcept;

  // Parse a numeric field: octal text with optional leading spaces and a
  // NUL/space terminator, or GNU base-256 when the first byte has its high bit set.
  // Returns std::nullopt for malformed fields.
  static std::optional<uint64_t> parseNumber(std::span<const uint8_t> field) noexcept;
};

// Tape archive codec, USTAR-compatible
class TarCodec final : public Codec {
public:
  Format format() const override { return Format::Tar; }

  bool pack(EntrySource &source, std::ostream &out, Error *outError = nullptr) const override;
  bool unpack(std::istream &in, EntrySink &sink, Error *outError = nullptr) const override;
};

} // namespace packer

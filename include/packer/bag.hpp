#pragma once

#include <array>
#include <cstdint>

#include "codec.hpp"

namespace packer {

// Bag archive layout
//
//   "BAGF" version(1)
//   record*       path-length(varint) path kind(1) mode(varint) mtime(varint)
//                 file:    size(varint) payload
//                 symlink: target-length(varint) target
//   end record    0x00 0xFF
//
// No alignment padding anywhere.
class BagCodec final : public Codec {
public:
  static constexpr std::array<uint8_t, 4> magic = {'B', 'A', 'G', 'F'};
  static constexpr uint8_t version = 1;
  static constexpr uint8_t endTag = 255;

  Format format() const override { return Format::Bag; }

  bool pack(EntrySource &source, std::ostream &out, Error *outError = nullptr) const override;
  bool unpack(std::istream &in, EntrySink &sink, Error *outError = nullptr) const override;
};

} // namespace packer

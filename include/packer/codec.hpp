#pragma once

#include <istream>
#include <memory>
#include <ostream>

#include "source.hpp"
#include "types.hpp"

namespace packer {

// Common contract of the archive formats
class Codec {
public:
  virtual ~Codec() = default;

  virtual Format format() const = 0;

  // Encode every entry of source into out, followed by the end-of-archive marker
  // Returns true on success, false on failure (error in outError if provided)
  virtual bool pack(EntrySource &source, std::ostream &out, Error *outError = nullptr) const = 0;

  // Decode the archive in in, handing each entry to sink
  // Returns true on success, false on failure (error in outError if provided)
  virtual bool unpack(std::istream &in, EntrySink &sink, Error *outError = nullptr) const = 0;
};

std::unique_ptr<Codec> makeCodec(Format format);

} // namespace packer

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>

#include "types.hpp"

namespace packer {

// Ordered sequence of entries fed to a codec when packing
class EntrySource {
public:
  virtual ~EntrySource() = default;

  // Produce the next entry. On success sets out to the entry, or to
  // std::nullopt at the end of the sequence.
  // Returns false on failure (error in outError if provided)
  virtual bool next(std::optional<Entry> &out, Error *outError = nullptr) = 0;

  // Write exactly entry.size payload bytes of the entry last returned by next()
  // Returns false on failure (error in outError if provided)
  virtual bool copyPayload(const Entry &entry, std::ostream &out,
                           Error *outError = nullptr) = 0;
};

// Receiver of decoded entries when unpacking.
// Calls arrive as beginEntry, writePayload (RegularFile only, zero or more
// times), endEntry for each entry, then finish once after the last entry.
class EntrySink {
public:
  virtual ~EntrySink() = default;

  virtual bool beginEntry(const Entry &entry, Error *outError = nullptr) = 0;
  virtual bool writePayload(std::span<const uint8_t> data, Error *outError = nullptr) = 0;
  virtual bool endEntry(Error *outError = nullptr) = 0;
  virtual bool finish(Error *outError = nullptr) = 0;
};

} // namespace packer

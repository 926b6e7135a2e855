#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "source.hpp"
#include "types.hpp"

namespace packer {

// Buffer size used when streaming payloads
inline constexpr size_t copyBufferSize = 64 * 1024;

// Archive input stream that tracks the byte offset and reports short reads as
// Format errors tagged with that offset
class StreamReader {
public:
  explicit StreamReader(std::istream &in) : in_(in) {}

  StreamReader(const StreamReader &) = delete;
  StreamReader &operator=(const StreamReader &) = delete;

  // Read up to buffer.size() bytes. Returns the number of bytes read, which is
  // short only at end of stream. Returns std::nullopt on a stream failure.
  std::optional<size_t> readSome(std::span<uint8_t> buffer, Error *outError = nullptr);

  // Read exactly buffer.size() bytes. End of stream fails with a Format error
  // "truncated <what>" at the offset where the field started.
  bool readExact(std::span<uint8_t> buffer, std::string_view what, const std::string &path,
                 Error *outError = nullptr);

  bool readByte(uint8_t &out, std::string_view what, const std::string &path,
                Error *outError = nullptr);

  // Read an unsigned LEB128 value
  std::optional<uint64_t> readVarint(std::string_view what, const std::string &path,
                                     Error *outError = nullptr);

  // Discard exactly count bytes
  bool skip(uint64_t count, std::string_view what, const std::string &path,
            Error *outError = nullptr);

  // Forward exactly size bytes to sink.writePayload in bounded chunks
  bool copyToSink(uint64_t size, EntrySink &sink, const std::string &path,
                  Error *outError = nullptr);

  uint64_t offset() const { return offset_; }

private:
  std::istream &in_;
  uint64_t offset_ = 0;
};

// Write bytes to an archive stream, reporting failures as IO errors on path
bool writeBytes(std::ostream &out, std::span<const uint8_t> data, const std::string &path,
                Error *outError = nullptr);

} // namespace packer

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace packer {

// Container formats understood by the library
enum class Format {
  Bag, // Compact varint-based format (default)
  Tar, // USTAR-compatible 512-byte block format
};

enum class EntryKind : uint8_t {
  RegularFile = 0,
  Directory = 1,
  Symlink = 2,
};

// One archived file-tree node
struct Entry {
  std::string path;        // Relative, forward slashes, no "." or ".." segments
  EntryKind kind = EntryKind::RegularFile;
  uint32_t mode = 0;       // POSIX permission bits
  uint64_t size = 0;       // Payload length, RegularFile only
  uint64_t mtime = 0;      // Seconds since the Unix epoch
  uint32_t uid = 0;        // Stored by the tar format only
  uint32_t gid = 0;        // Stored by the tar format only
  std::string linkTarget;  // Raw target, Symlink only
};

enum class ErrorKind {
  IO,
  Format,
  PathSecurity,
  UnsupportedFeature,
};

// Error reported through the outError parameter of library calls
struct Error {
  ErrorKind kind = ErrorKind::IO;
  std::string path;              // Offending archive or filesystem path, may be empty
  std::string message;
  std::optional<uint64_t> offset; // Byte offset in the archive stream, if known

  // Single-line description, e.g. "format error: a.txt: truncated payload (at offset 17)"
  std::string describe() const;
};

// Store error in outError if provided. Always returns false so callers can write
// `return fail(outError, ...);`
bool fail(Error *outError, ErrorKind kind, std::string path, std::string message,
          std::optional<uint64_t> offset = std::nullopt);

std::string_view errorKindName(ErrorKind kind);
std::string_view entryKindName(EntryKind kind);
std::string_view formatName(Format format);

// Map "bag" or "tar" to a Format. Unknown names fail with UnsupportedFeature.
std::optional<Format> parseFormat(std::string_view name, Error *outError = nullptr);

} // namespace packer

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <string>
#include <unordered_set>

#include <fmt/format.h>

#include <packer/path.hpp>
#include <packer/stream.hpp>
#include <packer/tar.hpp>

namespace packer {

namespace {

bool isZeroBlock(const TarHeader::Block &block) {
  return std::all_of(block.begin(), block.end(), [](uint8_t byte) { return byte == 0; });
}

// Copy value into a fixed-width field; the caller has checked it fits
void putString(TarHeader::Block &block, size_t offset, const std::string &value) {
  std::memcpy(block.data() + offset, value.data(), value.size());
}

// Zero-padded octal digits filling width - 1 bytes, then NUL
bool putOctal(TarHeader::Block &block, size_t offset, size_t width, uint64_t value,
              std::string_view field, const std::string &path, Error *outError) {
  size_t digits = width - 1;
  if (value >> (3 * digits) != 0) {
    return fail(outError, ErrorKind::UnsupportedFeature, path,
                fmt::format("{} {} does not fit the {}-digit octal field", field, value, digits));
  }
  std::string text = fmt::format("{:0{}o}", value, digits);
  putString(block, offset, text);
  block[offset + digits] = '\0';
  return true;
}

// GNU base-256: marker bit in the first byte, big-endian value in the rest
void putBase256(TarHeader::Block &block, size_t offset, size_t width, uint64_t value) {
  for (size_t i = width; i-- > 1;) {
    block[offset + i] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
  block[offset] = 0x80;
}

// Octal when the id fits, base-256 otherwise
void putId(TarHeader::Block &block, size_t offset, size_t width, uint32_t value) {
  if (static_cast<uint64_t>(value) >> (3 * (width - 1)) != 0) {
    putBase256(block, offset, width, value);
    return;
  }
  putString(block, offset, fmt::format("{:0{}o}", value, width - 1));
  block[offset + width - 1] = '\0';
}

// NUL-terminated string from a fixed-width field (may fill it completely)
std::string getString(const TarHeader::Block &block, size_t offset, size_t size) {
  const char *start = reinterpret_cast<const char *>(block.data() + offset);
  return std::string(start, strnlen(start, size));
}

std::optional<uint64_t> getNumber(const TarHeader::Block &block, size_t offset, size_t size,
                                  std::string_view field, const std::string &path,
                                  uint64_t headerOffset, Error *outError) {
  auto value = TarHeader::parseNumber(std::span<const uint8_t>(block.data() + offset, size));
  if (!value) {
    fail(outError, ErrorKind::Format, path, fmt::format("Malformed {} field", field),
         headerOffset + offset);
  }
  return value;
}

bool writePadding(std::ostream &out, uint64_t size, const std::string &path, Error *outError) {
  static const TarHeader::Block zeros{};
  size_t remainder = static_cast<size_t>(size % TarHeader::blockSize);
  if (remainder == 0) {
    return true;
  }
  return writeBytes(out, std::span<const uint8_t>(zeros.data(), TarHeader::blockSize - remainder),
                    path, outError);
}

} // namespace

uint32_t TarHeader::computeChecksum(std::span<const uint8_t, blockSize> block) noexcept {
  uint32_t sum = 0;
  for (size_t i = 0; i < blockSize; ++i) {
    if (i >= checksumOffset && i < checksumOffset + checksumSize) {
      sum += static_cast<uint8_t>(' ');
    } else {
      sum += block[i];
    }
  }
  return sum;
}

std::optional<uint64_t> TarHeader::parseNumber(std::span<const uint8_t> field) noexcept {
  if (field.empty()) {
    return std::nullopt;
  }

  // GNU base-256: big-endian two's complement with the marker bit in the first byte
  if (field[0] & 0x80) {
    if (field[0] & 0x40) {
      return std::nullopt; // negative
    }
    uint64_t value = field[0] & 0x3F;
    for (size_t i = 1; i < field.size(); ++i) {
      if (value >> 56 != 0) {
        return std::nullopt;
      }
      value = (value << 8) | field[i];
    }
    return value;
  }

  size_t pos = 0;
  while (pos < field.size() && field[pos] == ' ') {
    ++pos;
  }

  // An all-blank field reads as zero; several writers leave unused fields empty
  uint64_t value = 0;
  for (; pos < field.size(); ++pos) {
    uint8_t c = field[pos];
    if (c == '\0' || c == ' ') {
      break;
    }
    if (c < '0' || c > '7') {
      return std::nullopt;
    }
    if (value >> 61 != 0) {
      return std::nullopt;
    }
    value = (value << 3) | static_cast<uint64_t>(c - '0');
  }

  // Everything after the terminator must be padding
  for (; pos < field.size(); ++pos) {
    if (field[pos] != '\0' && field[pos] != ' ') {
      return std::nullopt;
    }
  }

  return value;
}

bool TarCodec::pack(EntrySource &source, std::ostream &out, Error *outError) const {
  std::unordered_set<std::string> seen;
  std::optional<Entry> next;
  while (true) {
    if (!source.next(next, outError)) {
      return false;
    }
    if (!next) {
      break;
    }
    Entry &entry = *next;

    if (!validateEntryPath(entry, seen, outError)) {
      return false;
    }

    std::string name = entry.path;
    if (entry.kind == EntryKind::Directory) {
      name += '/';
    }
    if (name.size() > TarHeader::nameSize) {
      return fail(outError, ErrorKind::UnsupportedFeature, entry.path,
                  fmt::format("Name is {} bytes, tar name field holds {}", name.size(),
                              TarHeader::nameSize));
    }
    if (entry.kind == EntryKind::Symlink && entry.linkTarget.size() > TarHeader::linknameSize) {
      return fail(outError, ErrorKind::UnsupportedFeature, entry.path,
                  fmt::format("Link target is {} bytes, tar link field holds {}",
                              entry.linkTarget.size(), TarHeader::linknameSize));
    }

    uint64_t size = entry.kind == EntryKind::RegularFile ? entry.size : 0;

    TarHeader::Block block{};
    putString(block, TarHeader::nameOffset, name);
    putId(block, TarHeader::uidOffset, TarHeader::uidSize, entry.uid);
    putId(block, TarHeader::gidOffset, TarHeader::gidSize, entry.gid);
    if (!putOctal(block, TarHeader::modeOffset, TarHeader::modeSize, entry.mode, "mode",
                  entry.path, outError) ||
        !putOctal(block, TarHeader::sizeOffset, TarHeader::sizeSize, size, "size", entry.path,
                  outError) ||
        !putOctal(block, TarHeader::mtimeOffset, TarHeader::mtimeSize, entry.mtime, "mtime",
                  entry.path, outError)) {
      return false;
    }

    switch (entry.kind) {
    case EntryKind::RegularFile:
      block[TarHeader::typeflagOffset] = TarHeader::typeRegular;
      break;
    case EntryKind::Directory:
      block[TarHeader::typeflagOffset] = TarHeader::typeDirectory;
      break;
    case EntryKind::Symlink:
      block[TarHeader::typeflagOffset] = TarHeader::typeSymlink;
      putString(block, TarHeader::linknameOffset, entry.linkTarget);
      break;
    }

    std::memcpy(block.data() + TarHeader::magicOffset, "ustar", TarHeader::magicSize);
    std::memcpy(block.data() + TarHeader::versionOffset, "00", TarHeader::versionSize);

    // Six octal digits, NUL, space
    uint32_t checksum = TarHeader::computeChecksum(block);
    std::string checksumText = fmt::format("{:06o}", checksum);
    putString(block, TarHeader::checksumOffset, checksumText);
    block[TarHeader::checksumOffset + 6] = '\0';
    block[TarHeader::checksumOffset + 7] = ' ';

    if (!writeBytes(out, block, entry.path, outError)) {
      return false;
    }

    if (entry.kind == EntryKind::RegularFile) {
      if (!source.copyPayload(entry, out, outError) ||
          !writePadding(out, entry.size, entry.path, outError)) {
        return false;
      }
    }
  }

  // Two zero blocks terminate the archive
  static const TarHeader::Block zeros{};
  if (!writeBytes(out, zeros, "", outError) || !writeBytes(out, zeros, "", outError)) {
    return false;
  }

  out.flush();
  if (!out) {
    return fail(outError, ErrorKind::IO, "", "Failed to flush archive stream");
  }
  return true;
}

bool TarCodec::unpack(std::istream &in, EntrySink &sink, Error *outError) const {
  StreamReader reader(in);
  std::unordered_set<std::string> seen;
  TarHeader::Block block{};

  while (true) {
    uint64_t headerOffset = reader.offset();
    auto count = reader.readSome(block, outError);
    if (!count) {
      return false;
    }
    if (*count == 0) {
      break; // End of stream on a block boundary
    }
    if (*count != TarHeader::blockSize) {
      return fail(outError, ErrorKind::Format, "",
                  fmt::format("Truncated header block ({} of {} bytes)", *count,
                              TarHeader::blockSize),
                  headerOffset);
    }

    if (isZeroBlock(block)) {
      uint64_t secondOffset = reader.offset();
      auto second = reader.readSome(block, outError);
      if (!second) {
        return false;
      }
      if (*second == 0) {
        break;
      }
      if (*second != TarHeader::blockSize) {
        return fail(outError, ErrorKind::Format, "", "Truncated end-of-archive marker",
                    secondOffset);
      }
      if (!isZeroBlock(block)) {
        return fail(outError, ErrorKind::Format, "",
                    "Zero block followed by a non-zero block", headerOffset);
      }
      break;
    }

    std::string name = getString(block, TarHeader::nameOffset, TarHeader::nameSize);

    auto storedChecksum = TarHeader::parseNumber(
        std::span<const uint8_t>(block.data() + TarHeader::checksumOffset, TarHeader::checksumSize));
    uint32_t computedChecksum = TarHeader::computeChecksum(block);
    if (!storedChecksum || *storedChecksum != computedChecksum) {
      return fail(outError, ErrorKind::Format, name,
                  storedChecksum ? fmt::format("Header checksum mismatch (stored {:o}, computed {:o})",
                                               *storedChecksum, computedChecksum)
                                 : std::string("Malformed header checksum field"),
                  headerOffset);
    }

    // USTAR splits long names into prefix/name
    if (std::memcmp(block.data() + TarHeader::magicOffset, "ustar", 5) == 0) {
      std::string prefix = getString(block, TarHeader::prefixOffset, TarHeader::prefixSize);
      if (!prefix.empty()) {
        name = prefix + "/" + name;
      }
    }

    Entry entry;
    entry.path = name;

    char typeflag = static_cast<char>(block[TarHeader::typeflagOffset]);
    switch (typeflag) {
    case TarHeader::typeRegular:
    case TarHeader::typeRegularOld:
      entry.kind = EntryKind::RegularFile;
      break;
    case TarHeader::typeDirectory:
      entry.kind = EntryKind::Directory;
      break;
    case TarHeader::typeSymlink:
      entry.kind = EntryKind::Symlink;
      entry.linkTarget = getString(block, TarHeader::linknameOffset, TarHeader::linknameSize);
      break;
    default:
      return fail(outError, ErrorKind::Format, name,
                  fmt::format("Unsupported typeflag '{}' ({})",
                              std::isprint(static_cast<unsigned char>(typeflag)) ? typeflag : '?',
                              static_cast<int>(static_cast<unsigned char>(typeflag))),
                  headerOffset + TarHeader::typeflagOffset);
    }

    auto mode = getNumber(block, TarHeader::modeOffset, TarHeader::modeSize, "mode", name,
                          headerOffset, outError);
    if (!mode) {
      return false;
    }
    auto uid = getNumber(block, TarHeader::uidOffset, TarHeader::uidSize, "uid", name,
                         headerOffset, outError);
    if (!uid) {
      return false;
    }
    auto gid = getNumber(block, TarHeader::gidOffset, TarHeader::gidSize, "gid", name,
                         headerOffset, outError);
    if (!gid) {
      return false;
    }
    auto size = getNumber(block, TarHeader::sizeOffset, TarHeader::sizeSize, "size", name,
                          headerOffset, outError);
    if (!size) {
      return false;
    }
    if (*size > std::numeric_limits<uint64_t>::max() - (TarHeader::blockSize - 1) ||
        (entry.kind != EntryKind::RegularFile && *size != 0)) {
      return fail(outError, ErrorKind::Format, name,
                  fmt::format("Invalid size {} for this entry type", *size),
                  headerOffset + TarHeader::sizeOffset);
    }
    auto mtime = getNumber(block, TarHeader::mtimeOffset, TarHeader::mtimeSize, "mtime", name,
                           headerOffset, outError);
    if (!mtime) {
      return false;
    }
    entry.mode = static_cast<uint32_t>(*mode & 07777);
    entry.uid = static_cast<uint32_t>(*uid);
    entry.gid = static_cast<uint32_t>(*gid);
    entry.mtime = *mtime;
    entry.size = entry.kind == EntryKind::RegularFile ? *size : 0;

    if (!validateEntryPath(entry, seen, outError)) {
      if (outError && !outError->offset) {
        outError->offset = headerOffset;
      }
      return false;
    }

    if (!sink.beginEntry(entry, outError)) {
      return false;
    }

    if (entry.kind == EntryKind::RegularFile) {
      uint64_t padded =
          (*size + TarHeader::blockSize - 1) / TarHeader::blockSize * TarHeader::blockSize;
      if (!reader.copyToSink(*size, sink, entry.path, outError) ||
          !reader.skip(padded - *size, "padding", entry.path, outError)) {
        return false;
      }
    }

    if (!sink.endEntry(outError)) {
      return false;
    }
  }

  return sink.finish(outError);
}

} // namespace packer

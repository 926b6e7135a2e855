#include <algorithm>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>

#include <packer/bag.hpp>
#include <packer/path.hpp>
#include <packer/stream.hpp>
#include <packer/varint.hpp>

namespace packer {

namespace {

bool writeVarint(std::ostream &out, uint64_t value, const std::string &path, Error *outError) {
  auto encoded = encodeVarint(value);
  return writeBytes(out, encoded.view(), path, outError);
}

bool writeString(std::ostream &out, const std::string &value, const std::string &path,
                 Error *outError) {
  if (!writeVarint(out, value.size(), path, outError)) {
    return false;
  }
  auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(value.data()),
                                        value.size());
  return writeBytes(out, bytes, path, outError);
}

// Length-prefixed string, rejecting lengths above maxPathLength before allocating
std::optional<std::string> readString(StreamReader &reader, uint64_t length,
                                      std::string_view what, const std::string &path,
                                      Error *outError) {
  if (length > maxPathLength) {
    fail(outError, ErrorKind::Format, path,
         fmt::format("{} length {} exceeds limit of {}", what, length, maxPathLength),
         reader.offset());
    return std::nullopt;
  }
  std::string value(static_cast<size_t>(length), '\0');
  auto bytes = std::span<uint8_t>(reinterpret_cast<uint8_t *>(value.data()), value.size());
  if (!reader.readExact(bytes, what, path, outError)) {
    return std::nullopt;
  }
  return value;
}

} // namespace

bool BagCodec::pack(EntrySource &source, std::ostream &out, Error *outError) const {
  // Global header
  if (!writeBytes(out, magic, "", outError) ||
      !writeBytes(out, std::span<const uint8_t>(&version, 1), "", outError)) {
    return false;
  }

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
    if (entry.path.size() > maxPathLength) {
      return fail(outError, ErrorKind::UnsupportedFeature, entry.path,
                  fmt::format("Path length {} exceeds limit of {}", entry.path.size(),
                              maxPathLength));
    }

    uint8_t tag = static_cast<uint8_t>(entry.kind);
    if (!writeString(out, entry.path, entry.path, outError) ||
        !writeBytes(out, std::span<const uint8_t>(&tag, 1), entry.path, outError) ||
        !writeVarint(out, entry.mode, entry.path, outError) ||
        !writeVarint(out, entry.mtime, entry.path, outError)) {
      return false;
    }

    switch (entry.kind) {
    case EntryKind::RegularFile:
      if (!writeVarint(out, entry.size, entry.path, outError)) {
        return false;
      }
      if (!source.copyPayload(entry, out, outError)) {
        return false;
      }
      break;
    case EntryKind::Symlink:
      if (entry.linkTarget.size() > maxPathLength) {
        return fail(outError, ErrorKind::UnsupportedFeature, entry.path,
                    fmt::format("Link target length {} exceeds limit of {}",
                                entry.linkTarget.size(), maxPathLength));
      }
      if (!writeString(out, entry.linkTarget, entry.path, outError)) {
        return false;
      }
      break;
    case EntryKind::Directory:
      break;
    }
  }

  // End record: zero path length, then the reserved tag
  const uint8_t endRecord[] = {0x00, endTag};
  if (!writeBytes(out, endRecord, "", outError)) {
    return false;
  }

  out.flush();
  if (!out) {
    return fail(outError, ErrorKind::IO, "", "Failed to flush archive stream");
  }
  return true;
}

bool BagCodec::unpack(std::istream &in, EntrySink &sink, Error *outError) const {
  StreamReader reader(in);

  // ReadMagic
  std::array<uint8_t, 5> header{};
  if (!reader.readExact(header, "bag header", "", outError)) {
    return false;
  }
  if (!std::equal(magic.begin(), magic.end(), header.begin())) {
    return fail(outError, ErrorKind::Format, "",
                fmt::format("Invalid bag magic (expected 'BAGF', got '{}')",
                            std::string(header.begin(), header.begin() + 4)),
                0);
  }
  if (header[4] != version) {
    return fail(outError, ErrorKind::Format, "",
                fmt::format("Unsupported bag version {}", header[4]), 4);
  }

  std::unordered_set<std::string> seen;
  while (true) {
    // ReadRecordOrEnd
    uint64_t recordOffset = reader.offset();
    auto pathLength = reader.readVarint("record", "", outError);
    if (!pathLength) {
      return false;
    }

    if (*pathLength == 0) {
      uint8_t tag = 0;
      if (!reader.readByte(tag, "end record", "", outError)) {
        return false;
      }
      if (tag != endTag) {
        return fail(outError, ErrorKind::Format, "",
                    fmt::format("Empty path in record with kind tag {}", tag), recordOffset);
      }
      break;
    }

    Entry entry;
    auto path = readString(reader, *pathLength, "path", "", outError);
    if (!path) {
      return false;
    }
    entry.path = std::move(*path);

    uint64_t tagOffset = reader.offset();
    uint8_t tag = 0;
    if (!reader.readByte(tag, "kind tag", entry.path, outError)) {
      return false;
    }
    switch (tag) {
    case static_cast<uint8_t>(EntryKind::RegularFile):
    case static_cast<uint8_t>(EntryKind::Directory):
    case static_cast<uint8_t>(EntryKind::Symlink):
      entry.kind = static_cast<EntryKind>(tag);
      break;
    default:
      return fail(outError, ErrorKind::Format, entry.path,
                  fmt::format("Unrecognized kind tag {}", tag), tagOffset);
    }

    uint64_t modeOffset = reader.offset();
    auto mode = reader.readVarint("mode", entry.path, outError);
    if (!mode) {
      return false;
    }
    if (*mode > std::numeric_limits<uint32_t>::max()) {
      return fail(outError, ErrorKind::Format, entry.path,
                  fmt::format("Mode {:#o} out of range", *mode), modeOffset);
    }
    entry.mode = static_cast<uint32_t>(*mode);

    auto mtime = reader.readVarint("mtime", entry.path, outError);
    if (!mtime) {
      return false;
    }
    entry.mtime = *mtime;

    if (entry.kind == EntryKind::RegularFile) {
      auto size = reader.readVarint("size", entry.path, outError);
      if (!size) {
        return false;
      }
      entry.size = *size;
    } else if (entry.kind == EntryKind::Symlink) {
      auto targetLength = reader.readVarint("link target", entry.path, outError);
      if (!targetLength) {
        return false;
      }
      auto target = readString(reader, *targetLength, "link target", entry.path, outError);
      if (!target) {
        return false;
      }
      entry.linkTarget = std::move(*target);
    }

    // Decoded paths get the same checks as on pack
    if (!validateEntryPath(entry, seen, outError)) {
      if (outError && !outError->offset) {
        outError->offset = recordOffset;
      }
      return false;
    }

    if (!sink.beginEntry(entry, outError)) {
      return false;
    }
    // ReadPayload
    if (entry.kind == EntryKind::RegularFile &&
        !reader.copyToSink(entry.size, sink, entry.path, outError)) {
      return false;
    }
    if (!sink.endEntry(outError)) {
      return false;
    }
  }

  return sink.finish(outError);
}

} // namespace packer

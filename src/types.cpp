#include <fmt/format.h>

#include <packer/types.hpp>

namespace packer {

std::string Error::describe() const {
  std::string result = fmt::format("{} error: ", errorKindName(kind));
  if (!path.empty()) {
    result += fmt::format("{}: ", path);
  }
  result += message;
  if (offset) {
    result += fmt::format(" (at offset {})", *offset);
  }
  return result;
}

bool fail(Error *outError, ErrorKind kind, std::string path, std::string message,
          std::optional<uint64_t> offset) {
  if (outError) {
    outError->kind = kind;
    outError->path = std::move(path);
    outError->message = std::move(message);
    outError->offset = offset;
  }
  return false;
}

std::string_view errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::IO:
    return "io";
  case ErrorKind::Format:
    return "format";
  case ErrorKind::PathSecurity:
    return "path security";
  case ErrorKind::UnsupportedFeature:
    return "unsupported feature";
  }
  return "unknown";
}

std::string_view entryKindName(EntryKind kind) {
  switch (kind) {
  case EntryKind::RegularFile:
    return "file";
  case EntryKind::Directory:
    return "dir";
  case EntryKind::Symlink:
    return "symlink";
  }
  return "unknown";
}

std::string_view formatName(Format format) {
  switch (format) {
  case Format::Bag:
    return "bag";
  case Format::Tar:
    return "tar";
  }
  return "unknown";
}

std::optional<Format> parseFormat(std::string_view name, Error *outError) {
  if (name == "bag") {
    return Format::Bag;
  }
  if (name == "tar") {
    return Format::Tar;
  }
  fail(outError, ErrorKind::UnsupportedFeature, "",
       fmt::format("Unknown archive format '{}' (expected 'bag' or 'tar')", name));
  return std::nullopt;
}

} // namespace packer

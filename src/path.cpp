#include <fmt/format.h>

#include <packer/path.hpp>

namespace packer {

std::optional<std::string> normalizeArchivePath(std::string_view path, Error *outError) {
  if (path.empty()) {
    fail(outError, ErrorKind::PathSecurity, "", "Empty archive path");
    return std::nullopt;
  }

  if (path.front() == '/') {
    fail(outError, ErrorKind::PathSecurity, std::string(path), "Absolute archive path");
    return std::nullopt;
  }

  if (path.find('\0') != std::string_view::npos) {
    fail(outError, ErrorKind::PathSecurity, std::string(path),
         "Archive path contains a NUL byte");
    return std::nullopt;
  }

  std::string result;
  result.reserve(path.size());

  size_t pos = 0;
  while (pos < path.size()) {
    size_t end = path.find('/', pos);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    std::string_view segment = path.substr(pos, end - pos);
    pos = end + 1;

    // Repeated or trailing slash
    if (segment.empty()) {
      continue;
    }

    if (segment == "." || segment == "..") {
      fail(outError, ErrorKind::PathSecurity, std::string(path),
           fmt::format("Archive path contains a '{}' segment", segment));
      return std::nullopt;
    }

    if (!result.empty()) {
      result += '/';
    }
    result += segment;
  }

  return result;
}

bool validateEntryPath(Entry &entry, std::unordered_set<std::string> &seen, Error *outError) {
  auto normalized = normalizeArchivePath(entry.path, outError);
  if (!normalized) {
    return false;
  }

  if (!seen.insert(*normalized).second) {
    return fail(outError, ErrorKind::Format, *normalized, "Duplicate path in archive");
  }

  entry.path = std::move(*normalized);
  return true;
}

} // namespace packer

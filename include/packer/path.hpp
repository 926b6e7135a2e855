#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "types.hpp"

namespace packer {

// Maximum accepted length of an archive path or link target
inline constexpr size_t maxPathLength = 4096;

// Normalize an archive path: collapse repeated and trailing slashes, reject
// empty and absolute paths, embedded NULs and any "." or ".." segment.
// Returns std::nullopt on failure with a PathSecurity error in outError.
std::optional<std::string> normalizeArchivePath(std::string_view path,
                                                Error *outError = nullptr);

// Normalize entry.path in place and check it against the paths already seen in
// the same archive. Duplicates fail with a Format error.
bool validateEntryPath(Entry &entry, std::unordered_set<std::string> &seen,
                       Error *outError = nullptr);

} // namespace packer

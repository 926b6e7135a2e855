#include <cerrno>
#include <cstring>
#include <iterator>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <packer/materializer.hpp>
#include <packer/path.hpp>

namespace fs = std::filesystem;

namespace packer {

TreeMaterializer::TreeMaterializer(fs::path root) : root_(std::move(root)) {}

std::optional<fs::path> TreeMaterializer::resolve(const Entry &entry, Error *outError) {
  auto normalized = normalizeArchivePath(entry.path, outError);
  if (!normalized) {
    return std::nullopt;
  }

  fs::path relative(*normalized);
  fs::path target = root_ / relative;

  // Lexical containment check on the joined path
  auto check = target.lexically_normal().lexically_relative(root_.lexically_normal());
  if (check.empty() || *check.begin() == "..") {
    fail(outError, ErrorKind::PathSecurity, entry.path, "Path escapes the destination root");
    return std::nullopt;
  }

  // Walk existing ancestors; none may be a symlink or a non-directory
  fs::path current = root_;
  for (auto it = relative.begin(); it != relative.end(); ++it) {
    if (std::next(it) == relative.end()) {
      break;
    }
    current /= *it;

    std::error_code ec;
    auto status = fs::symlink_status(current, ec);
    if (ec && status.type() != fs::file_type::not_found) {
      fail(outError, ErrorKind::IO, entry.path,
           fmt::format("Failed to stat {}: {}", current.string(), ec.message()));
      return std::nullopt;
    }
    if (status.type() == fs::file_type::not_found) {
      if (!fs::create_directory(current, ec) && ec) {
        fail(outError, ErrorKind::IO, entry.path,
             fmt::format("Failed to create directory {}: {}", current.string(), ec.message()));
        return std::nullopt;
      }
      continue;
    }
    if (fs::is_symlink(status)) {
      fail(outError, ErrorKind::PathSecurity, entry.path,
           fmt::format("Ancestor {} is a symlink", current.string()));
      return std::nullopt;
    }
    if (!fs::is_directory(status)) {
      fail(outError, ErrorKind::IO, entry.path,
           fmt::format("Ancestor {} is not a directory", current.string()));
      return std::nullopt;
    }
  }

  return target;
}

bool TreeMaterializer::beginEntry(const Entry &entry, Error *outError) {
  if (current_) {
    return fail(outError, ErrorKind::Format, entry.path, "Entry started before the previous ended");
  }

  auto target = resolve(entry, outError);
  if (!target) {
    return false;
  }

  bool ok = false;
  switch (entry.kind) {
  case EntryKind::Directory:
    ok = createDirectory(*target, entry, outError);
    break;
  case EntryKind::Symlink:
    ok = createSymlink(*target, entry, outError);
    break;
  case EntryKind::RegularFile:
    ok = openFile(*target, entry, outError);
    break;
  }
  if (!ok) {
    return false;
  }

  current_ = entry;
  filePath_ = *target;
  return true;
}

bool TreeMaterializer::createDirectory(const fs::path &target, const Entry &entry,
                                       Error *outError) {
  std::error_code ec;
  auto status = fs::symlink_status(target, ec);
  if (status.type() == fs::file_type::not_found) {
    if (!fs::create_directory(target, ec) && ec) {
      return fail(outError, ErrorKind::IO, entry.path,
                  fmt::format("Failed to create directory: {}", ec.message()));
    }
  } else if (ec) {
    return fail(outError, ErrorKind::IO, entry.path, fmt::format("Failed to stat: {}", ec.message()));
  } else if (!fs::is_directory(status)) {
    return fail(outError, ErrorKind::IO, entry.path,
                "A non-directory already exists at this path");
  }

  directories_.push_back({target, entry});
  return true;
}

bool TreeMaterializer::createSymlink(const fs::path &target, const Entry &entry,
                                     Error *outError) {
  std::error_code ec;
  auto status = fs::symlink_status(target, ec);
  if (status.type() != fs::file_type::not_found) {
    if (ec) {
      return fail(outError, ErrorKind::IO, entry.path,
                  fmt::format("Failed to stat: {}", ec.message()));
    }
    if (fs::is_directory(status)) {
      return fail(outError, ErrorKind::IO, entry.path, "A directory already exists at this path");
    }
    if (!fs::remove(target, ec)) {
      return fail(outError, ErrorKind::IO, entry.path,
                  fmt::format("Failed to replace existing file: {}", ec.message()));
    }
  }

  fs::create_symlink(entry.linkTarget, target, ec);
  if (ec) {
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to create symlink to '{}': {}", entry.linkTarget, ec.message()));
  }

  if (!applyOwner(target, entry, outError)) {
    return false;
  }

  // Link permissions are not meaningful on Linux; only the mtime is restored
  timespec times[2] = {};
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = static_cast<time_t>(entry.mtime);
  if (::utimensat(AT_FDCWD, target.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to set symlink mtime: {}", std::strerror(errno)));
  }
  return true;
}

bool TreeMaterializer::openFile(const fs::path &target, const Entry &entry, Error *outError) {
  std::error_code ec;
  auto status = fs::symlink_status(target, ec);
  if (status.type() != fs::file_type::not_found) {
    if (ec) {
      return fail(outError, ErrorKind::IO, entry.path,
                  fmt::format("Failed to stat: {}", ec.message()));
    }
    if (fs::is_directory(status)) {
      return fail(outError, ErrorKind::IO, entry.path, "A directory already exists at this path");
    }
    // Replace rather than truncate, so a link or read-only file is never written through
    if (!fs::remove(target, ec)) {
      return fail(outError, ErrorKind::IO, entry.path,
                  fmt::format("Failed to replace existing file: {}", ec.message()));
    }
  }

  file_.open(target, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file_) {
    file_ = std::ofstream();
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to create output file: {}", target.string()));
  }
  return true;
}

bool TreeMaterializer::writePayload(std::span<const uint8_t> data, Error *outError) {
  if (!current_ || current_->kind != EntryKind::RegularFile || !file_.is_open()) {
    return fail(outError, ErrorKind::Format, current_ ? current_->path : "",
                "Payload received for an entry that is not a regular file");
  }

  file_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file_) {
    return fail(outError, ErrorKind::IO, current_->path,
                fmt::format("Failed to write to output file: {}", filePath_.string()));
  }
  return true;
}

bool TreeMaterializer::endEntry(Error *outError) {
  if (!current_) {
    return fail(outError, ErrorKind::Format, "", "Entry ended before it started");
  }
  Entry entry = std::move(*current_);
  current_.reset();

  if (entry.kind != EntryKind::RegularFile) {
    return true;
  }

  file_.close();
  if (!file_) {
    file_ = std::ofstream();
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to close output file: {}", filePath_.string()));
  }

  // Metadata only after the data is on disk
  return applyMetadata(filePath_, entry, outError);
}

bool TreeMaterializer::finish(Error *outError) {
  // Directories arrive parent first, so reverse order handles children first
  for (auto it = directories_.rbegin(); it != directories_.rend(); ++it) {
    if (!applyMetadata(it->path, it->entry, outError)) {
      return false;
    }
  }
  directories_.clear();
  return true;
}

bool TreeMaterializer::applyOwner(const fs::path &target, const Entry &entry,
                                  Error *outError) const {
  if (!restoreOwnership_) {
    return true;
  }
  if (::lchown(target.c_str(), static_cast<uid_t>(entry.uid), static_cast<gid_t>(entry.gid)) !=
      0) {
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to set owner {}:{}: {}", entry.uid, entry.gid,
                            std::strerror(errno)));
  }
  return true;
}

bool TreeMaterializer::applyMetadata(const fs::path &target, const Entry &entry,
                                     Error *outError) const {
  // chown may clear setuid/setgid bits, so it runs before the mode is set
  if (!applyOwner(target, entry, outError)) {
    return false;
  }

  std::error_code ec;
  fs::permissions(target, static_cast<fs::perms>(entry.mode & 07777), ec);
  if (ec) {
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to set mode {:o}: {}", entry.mode & 07777, ec.message()));
  }

  timespec times[2] = {};
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = static_cast<time_t>(entry.mtime);
  if (::utimensat(AT_FDCWD, target.c_str(), times, 0) != 0) {
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Failed to set mtime: {}", std::strerror(errno)));
  }
  return true;
}

} // namespace packer

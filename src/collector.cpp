#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

#include <fmt/format.h>

#include <packer/collector.hpp>
#include <packer/stream.hpp>

namespace fs = std::filesystem;

namespace packer {

TreeCollector::TreeCollector(std::vector<fs::path> inputs, CollectOptions options)
    : inputs_(std::move(inputs)), options_(std::move(options)) {}

std::string TreeCollector::archiveName(const fs::path &input, const fs::path &baseDir) {
  if (input.is_relative()) {
    fs::path normal = input.lexically_normal();
    std::string name = normal.generic_string();
    while (!name.empty() && name.back() == '/') {
      name.pop_back();
    }
    if (!name.empty() && name != "." && *normal.begin() != "..") {
      return name;
    }
  }

  // Absolute inputs, "." and paths climbing out of the base keep only their final name
  fs::path resolved = input.is_relative() && !baseDir.empty() ? baseDir / input : input;
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(resolved, ec);
  fs::path normal = (ec ? resolved : canonical).lexically_normal();
  if (!normal.has_filename()) {
    normal = normal.parent_path();
  }
  return normal.filename().string();
}

bool TreeCollector::prepareInputs(Error *outError) {
  prepared_ = true;

  for (const auto &path : options_.exclude) {
    struct stat st {};
    // Paths that do not exist exclude nothing
    if (::lstat(path.c_str(), &st) == 0) {
      excluded_.insert({static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)});
    }
  }

  // Inputs are pushed last first so that the first input is on top
  for (auto it = inputs_.rbegin(); it != inputs_.rend(); ++it) {
    const fs::path &input = *it;
    std::string name = archiveName(input, options_.baseDir);
    if (name.empty()) {
      return fail(outError, ErrorKind::PathSecurity, input.string(),
                  "Input has no usable archive name");
    }

    fs::path source = input.is_relative() && !options_.baseDir.empty() ? options_.baseDir / input
                                                                        : input;
    stack_.push_back({source, name, true});

    // Directory entries for the parents of a nested relative input, outermost on top
    if (input.is_relative()) {
      size_t slash = name.rfind('/');
      while (slash != std::string::npos) {
        std::string prefix = name.substr(0, slash);
        fs::path prefixSource = options_.baseDir.empty() ? fs::path(prefix)
                                                         : options_.baseDir / prefix;
        stack_.push_back({prefixSource, prefix, false});
        slash = prefix.rfind('/');
      }
    }
  }
  return true;
}

bool TreeCollector::next(std::optional<Entry> &out, Error *outError) {
  if (!prepared_ && !prepareInputs(outError)) {
    return false;
  }

  while (!stack_.empty()) {
    Pending pending = std::move(stack_.back());
    stack_.pop_back();

    bool skipped = false;
    if (!visit(pending, out, skipped, outError)) {
      return false;
    }
    if (!skipped) {
      return true;
    }
  }

  if (file_.is_open()) {
    file_.close();
  }
  out.reset();
  return true;
}

bool TreeCollector::unreadable(Error error, bool &skipped, Error *outError) {
  if (options_.skipUnreadable) {
    if (options_.onSkipped) {
      options_.onSkipped(error);
    }
    skipped = true;
    return true;
  }
  if (outError) {
    *outError = std::move(error);
  }
  return false;
}

bool TreeCollector::visit(const Pending &pending, std::optional<Entry> &out, bool &skipped,
                          Error *outError) {
  if (file_.is_open()) {
    file_.close();
  }
  file_.clear();

  const std::string sourceName = pending.source.string();

  struct stat st {};
  if (::lstat(pending.source.c_str(), &st) != 0) {
    return unreadable({ErrorKind::IO, sourceName,
                       fmt::format("Failed to stat: {}", std::strerror(errno))},
                      skipped, outError);
  }

  Identity identity{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
  if (excluded_.contains(identity)) {
    skipped = true;
    return true;
  }

  // A nested input reached through a symlink could not be unpacked safely
  if (!pending.recurse && !S_ISDIR(st.st_mode)) {
    return fail(outError, ErrorKind::PathSecurity, sourceName,
                "Parent of a nested input is not a real directory");
  }

  if (emitted_.contains(pending.archivePath)) {
    // Parent directory already emitted by an earlier input
    if (!pending.recurse) {
      skipped = true;
      return true;
    }
    return fail(outError, ErrorKind::Format, pending.archivePath, "Duplicate path in archive");
  }

  Entry entry;
  entry.path = pending.archivePath;
  entry.mode = static_cast<uint32_t>(st.st_mode & 07777);
  entry.mtime = st.st_mtime < 0 ? 0 : static_cast<uint64_t>(st.st_mtime);
  entry.uid = static_cast<uint32_t>(st.st_uid);
  entry.gid = static_cast<uint32_t>(st.st_gid);

  if (S_ISREG(st.st_mode)) {
    entry.kind = EntryKind::RegularFile;
    entry.size = static_cast<uint64_t>(st.st_size);

    // Open now so an unreadable file fails before any of its bytes are written
    file_.open(pending.source, std::ios::binary);
    if (!file_) {
      file_.clear();
      return unreadable({ErrorKind::IO, sourceName,
                         fmt::format("Failed to open: {}", std::strerror(errno))},
                        skipped, outError);
    }
    currentSource_ = pending.source;
  } else if (S_ISDIR(st.st_mode)) {
    entry.kind = EntryKind::Directory;
    if (pending.recurse) {
      if (!visited_.insert(identity).second) {
        return fail(outError, ErrorKind::Format, sourceName,
                    "Directory already visited (cycle or repeated input)");
      }
      bool listingSkipped = false;
      if (!pushChildren(pending, listingSkipped, outError)) {
        return false;
      }
    }
  } else if (S_ISLNK(st.st_mode)) {
    entry.kind = EntryKind::Symlink;
    std::error_code ec;
    fs::path target = fs::read_symlink(pending.source, ec);
    if (ec) {
      return unreadable({ErrorKind::IO, sourceName,
                         fmt::format("Failed to read symlink: {}", ec.message())},
                        skipped, outError);
    }
    entry.linkTarget = target.string();
  } else {
    return fail(outError, ErrorKind::UnsupportedFeature, sourceName,
                "Only regular files, directories and symlinks can be archived");
  }

  emitted_.insert(entry.path);
  out = std::move(entry);
  return true;
}

bool TreeCollector::pushChildren(const Pending &pending, bool &skipped, Error *outError) {
  std::vector<std::string> names;

  std::error_code ec;
  fs::directory_iterator it(pending.source, ec);
  if (ec) {
    return unreadable({ErrorKind::IO, pending.source.string(),
                       fmt::format("Failed to list directory: {}", ec.message())},
                      skipped, outError);
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  if (ec) {
    return unreadable({ErrorKind::IO, pending.source.string(),
                       fmt::format("Failed to list directory: {}", ec.message())},
                      skipped, outError);
  }

  std::sort(names.begin(), names.end());

  // Reverse order so the smallest name is popped first
  for (auto name = names.rbegin(); name != names.rend(); ++name) {
    stack_.push_back({pending.source / *name, pending.archivePath + "/" + *name, true});
  }
  return true;
}

bool TreeCollector::copyPayload(const Entry &entry, std::ostream &out, Error *outError) {
  if (!file_.is_open()) {
    return fail(outError, ErrorKind::IO, entry.path, "No open file for payload");
  }

  std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(entry.size, copyBufferSize)));
  uint64_t remaining = entry.size;
  while (remaining > 0) {
    size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    file_.read(buffer.data(), static_cast<std::streamsize>(chunk));
    auto count = static_cast<size_t>(file_.gcount());
    if (count != chunk) {
      file_.close();
      return fail(outError, ErrorKind::IO, currentSource_.string(),
                  fmt::format("File shrank while packing ({} bytes missing)",
                              remaining - count));
    }
    out.write(buffer.data(), static_cast<std::streamsize>(count));
    if (!out) {
      file_.close();
      return fail(outError, ErrorKind::IO, entry.path, "Failed to write archive stream");
    }
    remaining -= count;
  }

  file_.close();
  return true;
}

} // namespace packer

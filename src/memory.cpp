#include <algorithm>

#include <fmt/format.h>

#include <packer/memory.hpp>
#include <packer/path.hpp>

namespace packer {

bool MemorySource::add(Entry entry, std::span<const uint8_t> data, Error *outError) {
  if (entry.kind != EntryKind::RegularFile && !data.empty()) {
    return fail(outError, ErrorKind::Format, entry.path,
                fmt::format("Payload given for a {} entry", entryKindName(entry.kind)));
  }

  if (!validateEntryPath(entry, paths_, outError)) {
    return false;
  }

  MemoryEntry pending;
  if (entry.kind == EntryKind::RegularFile) {
    entry.size = data.size();
    pending.data.assign(data.begin(), data.end());
  } else {
    entry.size = 0;
  }
  if (entry.kind != EntryKind::Symlink) {
    entry.linkTarget.clear();
  }
  pending.entry = std::move(entry);
  entries_.push_back(std::move(pending));

  return true;
}

bool MemorySource::addFile(const std::string &path, std::span<const uint8_t> data, uint32_t mode,
                           Error *outError) {
  Entry entry;
  entry.path = path;
  entry.kind = EntryKind::RegularFile;
  entry.mode = mode;
  return add(std::move(entry), data, outError);
}

bool MemorySource::addDirectory(const std::string &path, uint32_t mode, Error *outError) {
  Entry entry;
  entry.path = path;
  entry.kind = EntryKind::Directory;
  entry.mode = mode;
  return add(std::move(entry), {}, outError);
}

bool MemorySource::addSymlink(const std::string &path, const std::string &target,
                              Error *outError) {
  Entry entry;
  entry.path = path;
  entry.kind = EntryKind::Symlink;
  entry.mode = 0777;
  entry.linkTarget = target;
  return add(std::move(entry), {}, outError);
}

bool MemorySource::next(std::optional<Entry> &out, Error *) {
  if (position_ >= entries_.size()) {
    out.reset();
    return true;
  }
  out = entries_[position_++].entry;
  return true;
}

bool MemorySource::copyPayload(const Entry &entry, std::ostream &out, Error *outError) {
  if (position_ == 0) {
    return fail(outError, ErrorKind::IO, entry.path, "No current entry");
  }

  const auto &current = entries_[position_ - 1];
  if (current.data.size() != entry.size) {
    return fail(outError, ErrorKind::IO, entry.path,
                fmt::format("Payload size mismatch (expected {}, have {})", entry.size,
                            current.data.size()));
  }

  out.write(reinterpret_cast<const char *>(current.data.data()),
            static_cast<std::streamsize>(current.data.size()));
  if (!out) {
    return fail(outError, ErrorKind::IO, entry.path, "Failed to write payload");
  }
  return true;
}

bool MemorySink::beginEntry(const Entry &entry, Error *) {
  MemoryEntry recorded;
  recorded.entry = entry;
  entries_.push_back(std::move(recorded));
  return true;
}

bool MemorySink::writePayload(std::span<const uint8_t> data, Error *outError) {
  if (entries_.empty()) {
    return fail(outError, ErrorKind::Format, "", "Payload received before any entry");
  }
  if (keepPayload_) {
    auto &current = entries_.back().data;
    current.insert(current.end(), data.begin(), data.end());
  }
  return true;
}

bool MemorySink::endEntry(Error *) {
  return true;
}

bool MemorySink::finish(Error *) {
  finished_ = true;
  return true;
}

const MemoryEntry *MemorySink::find(const std::string &path) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const MemoryEntry &item) { return item.entry.path == path; });
  if (it == entries_.end()) {
    return nullptr;
  }
  return &*it;
}

} // namespace packer

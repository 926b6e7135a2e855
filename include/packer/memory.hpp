#pragma once

#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "source.hpp"
#include "types.hpp"

namespace packer {

struct MemoryEntry {
  Entry entry;
  std::vector<uint8_t> data; // Payload, RegularFile only
};

// Entry source backed by memory, for building archives without touching disk
class MemorySource : public EntrySource {
public:
  MemorySource() = default;

  // Add an entry. The path is normalized; traversal attempts fail with a
  // PathSecurity error, duplicates with a Format error.
  // For regular files entry.size is set from data.
  bool add(Entry entry, std::span<const uint8_t> data = {}, Error *outError = nullptr);

  // Convenience helpers
  bool addFile(const std::string &path, std::span<const uint8_t> data, uint32_t mode = 0644,
               Error *outError = nullptr);
  bool addDirectory(const std::string &path, uint32_t mode = 0755, Error *outError = nullptr);
  bool addSymlink(const std::string &path, const std::string &target,
                  Error *outError = nullptr);

  bool next(std::optional<Entry> &out, Error *outError = nullptr) override;
  bool copyPayload(const Entry &entry, std::ostream &out, Error *outError = nullptr) override;

  // Restart the sequence from the first entry
  void rewind() { position_ = 0; }

  const std::vector<MemoryEntry> &entries() const { return entries_; }

private:
  std::vector<MemoryEntry> entries_;
  std::unordered_set<std::string> paths_;
  size_t position_ = 0;
};

// Entry sink that records decoded entries in memory
class MemorySink : public EntrySink {
public:
  // When keepPayload is false only the entries are recorded
  explicit MemorySink(bool keepPayload = true) : keepPayload_(keepPayload) {}

  bool beginEntry(const Entry &entry, Error *outError = nullptr) override;
  bool writePayload(std::span<const uint8_t> data, Error *outError = nullptr) override;
  bool endEntry(Error *outError = nullptr) override;
  bool finish(Error *outError = nullptr) override;

  const std::vector<MemoryEntry> &entries() const { return entries_; }

  // Lookup by normalized archive path, nullptr if absent
  const MemoryEntry *find(const std::string &path) const;

  // True once finish() has been called
  bool finished() const { return finished_; }

private:
  std::vector<MemoryEntry> entries_;
  bool keepPayload_ = true;
  bool finished_ = false;
};

} // namespace packer

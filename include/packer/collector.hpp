#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "source.hpp"
#include "types.hpp"

namespace packer {

struct CollectOptions {
  // Relative inputs are resolved against this directory (current directory when empty)
  std::filesystem::path baseDir;

  // Skip nodes that cannot be stat'ed, listed or opened instead of failing
  bool skipUnreadable = false;

  // Called for every node skipped because of skipUnreadable
  std::function<void(const Error &)> onSkipped;

  // Files never collected, matched by device and inode (e.g. the archive being written)
  std::vector<std::filesystem::path> exclude;
};

// Walks input paths and produces entries lazily, in archive order:
// each directory before its contents, children sorted by name, symlinks
// recorded but never followed.
class TreeCollector : public EntrySource {
public:
  explicit TreeCollector(std::vector<std::filesystem::path> inputs, CollectOptions options = {});
  ~TreeCollector() override = default;

  TreeCollector(const TreeCollector &) = delete;
  TreeCollector &operator=(const TreeCollector &) = delete;

  bool next(std::optional<Entry> &out, Error *outError = nullptr) override;
  bool copyPayload(const Entry &entry, std::ostream &out, Error *outError = nullptr) override;

  // Archive name used for an input path
  static std::string archiveName(const std::filesystem::path &input,
                                 const std::filesystem::path &baseDir = {});

private:
  // Device and inode of a filesystem object
  using Identity = std::pair<uint64_t, uint64_t>;

  struct Pending {
    std::filesystem::path source; // Filesystem path to stat
    std::string archivePath;      // Path stored in the archive
    bool recurse = true;          // False for parent directories of a nested input
  };

  bool prepareInputs(Error *outError);

  // Build the entry for one pending node. Returns false on failure; sets
  // skipped when the node was dropped under skipUnreadable.
  bool visit(const Pending &pending, std::optional<Entry> &out, bool &skipped, Error *outError);

  // Report an unreadable node: fail, or skip it when the options allow
  bool unreadable(Error error, bool &skipped, Error *outError);

  bool pushChildren(const Pending &pending, bool &skipped, Error *outError);

  std::vector<std::filesystem::path> inputs_;
  CollectOptions options_;
  bool prepared_ = false;

  std::vector<Pending> stack_; // Next node on top
  std::set<Identity> visited_; // Directories entered so far
  std::set<Identity> excluded_;
  std::unordered_set<std::string> emitted_;

  std::ifstream file_;                   // Payload of the last regular file
  std::filesystem::path currentSource_;
};

} // namespace packer

#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

#include "source.hpp"
#include "types.hpp"

namespace packer {

// Recreates decoded entries below a destination root.
// Writes never pass through a symlink: an entry whose existing ancestor below
// the root is a symlink fails with a PathSecurity error.
class TreeMaterializer : public EntrySink {
public:
  // root must be an existing directory
  explicit TreeMaterializer(std::filesystem::path root);
  ~TreeMaterializer() override = default;

  TreeMaterializer(const TreeMaterializer &) = delete;
  TreeMaterializer &operator=(const TreeMaterializer &) = delete;

  bool beginEntry(const Entry &entry, Error *outError = nullptr) override;
  bool writePayload(std::span<const uint8_t> data, Error *outError = nullptr) override;
  bool endEntry(Error *outError = nullptr) override;

  // Apply directory modes and mtimes, deepest first
  bool finish(Error *outError = nullptr) override;

  const std::filesystem::path &root() const { return root_; }

  // Also restore entry uid/gid with lchown. Off by default; other owners need privileges.
  void setRestoreOwnership(bool restore) { restoreOwnership_ = restore; }

private:
  // Resolve entry.path below root_, rejecting traversal and symlinked ancestors.
  // Missing ancestors are created.
  std::optional<std::filesystem::path> resolve(const Entry &entry, Error *outError);

  bool createDirectory(const std::filesystem::path &target, const Entry &entry, Error *outError);
  bool createSymlink(const std::filesystem::path &target, const Entry &entry, Error *outError);
  bool openFile(const std::filesystem::path &target, const Entry &entry, Error *outError);

  bool applyOwner(const std::filesystem::path &target, const Entry &entry,
                  Error *outError) const;
  bool applyMetadata(const std::filesystem::path &target, const Entry &entry,
                     Error *outError) const;

  struct PendingDirectory {
    std::filesystem::path path;
    Entry entry;
  };

  std::filesystem::path root_;
  std::ofstream file_;
  std::filesystem::path filePath_;
  std::optional<Entry> current_;
  std::vector<PendingDirectory> directories_;
  bool restoreOwnership_ = false;
};

} // namespace packer

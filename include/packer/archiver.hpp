#pragma once

#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include "collector.hpp"
#include "source.hpp"
#include "types.hpp"

namespace packer {

// Forward declarations
class Codec;

// Drives packing and unpacking with the codec of one archive format
class Archiver {
public:
  // Called once per entry packed or unpacked, e.g. for progress output
  using EntryCallback = std::function<void(const Entry &)>;

  explicit Archiver(Format format = Format::Bag);
  ~Archiver();

  // Delete copy, enable move. A moved-from Archiver keeps its format, but
  // pack, unpack and list fail with an IO error until it is assigned again.
  Archiver(const Archiver &) = delete;
  Archiver &operator=(const Archiver &) = delete;
  Archiver(Archiver &&) noexcept;
  Archiver &operator=(Archiver &&) noexcept;

  // Archiver for a format name ("bag" or "tar")
  // Returns std::nullopt for unknown names, before any I/O happens
  static std::optional<Archiver> forFormat(std::string_view formatName,
                                           Error *outError = nullptr);

  Format format() const;

  void setEntryCallback(EntryCallback callback) { onEntry_ = std::move(callback); }

  // Restore owner ids when unpacking into a directory. Only the tar format
  // stores them; bag archives always unpack owned by the current user.
  void setRestoreOwnership(bool restore) { restoreOwnership_ = restore; }

  // Pack files and directories into a new archive file. The archive itself is
  // never collected, and a partially written archive is removed on failure.
  // Returns true on success, false on failure (error in outError if provided)
  bool pack(const std::vector<std::filesystem::path> &inputs,
            const std::filesystem::path &archivePath, const CollectOptions &options = {},
            Error *outError = nullptr) const;

  // Pack any entry sequence into a stream
  bool pack(EntrySource &source, std::ostream &out, Error *outError = nullptr) const;

  // Unpack an archive file into an existing destination directory
  // Returns true on success, false on failure (error in outError if provided)
  bool unpack(const std::filesystem::path &archivePath, const std::filesystem::path &destRoot,
              Error *outError = nullptr) const;

  // Unpack an archive stream into an existing destination directory
  bool unpack(std::istream &in, const std::filesystem::path &destRoot,
              Error *outError = nullptr) const;

  // Decode an archive stream into any sink
  bool unpack(std::istream &in, EntrySink &sink, Error *outError = nullptr) const;

  // Decode the entries of an archive file without writing anything
  std::optional<std::vector<Entry>> list(const std::filesystem::path &archivePath,
                                         Error *outError = nullptr) const;

private:
  std::unique_ptr<Codec> codec_;
  Format format_;
  EntryCallback onEntry_;
  bool restoreOwnership_ = false;
};

} // namespace packer

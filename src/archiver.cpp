#include <fstream>

#include <fmt/format.h>

#include <packer/archiver.hpp>
#include <packer/bag.hpp>
#include <packer/codec.hpp>
#include <packer/materializer.hpp>
#include <packer/memory.hpp>
#include <packer/tar.hpp>

namespace fs = std::filesystem;

namespace packer {

namespace {

// Reports every entry handed out by the wrapped source
class ObservedSource : public EntrySource {
public:
  ObservedSource(EntrySource &source, const Archiver::EntryCallback &callback)
      : source_(source), callback_(callback) {}

  bool next(std::optional<Entry> &out, Error *outError) override {
    if (!source_.next(out, outError)) {
      return false;
    }
    if (out) {
      callback_(*out);
    }
    return true;
  }

  bool copyPayload(const Entry &entry, std::ostream &out, Error *outError) override {
    return source_.copyPayload(entry, out, outError);
  }

private:
  EntrySource &source_;
  const Archiver::EntryCallback &callback_;
};

// Reports every entry accepted by the wrapped sink
class ObservedSink : public EntrySink {
public:
  ObservedSink(EntrySink &sink, const Archiver::EntryCallback &callback)
      : sink_(sink), callback_(callback) {}

  bool beginEntry(const Entry &entry, Error *outError) override {
    if (!sink_.beginEntry(entry, outError)) {
      return false;
    }
    callback_(entry);
    return true;
  }

  bool writePayload(std::span<const uint8_t> data, Error *outError) override {
    return sink_.writePayload(data, outError);
  }

  bool endEntry(Error *outError) override { return sink_.endEntry(outError); }

  bool finish(Error *outError) override { return sink_.finish(outError); }

private:
  EntrySink &sink_;
  const Archiver::EntryCallback &callback_;
};

} // namespace

std::unique_ptr<Codec> makeCodec(Format format) {
  switch (format) {
  case Format::Bag:
    return std::make_unique<BagCodec>();
  case Format::Tar:
    return std::make_unique<TarCodec>();
  }
  return nullptr;
}

Archiver::Archiver(Format format) : codec_(makeCodec(format)), format_(format) {}

Archiver::~Archiver() = default;

Archiver::Archiver(Archiver &&) noexcept = default;

Archiver &Archiver::operator=(Archiver &&) noexcept = default;

std::optional<Archiver> Archiver::forFormat(std::string_view formatName, Error *outError) {
  auto format = parseFormat(formatName, outError);
  if (!format) {
    return std::nullopt;
  }
  return Archiver(*format);
}

Format Archiver::format() const {
  return format_;
}

bool Archiver::pack(const std::vector<fs::path> &inputs, const fs::path &archivePath,
                    const CollectOptions &options, Error *outError) const {
  if (!codec_) {
    return fail(outError, ErrorKind::IO, archivePath.string(), "Archiver has been moved from");
  }
  if (inputs.empty()) {
    return fail(outError, ErrorKind::IO, archivePath.string(), "No input paths given");
  }

  std::ofstream out(archivePath, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out) {
    return fail(outError, ErrorKind::IO, archivePath.string(),
                "Failed to create archive file");
  }

  CollectOptions collectOptions = options;
  collectOptions.exclude.push_back(archivePath);
  TreeCollector collector(inputs, std::move(collectOptions));

  bool ok = pack(collector, out, outError);
  out.close();
  if (ok && !out) {
    ok = fail(outError, ErrorKind::IO, archivePath.string(), "Failed to close archive file");
  }

  if (!ok) {
    // The pack error is the one reported; a leftover file is only removed if possible
    std::error_code removeError;
    fs::remove(archivePath, removeError);
  }
  return ok;
}

bool Archiver::pack(EntrySource &source, std::ostream &out, Error *outError) const {
  if (!codec_) {
    return fail(outError, ErrorKind::IO, "", "Archiver has been moved from");
  }
  if (!onEntry_) {
    return codec_->pack(source, out, outError);
  }
  ObservedSource observed(source, onEntry_);
  return codec_->pack(observed, out, outError);
}

bool Archiver::unpack(const fs::path &archivePath, const fs::path &destRoot,
                      Error *outError) const {
  std::ifstream in(archivePath, std::ios::binary);
  if (!in) {
    return fail(outError, ErrorKind::IO, archivePath.string(), "Failed to open archive file");
  }
  return unpack(in, destRoot, outError);
}

bool Archiver::unpack(std::istream &in, const fs::path &destRoot, Error *outError) const {
  std::error_code ec;
  if (!fs::is_directory(destRoot, ec)) {
    return fail(outError, ErrorKind::IO, destRoot.string(),
                "Destination is not an existing directory");
  }

  TreeMaterializer materializer(destRoot);
  materializer.setRestoreOwnership(restoreOwnership_ && format_ == Format::Tar);
  return unpack(in, materializer, outError);
}

bool Archiver::unpack(std::istream &in, EntrySink &sink, Error *outError) const {
  if (!codec_) {
    return fail(outError, ErrorKind::IO, "", "Archiver has been moved from");
  }
  if (!onEntry_) {
    return codec_->unpack(in, sink, outError);
  }
  ObservedSink observed(sink, onEntry_);
  return codec_->unpack(in, observed, outError);
}

std::optional<std::vector<Entry>> Archiver::list(const fs::path &archivePath,
                                                 Error *outError) const {
  if (!codec_) {
    fail(outError, ErrorKind::IO, archivePath.string(), "Archiver has been moved from");
    return std::nullopt;
  }

  std::ifstream in(archivePath, std::ios::binary);
  if (!in) {
    fail(outError, ErrorKind::IO, archivePath.string(), "Failed to open archive file");
    return std::nullopt;
  }

  MemorySink sink(false);
  if (!codec_->unpack(in, sink, outError)) {
    return std::nullopt;
  }

  std::vector<Entry> entries;
  entries.reserve(sink.entries().size());
  for (const auto &item : sink.entries()) {
    entries.push_back(item.entry);
  }
  return entries;
}

} // namespace packer

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <packer/packer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using packer::ErrorKind;
using packer::Format;

namespace {

// Entry source that hands out entries as given, without validation
class RawSource : public packer::EntrySource {
public:
  explicit RawSource(std::vector<packer::Entry> entries) : entries_(std::move(entries)) {}

  bool next(std::optional<packer::Entry> &out, packer::Error *) override {
    if (position_ >= entries_.size()) {
      out.reset();
      return true;
    }
    out = entries_[position_++];
    return true;
  }

  bool copyPayload(const packer::Entry &entry, std::ostream &out, packer::Error *) override {
    out << std::string(entry.size, 'x');
    return true;
  }

private:
  std::vector<packer::Entry> entries_;
  size_t position_ = 0;
};

} // namespace

class ArchiverTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "packer_test_archiver";
    fs::remove_all(tempDir_);
    srcDir_ = tempDir_ / "src";
    destDir_ = tempDir_ / "dest";
    fs::create_directories(srcDir_);
    fs::create_directories(destDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  // Create a test file with specified content below srcDir_
  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path filePath = srcDir_ / name;
    fs::create_directories(filePath.parent_path());
    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), content.size());
    return filePath;
  }

  static void setMtime(const fs::path &path, time_t seconds) {
    timespec times[2] = {};
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = seconds;
    ASSERT_EQ(::utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW), 0);
  }

  static std::string readFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
  }

  static struct stat statOf(const fs::path &path) {
    struct stat st {};
    EXPECT_EQ(::lstat(path.c_str(), &st), 0) << path;
    return st;
  }

  fs::path tempDir_;
  fs::path srcDir_;
  fs::path destDir_;
};

TEST_F(ArchiverTest, PacksRelativeInputsIntoBag) {
  createTestFile("a.txt", "hi");
  createTestFile("dir/b.txt", "");

  packer::Archiver archiver(Format::Bag);
  packer::CollectOptions options;
  options.baseDir = srcDir_;

  fs::path archivePath = tempDir_ / "out.bag";
  packer::Error error;
  ASSERT_TRUE(archiver.pack({"a.txt", "dir/b.txt"}, archivePath, options, &error))
      << error.describe();
  ASSERT_TRUE(archiver.unpack(archivePath, destDir_, &error)) << error.describe();

  EXPECT_TRUE(fs::is_directory(destDir_ / "dir"));
  EXPECT_TRUE(fs::is_regular_file(destDir_ / "dir/b.txt"));
  EXPECT_EQ(fs::file_size(destDir_ / "dir/b.txt"), 0);
  EXPECT_EQ(readFile(destDir_ / "a.txt"), "hi");
}

TEST_F(ArchiverTest, RoundTripPreservesTreeInBothFormats) {
  fs::path project = srcDir_ / "project";
  fs::path config = createTestFile("project/config.ini", "[core]\nname=packer\n");
  fs::path script = createTestFile("project/bin/run.sh", "#!/bin/sh\necho run\n");
  std::string big(300000, '\0');
  for (size_t i = 0; i < big.size(); ++i) {
    big[i] = static_cast<char>(i % 251);
  }
  createTestFile("project/data/blob.bin", big);
  fs::create_directories(project / "empty");
  fs::create_symlink("../config.ini", project / "bin/config");

  fs::permissions(config, static_cast<fs::perms>(0640));
  fs::permissions(script, static_cast<fs::perms>(0755));
  fs::permissions(project / "data", static_cast<fs::perms>(0700));
  setMtime(config, 1600000000);
  setMtime(project / "bin/config", 1500000000);
  setMtime(project / "empty", 1400000000);

  for (Format format : {Format::Bag, Format::Tar}) {
    SCOPED_TRACE(std::string(packer::formatName(format)));
    fs::path dest = destDir_ / std::string(packer::formatName(format));
    fs::create_directories(dest);
    fs::path archivePath = tempDir_ / ("project." + std::string(packer::formatName(format)));

    packer::Archiver archiver(format);
    packer::Error error;
    ASSERT_TRUE(archiver.pack({project}, archivePath, {}, &error)) << error.describe();
    ASSERT_TRUE(archiver.unpack(archivePath, dest, &error)) << error.describe();

    fs::path out = dest / "project";
    EXPECT_EQ(readFile(out / "config.ini"), "[core]\nname=packer\n");
    EXPECT_EQ(readFile(out / "bin/run.sh"), "#!/bin/sh\necho run\n");
    EXPECT_EQ(readFile(out / "data/blob.bin"), big);
    EXPECT_TRUE(fs::is_directory(out / "empty"));
    EXPECT_TRUE(fs::is_symlink(out / "bin/config"));
    EXPECT_EQ(fs::read_symlink(out / "bin/config").string(), "../config.ini");

    EXPECT_EQ(statOf(out / "config.ini").st_mode & 07777, 0640u);
    EXPECT_EQ(statOf(out / "bin/run.sh").st_mode & 07777, 0755u);
    EXPECT_EQ(statOf(out / "data").st_mode & 07777, 0700u);
    EXPECT_EQ(statOf(out / "config.ini").st_mtime, 1600000000);
    EXPECT_EQ(statOf(out / "bin/config").st_mtime, 1500000000);
    EXPECT_EQ(statOf(out / "empty").st_mtime, 1400000000);
  }
}

TEST_F(ArchiverTest, ListReportsEntriesInArchiveOrder) {
  createTestFile("tree/b.txt", "bb");
  createTestFile("tree/a/inner.txt", "inner");

  packer::Archiver archiver(Format::Tar);
  fs::path archivePath = tempDir_ / "tree.tar";
  packer::Error error;
  ASSERT_TRUE(archiver.pack({srcDir_ / "tree"}, archivePath, {}, &error)) << error.describe();

  auto entries = archiver.list(archivePath, &error);
  ASSERT_TRUE(entries.has_value()) << error.describe();
  ASSERT_EQ(entries->size(), 4);
  EXPECT_EQ((*entries)[0].path, "tree");
  EXPECT_EQ((*entries)[1].path, "tree/a");
  EXPECT_EQ((*entries)[2].path, "tree/a/inner.txt");
  EXPECT_EQ((*entries)[2].size, 5);
  EXPECT_EQ((*entries)[3].path, "tree/b.txt");
  EXPECT_TRUE(fs::is_empty(destDir_));
}

TEST_F(ArchiverTest, EntryCallbackSeesEveryEntry) {
  createTestFile("cb/one.txt", "1");
  createTestFile("cb/two.txt", "2");

  packer::Archiver archiver;
  std::vector<std::string> packed;
  archiver.setEntryCallback([&](const packer::Entry &entry) { packed.push_back(entry.path); });

  fs::path archivePath = tempDir_ / "cb.bag";
  packer::Error error;
  ASSERT_TRUE(archiver.pack({srcDir_ / "cb"}, archivePath, {}, &error)) << error.describe();
  EXPECT_EQ(packed, (std::vector<std::string>{"cb", "cb/one.txt", "cb/two.txt"}));

  std::vector<std::string> unpacked;
  archiver.setEntryCallback([&](const packer::Entry &entry) { unpacked.push_back(entry.path); });
  ASSERT_TRUE(archiver.unpack(archivePath, destDir_, &error)) << error.describe();
  EXPECT_EQ(unpacked, packed);
}

TEST_F(ArchiverTest, UnknownFormatFailsBeforeIO) {
  packer::Error error;
  auto archiver = packer::Archiver::forFormat("zip", &error);
  EXPECT_FALSE(archiver.has_value());
  EXPECT_EQ(error.kind, ErrorKind::UnsupportedFeature);
  EXPECT_TRUE(fs::is_empty(tempDir_ / "dest"));
}

TEST_F(ArchiverTest, TraversalRejectedOnPackInBothFormats) {
  for (Format format : {Format::Bag, Format::Tar}) {
    SCOPED_TRACE(std::string(packer::formatName(format)));
    packer::Entry entry;
    entry.path = "../outside.txt";
    entry.size = 3;
    RawSource source({entry});

    std::ostringstream out;
    packer::Error error;
    EXPECT_FALSE(packer::Archiver(format).pack(source, out, &error));
    EXPECT_EQ(error.kind, ErrorKind::PathSecurity);
  }
}

TEST_F(ArchiverTest, TraversalRejectedOnUnpack) {
  // Bag archive with one record for "../outside.txt"
  std::string archive = std::string("BAGF\x01\x0E", 6) + "../outside.txt" +
                        std::string("\x00\xA4\x03\x00\x01", 5) + "x" + std::string("\x00\xFF", 2);
  std::istringstream in(archive);

  packer::Archiver archiver(Format::Bag);
  packer::Error error;
  EXPECT_FALSE(archiver.unpack(in, destDir_, &error));
  EXPECT_EQ(error.kind, ErrorKind::PathSecurity);
  EXPECT_FALSE(fs::exists(tempDir_ / "outside.txt"));
  EXPECT_TRUE(fs::is_empty(destDir_));
}

TEST_F(ArchiverTest, ArchiveInsideInputIsNotCollected) {
  createTestFile("self/data.txt", "data");

  packer::Archiver archiver;
  fs::path archivePath = srcDir_ / "self/self.bag";
  packer::Error error;
  ASSERT_TRUE(archiver.pack({srcDir_ / "self"}, archivePath, {}, &error)) << error.describe();

  auto entries = archiver.list(archivePath, &error);
  ASSERT_TRUE(entries.has_value()) << error.describe();
  ASSERT_EQ(entries->size(), 2);
  EXPECT_EQ((*entries)[1].path, "self/data.txt");
}

TEST_F(ArchiverTest, FailedPackRemovesPartialArchive) {
  createTestFile("ok.txt", "fine");

  packer::Archiver archiver(Format::Tar);
  packer::CollectOptions options;
  options.baseDir = srcDir_;
  fs::path archivePath = tempDir_ / "partial.tar";
  packer::Error error;
  EXPECT_FALSE(archiver.pack({"ok.txt", "missing.txt"}, archivePath, options, &error));
  EXPECT_EQ(error.kind, ErrorKind::IO);
  EXPECT_FALSE(fs::exists(archivePath));
}

TEST_F(ArchiverTest, SkipUnreadableProducesUsableArchive) {
  createTestFile("ok.txt", "fine");

  packer::Archiver archiver;
  packer::CollectOptions options;
  options.baseDir = srcDir_;
  options.skipUnreadable = true;
  int skipped = 0;
  options.onSkipped = [&](const packer::Error &) { ++skipped; };

  fs::path archivePath = tempDir_ / "skipped.bag";
  packer::Error error;
  ASSERT_TRUE(archiver.pack({"missing.txt", "ok.txt"}, archivePath, options, &error))
      << error.describe();
  EXPECT_EQ(skipped, 1);

  ASSERT_TRUE(archiver.unpack(archivePath, destDir_, &error)) << error.describe();
  EXPECT_EQ(readFile(destDir_ / "ok.txt"), "fine");
}

TEST_F(ArchiverTest, UnpackRequiresExistingDestination) {
  createTestFile("a.txt", "hi");
  packer::Archiver archiver;
  fs::path archivePath = tempDir_ / "a.bag";
  packer::Error error;
  ASSERT_TRUE(archiver.pack({srcDir_ / "a.txt"}, archivePath, {}, &error)) << error.describe();

  EXPECT_FALSE(archiver.unpack(archivePath, tempDir_ / "nowhere", &error));
  EXPECT_EQ(error.kind, ErrorKind::IO);
  EXPECT_FALSE(fs::exists(tempDir_ / "nowhere"));
}

TEST_F(ArchiverTest, WrongFormatIsFormatError) {
  createTestFile("a.txt", "hi");
  fs::path archivePath = tempDir_ / "a.tar";
  packer::Error error;
  ASSERT_TRUE(packer::Archiver(Format::Tar).pack({srcDir_ / "a.txt"}, archivePath, {}, &error))
      << error.describe();

  EXPECT_FALSE(packer::Archiver(Format::Bag).unpack(archivePath, destDir_, &error));
  EXPECT_EQ(error.kind, ErrorKind::Format);
}

TEST_F(ArchiverTest, MissingArchiveIsIOError) {
  packer::Archiver archiver;
  packer::Error error;
  EXPECT_FALSE(archiver.unpack(tempDir_ / "absent.bag", destDir_, &error));
  EXPECT_EQ(error.kind, ErrorKind::IO);
  EXPECT_FALSE(archiver.list(tempDir_ / "absent.bag", &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::IO);
}

TEST_F(ArchiverTest, EmptyInputListIsRejected) {
  packer::Archiver archiver;
  packer::Error error;
  EXPECT_FALSE(archiver.pack(std::vector<fs::path>{}, tempDir_ / "empty.bag", {}, &error));
  EXPECT_EQ(error.kind, ErrorKind::IO);
}

TEST_F(ArchiverTest, SameOwnerAppliesToTarOnly) {
  if (::geteuid() != 0) {
    GTEST_SKIP() << "giving files to another owner needs root";
  }

  packer::Entry entry;
  entry.path = "owned.txt";
  entry.kind = packer::EntryKind::RegularFile;
  entry.mode = 0644;
  entry.size = 3;
  entry.uid = 4242;
  entry.gid = 4243;

  for (Format format : {Format::Tar, Format::Bag}) {
    packer::Archiver archiver(format);
    archiver.setRestoreOwnership(true);

    RawSource source({entry});
    std::stringstream archive;
    packer::Error error;
    ASSERT_TRUE(archiver.pack(source, archive, &error)) << error.describe();

    fs::path dest = destDir_ / fs::path(packer::formatName(format));
    fs::create_directories(dest);
    ASSERT_TRUE(archiver.unpack(archive, dest, &error)) << error.describe();

    struct stat st {};
    ASSERT_EQ(::lstat((dest / "owned.txt").c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, format == Format::Tar ? 4242u : 0u);
    EXPECT_EQ(st.st_gid, format == Format::Tar ? 4243u : ::getegid());
  }
}

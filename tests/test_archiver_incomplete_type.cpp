// Archiver holds its codec through a forward-declared Codec, so destruction and
// moves must be defined where Codec is complete

#include <packer/archiver.hpp>
#include <packer/memory.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <vector>

TEST(ArchiverIncompleteTypeTest, UniquePtrCompilation) {
    // Requires the destructor to be defined in the .cpp file
    auto archiver_ptr = std::make_unique<packer::Archiver>();
    ASSERT_NE(archiver_ptr, nullptr);
    EXPECT_EQ(archiver_ptr->format(), packer::Format::Bag);
}

TEST(ArchiverIncompleteTypeTest, UnorderedMapCompilation) {
    std::unordered_map<std::string, packer::Archiver> map;
    map.emplace("bag", packer::Archiver(packer::Format::Bag));
    map.emplace("tar", packer::Archiver(packer::Format::Tar));
    ASSERT_EQ(map.size(), 2);
    EXPECT_EQ(map.at("tar").format(), packer::Format::Tar);
}

TEST(ArchiverIncompleteTypeTest, VectorCompilation) {
    std::vector<packer::Archiver> vec;
    vec.push_back(packer::Archiver(packer::Format::Tar));
    vec.emplace_back(packer::Format::Bag);
    ASSERT_EQ(vec.size(), 2);
    EXPECT_EQ(vec[0].format(), packer::Format::Tar);
    EXPECT_EQ(vec[1].format(), packer::Format::Bag);
}

TEST(ArchiverIncompleteTypeTest, MoveSemantics) {
    packer::Archiver a(packer::Format::Tar);
    packer::Archiver b = std::move(a);
    EXPECT_EQ(b.format(), packer::Format::Tar);
    a = packer::Archiver(packer::Format::Bag);
    b = std::move(a);
    EXPECT_EQ(b.format(), packer::Format::Bag);
}

TEST(ArchiverIncompleteTypeTest, MovedFromArchiverFailsCleanly) {
    packer::Archiver a(packer::Format::Tar);
    packer::Archiver b = std::move(a);
    EXPECT_EQ(a.format(), packer::Format::Tar);

    packer::MemorySource source;
    std::ostringstream out;
    packer::Error error;
    EXPECT_FALSE(a.pack(source, out, &error));
    EXPECT_EQ(error.kind, packer::ErrorKind::IO);
    EXPECT_TRUE(out.str().empty());

    std::istringstream in;
    packer::MemorySink sink;
    EXPECT_FALSE(a.unpack(in, sink, &error));
    EXPECT_FALSE(a.list("missing.tar", &error).has_value());
    EXPECT_EQ(error.kind, packer::ErrorKind::IO);

    // Assigning a fresh archiver makes it usable again
    a = packer::Archiver(packer::Format::Bag);
    EXPECT_TRUE(a.pack(source, out, &error)) << error.describe();
}

TEST(ArchiverIncompleteTypeTest, OptionalFromFormatName) {
    auto archiver = packer::Archiver::forFormat("tar");
    ASSERT_TRUE(archiver.has_value());
    EXPECT_EQ(archiver->format(), packer::Format::Tar);
}

#pragma once

// Packer Library
// A C++20 library for packing file trees into a single archive stream and
// unpacking them again, in either the compact "bag" format or a
// USTAR-compatible tar format.

#include "archiver.hpp"
#include "bag.hpp"
#include "codec.hpp"
#include "collector.hpp"
#include "materializer.hpp"
#include "memory.hpp"
#include "path.hpp"
#include "source.hpp"
#include "tar.hpp"
#include "types.hpp"
#include "varint.hpp"

// The library provides three levels of abstraction:
//
// 1. Low-level: BagCodec / TarCodec
//    - Encode an EntrySource into a stream, decode a stream into an EntrySink
//
// 2. Entry streams: TreeCollector / TreeMaterializer / MemorySource / MemorySink
//    - Walk a file tree in archive order, or recreate one on disk
//    - Build or inspect archives entirely in memory
//
// 3. High-level: Archiver
//    - Select a format and pack/unpack between paths and archive files
//
// Example usage:
//
//   // Packing a directory
//   packer::Archiver archiver(packer::Format::Tar);
//   packer::Error error;
//   if (!archiver.pack({"project"}, "project.tar", {}, &error)) {
//     std::cerr << error.describe() << std::endl;
//   }
//
//   // Unpacking it again
//   auto bag = packer::Archiver::forFormat("bag", &error);
//   if (bag && !bag->unpack("project.bag", "out", &error)) {
//     std::cerr << error.describe() << std::endl;
//   }

namespace packer {}

#pragma once

// BRArchive Library
// A C++20 library for reading and writing the .brarchive format used by
// Minecraft Bedrock Edition: a 16-byte header, a table of fixed 256-byte entry
// descriptors, then the concatenated entry contents.

#include "decoder.hpp"
#include "encoder.hpp"
#include "format.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "utf8.hpp"
#include "writer.hpp"

// The library provides two levels of abstraction:
//
// 1. Buffer codec: decode() / encode()
//    - Pure functions over in-memory buffers, no I/O
//    - readDescriptors() and sliceContent() give zero-copy access
//
// 2. Files: Reader / Writer classes
//    - Reader::open() memory-maps an archive and validates every descriptor
//    - Writer collects entries from disk or memory and writes them sorted by name
//
// Example usage:
//
//   brarchive::FormatError error;
//   auto decoded = brarchive::decode(bytes, &error);
//   if (!decoded) {
//     std::cerr << brarchive::toString(error.kind) << ": " << error.message << "\n";
//   }
//
//   brarchive::Writer writer;
//   writer.addFile("textures/terrain.json", "terrain.json");
//   writer.write("pack.brarchive");

namespace brarchive {}

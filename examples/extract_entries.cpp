#include <filesystem>
#include <iostream>
#include <string_view>

#include <brarchive/brarchive.hpp>

#include <spdlog/spdlog.h>

int main(int argc, char *argv[]) {
  int arg = 1;
  if (arg < argc && std::string_view(argv[arg]) == "-v") {
    spdlog::set_level(spdlog::level::debug);
    ++arg;
  }

  if (argc - arg < 2) {
    std::cerr << "Usage: " << argv[0] << " [-v] <archive.brarchive> <output_dir>\n";
    return 1;
  }

  brarchive::FormatError error;
  auto reader = brarchive::Reader::open(argv[arg], &error);
  if (!reader) {
    spdlog::error("{}: {}", brarchive::toString(error.kind), error.message);
    return 1;
  }

  std::filesystem::path outputDir = argv[arg + 1];
  spdlog::info("Extracting {} entries (version {}) to {}", reader->entryCount(),
               reader->version(), outputDir.string());

  // Duplicate names resolve to the last descriptor, as in findEntry()
  size_t extractedCount = 0;
  size_t failedCount = 0;
  for (const auto &entry : reader->entries()) {
    if (reader->findEntry(entry.name) != &entry) {
      spdlog::warn("Skipping shadowed duplicate entry: {}", entry.name);
      continue;
    }

    if (!reader->extract(entry, outputDir, &error)) {
      spdlog::error("Failed to extract {}: {}", entry.name, error.message);
      ++failedCount;
      continue;
    }

    spdlog::debug("Extracted {} ({} bytes)", entry.name, entry.contentsLen);
    ++extractedCount;
  }

  spdlog::info("Extracted {} entries to {}", extractedCount, outputDir.string());
  return failedCount == 0 ? 0 : 1;
}

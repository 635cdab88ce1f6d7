#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>

#include <brarchive/brarchive.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
  int arg = 1;
  if (arg < argc && std::string_view(argv[arg]) == "-v") {
    spdlog::set_level(spdlog::level::debug);
    ++arg;
  }

  if (argc - arg < 2) {
    std::cerr << "Usage: " << argv[0] << " [-v] <input_dir> <archive.brarchive>\n";
    return 1;
  }

  fs::path inputDir = argv[arg];
  fs::path archivePath = argv[arg + 1];

  std::error_code ec;
  fs::recursive_directory_iterator it(inputDir, ec);
  if (ec) {
    spdlog::error("Cannot read input directory {}: {}", inputDir.string(), ec.message());
    return 1;
  }

  // The output may sit inside the input directory; never pack it into itself
  fs::path outputPath = fs::weakly_canonical(archivePath, ec);
  if (ec) {
    spdlog::error("Cannot resolve output path {}: {}", archivePath.string(), ec.message());
    return 1;
  }
  fs::path partialPath = outputPath;
  partialPath += ".partial";

  brarchive::Writer writer;
  brarchive::FormatError error;

  for (fs::recursive_directory_iterator end; it != end;) {
    fs::path current = fs::weakly_canonical(it->path(), ec);
    if (!ec && (current == outputPath || current == partialPath)) {
      spdlog::debug("Skipping output file {}", it->path().string());
    } else if (it->is_regular_file(ec)) {
      // Entry names use forward slashes whatever the host separator
      auto relative = it->path().lexically_relative(inputDir).generic_u8string();
      std::string name(relative.begin(), relative.end());

      if (!writer.addFile(it->path(), name, &error)) {
        spdlog::error("Cannot add {}: {}: {}", name, brarchive::toString(error.kind),
                      error.message);
        return 1;
      }
      spdlog::debug("Added {}", name);
    }

    it.increment(ec);
    if (ec) {
      spdlog::error("Failed to walk {}: {}", inputDir.string(), ec.message());
      return 1;
    }
  }

  if (!writer.write(archivePath, &error)) {
    spdlog::error("{}: {}", brarchive::toString(error.kind), error.message);
    return 1;
  }

  spdlog::info("Packed {} entries into {}", writer.fileCount(), archivePath.string());
  return 0;
}

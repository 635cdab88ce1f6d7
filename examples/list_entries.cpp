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

  if (argc - arg < 1) {
    std::cerr << "Usage: " << argv[0] << " [-v] <archive.brarchive>\n";
    return 1;
  }

  brarchive::FormatError error;
  auto reader = brarchive::Reader::open(argv[arg], &error);
  if (!reader) {
    spdlog::error("{}: {}", brarchive::toString(error.kind), error.message);
    return 1;
  }

  std::cout << "Archive: " << argv[arg] << "\n";
  std::cout << "Version: " << reader->version() << "\n";
  std::cout << "Entries: " << reader->entryCount() << "\n\n";

  for (const auto &entry : reader->entries()) {
    spdlog::debug("{}: offset={} size={}", entry.name, entry.contentsOffset, entry.contentsLen);
    std::cout << "  " << entry.name << " (" << entry.contentsLen << " bytes)\n";
  }

  return 0;
}

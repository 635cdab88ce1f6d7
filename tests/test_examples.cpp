#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <brarchive/decoder.hpp>

#include <gtest/gtest.h>

#include "test_helpers.hpp"

// Tool locations are provided by CMake
#ifndef PACK_ENTRIES_BIN
#define PACK_ENTRIES_BIN "pack_entries"
#endif
#ifndef LIST_ENTRIES_BIN
#define LIST_ENTRIES_BIN "list_entries"
#endif
#ifndef EXTRACT_ENTRIES_BIN
#define EXTRACT_ENTRIES_BIN "extract_entries"
#endif

namespace fs = std::filesystem;

using testutil::toBytes;

class ExamplesTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "brarchive_test_examples";
    fs::remove_all(tempDir_);
    fs::create_directories(tempDir_ / "input" / "sub");
    writeFile(tempDir_ / "input" / "a.txt", "alpha");
    writeFile(tempDir_ / "input" / "sub" / "b.bin", std::string("\x00\x01\x02", 3));
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  static void writeFile(const fs::path &path, const std::string &content) {
    std::ofstream file(path, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
  }

  static std::string readFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  static std::string quote(const fs::path &path) { return "\"" + path.string() + "\""; }

  static int run(const std::string &tool, const std::vector<fs::path> &args,
                 const fs::path &stdoutPath = {}) {
    std::string command = quote(tool);
    for (const auto &arg : args) {
      command += " " + quote(arg);
    }
    if (!stdoutPath.empty()) {
      command += " > " + quote(stdoutPath);
    }
    return std::system(command.c_str());
  }

  fs::path tempDir_;
};

TEST_F(ExamplesTest, PackListExtract) {
  fs::path input = tempDir_ / "input";
  fs::path archivePath = input / "out.brarchive";

  // The archive lands inside the directory being packed; a rerun must not pack it
  ASSERT_EQ(run(PACK_ENTRIES_BIN, {input, archivePath}), 0);
  ASSERT_EQ(run(PACK_ENTRIES_BIN, {input, archivePath}), 0);

  brarchive::FormatError error;
  auto archiveBytes = readFile(archivePath);
  auto decoded = brarchive::decode(toBytes(archiveBytes), &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;
  ASSERT_EQ(decoded->entries.size(), 2);
  EXPECT_EQ(decoded->entries.at("a.txt"), toBytes("alpha"));
  EXPECT_EQ(decoded->entries.at("sub/b.bin"), (std::vector<uint8_t>{0, 1, 2}));
  EXPECT_FALSE(fs::exists(input / "out.brarchive.partial"));

  fs::path listing = tempDir_ / "listing.txt";
  ASSERT_EQ(run(LIST_ENTRIES_BIN, {archivePath}, listing), 0);
  std::string listed = readFile(listing);
  EXPECT_NE(listed.find("Version: 1"), std::string::npos) << listed;
  EXPECT_NE(listed.find("Entries: 2"), std::string::npos) << listed;
  EXPECT_NE(listed.find("a.txt (5 bytes)"), std::string::npos) << listed;
  EXPECT_NE(listed.find("sub/b.bin (3 bytes)"), std::string::npos) << listed;

  fs::path output = tempDir_ / "output";
  ASSERT_EQ(run(EXTRACT_ENTRIES_BIN, {archivePath, output}), 0);
  EXPECT_EQ(readFile(output / "a.txt"), "alpha");
  EXPECT_EQ(readFile(output / "sub" / "b.bin"), std::string("\x00\x01\x02", 3));
}

TEST_F(ExamplesTest, ToolsFailOnInvalidArchive) {
  fs::path bogus = tempDir_ / "bogus.brarchive";
  writeFile(bogus, "not an archive at all");

  EXPECT_NE(run(LIST_ENTRIES_BIN, {bogus}), 0);
  EXPECT_NE(run(EXTRACT_ENTRIES_BIN, {bogus, tempDir_ / "never"}), 0);
  EXPECT_FALSE(fs::exists(tempDir_ / "never"));
}

TEST_F(ExamplesTest, ToolsRequireArguments) {
  EXPECT_NE(run(PACK_ENTRIES_BIN, {}), 0);
  EXPECT_NE(run(LIST_ENTRIES_BIN, {}), 0);
  EXPECT_NE(run(EXTRACT_ENTRIES_BIN, {}), 0);
}

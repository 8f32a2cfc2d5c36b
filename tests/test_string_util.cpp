#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>

#include "test_support.hpp"
#include "util/string_util.hpp"

namespace {
namespace fs = std::filesystem;
using clientid::stringutil::read_file_contents;
using clientid::stringutil::trim_copy;

TEST(StringUtilTest, TrimStripsSurroundingWhitespace) {
  EXPECT_EQ(trim_copy("  abc-123 \r\n"), "abc-123");
  EXPECT_EQ(trim_copy("\t\f\v"), "");
  EXPECT_EQ(trim_copy("a b"), "a b");
}

TEST(StringUtilTest, ReadsWholeFile) {
  testinfra::ScopedTempDir tmp;
  testinfra::write_text(tmp.path / "value.txt", "line1\nline2\n");
  auto contents = read_file_contents(tmp.path / "value.txt");
  ASSERT_TRUE(contents.has_value());
  EXPECT_EQ(*contents, "line1\nline2\n");
}

TEST(StringUtilTest, MissingFileIsNullopt) {
  testinfra::ScopedTempDir tmp;
  EXPECT_FALSE(read_file_contents(tmp.path / "absent.txt").has_value());
}

TEST(StringUtilTest, DirectoryIsNulloptNotAnException) {
  testinfra::ScopedTempDir tmp;
  fs::create_directories(tmp.path / "client_id.txt");
  std::optional<std::string> contents;
  EXPECT_NO_THROW(contents = read_file_contents(tmp.path / "client_id.txt"));
  EXPECT_FALSE(contents.has_value());
}

} // namespace

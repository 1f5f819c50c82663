#include "utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include "test_util.hpp"
#include "utils/path_validation.hpp"

namespace minihttp {

TEST(PathValidation, InsideDirectory) {
  EXPECT_TRUE(path_validation::is_path_inside_directory("/srv/files/a.txt", "/srv/files"));
  EXPECT_TRUE(path_validation::is_path_inside_directory("/srv/files/a.txt", "/srv/files/"));
  EXPECT_TRUE(path_validation::is_path_inside_directory("/srv/files/x/../a.txt", "/srv/files"));
  EXPECT_TRUE(path_validation::is_path_inside_directory("data/a.txt", "data"));
}

TEST(PathValidation, OutsideDirectory) {
  EXPECT_FALSE(path_validation::is_path_inside_directory("/srv/files", "/srv/files"));
  EXPECT_FALSE(path_validation::is_path_inside_directory("/srv/files/.", "/srv/files"));
  EXPECT_FALSE(path_validation::is_path_inside_directory("/srv/files/..", "/srv/files"));
  EXPECT_FALSE(path_validation::is_path_inside_directory("/srv/filesystem/a", "/srv/files"));
  EXPECT_FALSE(path_validation::is_path_inside_directory("/etc/passwd", "/srv/files"));
}

TEST(PathValidation, ValidateFilePathJoinsRoot) {
  std::string validated = path_validation::validate_file_path("/srv/files", "a.txt");
  EXPECT_EQ(std::filesystem::path(validated), std::filesystem::path("/srv/files") / "a.txt");
}

TEST(PathValidation, ValidateFilePathRejectsEscapes) {
  EXPECT_THROW(path_validation::validate_file_path("/srv/files", ".."), std::runtime_error);
  EXPECT_THROW(path_validation::validate_file_path("/srv/files", "."), std::runtime_error);
  EXPECT_THROW(path_validation::validate_file_path("/srv/files", ""), std::runtime_error);
  EXPECT_THROW(path_validation::validate_file_path("/srv/files", "/etc/passwd"), std::runtime_error);
}

TEST(FileUtils, ReadFileMissingOrDirectory) {
  test::ScopedTempDir dir;
  EXPECT_FALSE(file_utils::read_file((dir.path() / "nope").string()).has_value());
  EXPECT_FALSE(file_utils::read_file(dir.str()).has_value());
}

TEST(FileUtils, SaveFileCreatesParentsAndTruncates) {
  test::ScopedTempDir dir;
  std::string target = (dir.path() / "a" / "b" / "c.txt").string();

  file_utils::save_file(target, "first version");
  file_utils::save_file(target, "v2");

  auto content = file_utils::read_file(target);
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(*content, "v2");
}

TEST(FileUtils, SaveFileOntoDirectoryThrows) {
  test::ScopedTempDir dir;
  EXPECT_THROW(file_utils::save_file(dir.str(), "x"), std::runtime_error);
}

}  // namespace minihttp

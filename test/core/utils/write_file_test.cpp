/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/write_file.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"
#include "utils/read_file.hpp"

class WriteFileTest : public test::BaseFS_Test {
 public:
  WriteFileTest() : test::BaseFS_Test("/tmp/gorc_write_file_test") {}

  std::string read(const std::string &name) {
    std::string content;
    auto res = gorc::readFile(content, base_path / name);
    EXPECT_TRUE(res) << res.error().message();
    return content;
  }
};

/**
 * @given empty directory
 * @when new file written
 * @then only the file remains, with the content and owner only access
 */
TEST_F(WriteFileTest, WriteNewFile) {
  EXPECT_OUTCOME_TRUE_1(gorc::writeNewFile(base_path / "a.json", "{}\n"));
  EXPECT_EQ(listDirectory(), std::vector<std::string>{"a.json"});
  EXPECT_EQ(read("a.json"), "{}\n");
  EXPECT_EQ(fs::status(base_path / "a.json").permissions(),
            fs::perms::owner_read | fs::perms::owner_write);
}

/**
 * @given existing file
 * @when new file written over it
 * @then file_exists is returned, old content stays, no tmp file is left
 */
TEST_F(WriteFileTest, NeverOverwrites) {
  EXPECT_OUTCOME_TRUE_1(gorc::writeNewFile(base_path / "a.json", "old"));
  EXPECT_EC(gorc::writeNewFile(base_path / "a.json", "new"),
            std::errc::file_exists);
  EXPECT_EQ(read("a.json"), "old");
  EXPECT_EQ(listDirectory(), std::vector<std::string>{"a.json"});
}

/**
 * @given tmp file that was written but not committed
 * @when it goes out of scope
 * @then the hidden tmp file is removed and the target never appears
 */
TEST_F(WriteFileTest, AbandonedTmpFile) {
  {
    EXPECT_OUTCOME_TRUE(tmp, gorc::TmpFile::make(base_path / "b.json"));
    EXPECT_OUTCOME_TRUE_1(tmp.write("partial"));
    auto names = listDirectory();
    ASSERT_EQ(names.size(), 1);
    EXPECT_TRUE(names[0].starts_with(".b.json.tmp-"));
    EXPECT_EQ(tmp.path().filename().string(), names[0]);
  }
  EXPECT_TRUE(listDirectory().empty());
}

/**
 * @given two files
 * @when one renamed onto the other and then onto a free name
 * @then first rename fails with file_exists, second moves the file
 */
TEST_F(WriteFileTest, RenameNoReplace) {
  EXPECT_OUTCOME_TRUE_1(gorc::writeNewFile(base_path / "x", "x"));
  EXPECT_OUTCOME_TRUE_1(gorc::writeNewFile(base_path / "y", "y"));
  EXPECT_EC(gorc::renameNoReplace(base_path / "x", base_path / "y"),
            std::errc::file_exists);
  EXPECT_EQ(read("y"), "y");

  EXPECT_OUTCOME_TRUE_1(
      gorc::renameNoReplace(base_path / "x", base_path / "z"));
  EXPECT_EQ(listDirectory(), (std::vector<std::string>{"y", "z"}));
  EXPECT_EQ(read("z"), "x");

  EXPECT_EC(gorc::renameNoReplace(base_path / "x", base_path / "w"),
            std::errc::no_such_file_or_directory);
}

/**
 * @given two files and a dangling symlink
 * @when renamed without RENAME_NOREPLACE onto taken and free names
 * @then taken names fail with file_exists and keep both files intact,
 * the free name receives the file and the source name disappears
 */
TEST_F(WriteFileTest, RenameIfAbsent) {
  EXPECT_OUTCOME_TRUE_1(gorc::writeNewFile(base_path / "x", "x"));
  EXPECT_OUTCOME_TRUE_1(gorc::writeNewFile(base_path / "y", "y"));
  fs::create_symlink(base_path / "missing", base_path / "link");

  EXPECT_EC(gorc::renameIfAbsent(base_path / "x", base_path / "y"),
            std::errc::file_exists);
  EXPECT_EC(gorc::renameIfAbsent(base_path / "x", base_path / "link"),
            std::errc::file_exists);
  EXPECT_EQ(read("x"), "x");
  EXPECT_EQ(read("y"), "y");

  EXPECT_OUTCOME_TRUE_1(
      gorc::renameIfAbsent(base_path / "x", base_path / "z"));
  EXPECT_EQ(listDirectory(), (std::vector<std::string>{"link", "y", "z"}));
  EXPECT_EQ(read("z"), "x");

  EXPECT_EC(gorc::renameIfAbsent(base_path / "x", base_path / "w"),
            std::errc::no_such_file_or_directory);
}

/**
 * @given directory
 * @when read as a file
 * @then an error is returned and the output is left empty
 */
TEST_F(WriteFileTest, ReadDirectory) {
  fs::create_directory(base_path / "sub");
  std::string content = "stale";
  EXPECT_FALSE(gorc::readFile(content, base_path / "sub"));
  EXPECT_TRUE(content.empty());
}

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "atres.hpp"
#include "loghandle.hpp"
#include "tempfile.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace afltriage {

namespace {
std::string read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  std::stringstream content;
  content << file.rdbuf();
  return content.str();
}
} // namespace

TEST(TempFile, CreateWithContent) {
  LogHandle handle;
  std::string const data = "print('hello')\n";
  std::string path;
  ATRes const res = create_temp_file(
      "afltriage-ut", as_bytes(std::span{data.data(), data.size()}), 0600,
      path, ".py");
  ASSERT_TRUE(IsATResOK(res));
  TempFileHolder holder{path, true};

  EXPECT_EQ(std::filesystem::path{path}.extension(), ".py");
  EXPECT_NE(std::filesystem::path{path}.filename().string().find(
                "afltriage-ut."),
            std::string::npos);
  EXPECT_EQ(read_file(path), data);

  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0600);
}

TEST(TempFile, UniquePaths) {
  LogHandle handle;
  std::string path1;
  std::string path2;
  ASSERT_TRUE(IsATResOK(create_temp_file("afltriage-ut", {}, 0600, path1)));
  TempFileHolder holder1{path1, true};
  ASSERT_TRUE(IsATResOK(create_temp_file("afltriage-ut", {}, 0600, path2)));
  TempFileHolder holder2{path2, true};
  EXPECT_NE(path1, path2);
  EXPECT_TRUE(read_file(path1).empty());
}

TEST(TempFile, HolderRemovesFile) {
  LogHandle handle;
  std::string path;
  ASSERT_TRUE(IsATResOK(create_temp_file("afltriage-ut", {}, 0600, path)));
  {
    TempFileHolder holder{path, true};
    TempFileHolder moved = std::move(holder);
    EXPECT_TRUE(holder.path().empty());
    EXPECT_EQ(moved.path(), path);
    EXPECT_TRUE(std::filesystem::exists(path));
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(TempFile, HolderKeepsNonTemporaryFile) {
  LogHandle handle;
  std::string path;
  ASSERT_TRUE(IsATResOK(create_temp_file("afltriage-ut", {}, 0600, path)));
  { TempFileHolder holder{path, false}; }
  EXPECT_TRUE(std::filesystem::exists(path));

  TempFileHolder holder{path, true};
  EXPECT_EQ(holder.release(), path);
  EXPECT_TRUE(holder.path().empty());
  EXPECT_TRUE(std::filesystem::exists(path));
  std::filesystem::remove(path);
}

} // namespace afltriage

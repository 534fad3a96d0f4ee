// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "atres.hpp"
#include "loghandle.hpp"
#include "testcase.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace afltriage {

namespace fs = std::filesystem;

namespace {
class TestcaseDir : public ::testing::Test {
protected:
  void SetUp() override {
    char dir_template[] = "/tmp/afltriage-testcase-ut.XXXXXX";
    ASSERT_NE(mkdtemp(dir_template), nullptr);
    _dir = dir_template;
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(_dir, ec);
  }

  std::string touch(const std::string &name) {
    std::string path = (fs::path{_dir} / name).string();
    std::ofstream{path} << "testcase";
    return path;
  }

  std::string _dir;
};
} // namespace

TEST_F(TestcaseDir, CollectDirectory) {
  LogHandle handle;
  std::string const b = touch("id:000001,sig:11");
  std::string const a = touch("id:000000,sig:06");
  fs::create_directory(fs::path{_dir} / "subdir");
  touch("subdir/not_collected");

  std::vector<std::string> const inputs = {_dir};
  std::vector<std::string> testcases;
  ASSERT_TRUE(IsATResOK(collect_testcases(inputs, testcases)));
  ASSERT_EQ(testcases.size(), 2u);
  EXPECT_EQ(testcases[0], a);
  EXPECT_EQ(testcases[1], b);
}

TEST_F(TestcaseDir, CollectFilesInOrder) {
  LogHandle handle;
  std::string const b = touch("b");
  std::string const a = touch("a");
  std::vector<std::string> const inputs = {b, a};
  std::vector<std::string> testcases;
  ASSERT_TRUE(IsATResOK(collect_testcases(inputs, testcases)));
  EXPECT_EQ(testcases, inputs);
}

TEST_F(TestcaseDir, CollectMissing) {
  LogHandle handle;
  std::vector<std::string> const inputs = {_dir + "/does-not-exist"};
  std::vector<std::string> testcases;
  EXPECT_EQ(collect_testcases(inputs, testcases),
            atres_error(AT_WHAT_TESTCASE));
}

TEST_F(TestcaseDir, CollectUnreadableDirectory) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "permissions are not enforced for root";
  }
  LogHandle handle;
  fs::path const locked = fs::path{_dir} / "locked";
  fs::create_directory(locked);
  touch("locked/id:000000,sig:11");
  fs::permissions(locked, fs::perms::none);

  std::vector<std::string> const inputs = {locked.string()};
  std::vector<std::string> testcases;
  EXPECT_EQ(collect_testcases(inputs, testcases),
            atres_error(AT_WHAT_TESTCASE));
  EXPECT_TRUE(testcases.empty());
  fs::permissions(locked, fs::perms::owner_all);
}

TEST(Testcase, Placeholder) {
  std::vector<std::string> const with = {"./target", "-f", "@@"};
  std::vector<std::string> const embedded = {"./target", "--input=@@"};
  std::vector<std::string> const without = {"./target", "-f", "file"};
  EXPECT_TRUE(has_testcase_placeholder(with));
  EXPECT_TRUE(has_testcase_placeholder(embedded));
  EXPECT_FALSE(has_testcase_placeholder(without));
  EXPECT_FALSE(has_testcase_placeholder({}));
}

TEST(Testcase, Substitute) {
  std::vector<std::string> const command_line = {"./target", "--input=@@",
                                                 "@@", "-v"};
  std::vector<std::string> const expected = {
      "./target", "--input=crashes/id:0", "crashes/id:0", "-v"};
  EXPECT_EQ(substitute_testcase(command_line, "crashes/id:0"), expected);
}

TEST(Testcase, ReportPath) {
  EXPECT_EQ(report_path("reports", "crashes/id:000000,sig:11"),
            "reports/id:000000,sig:11.json");
  EXPECT_EQ(report_path("/out/", "/abs/crash"), "/out/crash.json");
}

TEST_F(TestcaseDir, ReportPathsSameNameInTwoDirectories) {
  LogHandle handle;
  fs::create_directory(fs::path{_dir} / "fuzzer01");
  fs::create_directory(fs::path{_dir} / "fuzzer02");
  touch("fuzzer01/id:000000,sig:11");
  touch("fuzzer01/id:000001,sig:06");
  touch("fuzzer02/id:000000,sig:11");

  std::vector<std::string> const inputs = {_dir + "/fuzzer01",
                                           _dir + "/fuzzer02"};
  std::vector<std::string> testcases;
  ASSERT_TRUE(IsATResOK(collect_testcases(inputs, testcases)));
  ASSERT_EQ(testcases.size(), 3u);

  std::vector<std::string> const expected = {
      "reports/id:000000,sig:11.json", "reports/id:000001,sig:06.json",
      "reports/id:000000,sig:11.1.json"};
  std::vector<std::string> const reports = report_paths("reports", testcases);
  EXPECT_EQ(reports, expected);
}

TEST(Testcase, ReportPathsKeepDistinct) {
  std::vector<std::string> const testcases = {"a/crash", "b/crash",
                                              "c/crash.1", "d/crash"};
  std::vector<std::string> const expected = {
      "out/crash.json", "out/crash.1.json", "out/crash.1.1.json",
      "out/crash.2.json"};
  EXPECT_EQ(report_paths("out", testcases), expected);
  EXPECT_TRUE(report_paths("out", {}).empty());
}

} // namespace afltriage

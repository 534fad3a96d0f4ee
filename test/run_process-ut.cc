// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "atres.hpp"
#include "loghandle.hpp"
#include "run_process.hpp"

#include <csignal>
#include <string>
#include <vector>

namespace afltriage {

TEST(RunProcess, CaptureBothStreams) {
  LogHandle handle;
  std::vector<std::string> const args = {
      "-c", "printf 'to stdout\\n'; printf 'to stderr\\n' >&2"};
  ProcessOutput output;
  ASSERT_TRUE(IsATResOK(run_process("sh", args, output)));
  EXPECT_EQ(output.out, "to stdout\n");
  EXPECT_EQ(output.err, "to stderr\n");
  EXPECT_TRUE(output.exit_success());
  EXPECT_EQ(output.exit_code(), 0);
}

TEST(RunProcess, ArgumentsAreNotSplit) {
  LogHandle handle;
  std::vector<std::string> const args = {"-c", "printf '%s|' \"$@\"", "sh",
                                         "one arg", "@@", ""};
  ProcessOutput output;
  ASSERT_TRUE(IsATResOK(run_process("sh", args, output)));
  EXPECT_EQ(output.out, "one arg|@@||");
}

TEST(RunProcess, StdinIsEmpty) {
  LogHandle handle;
  std::vector<std::string> const args = {"-c", "cat; echo done"};
  ProcessOutput output;
  ASSERT_TRUE(IsATResOK(run_process("sh", args, output)));
  EXPECT_EQ(output.out, "done\n");
}

// More than a pipe buffer on both streams: nothing can dead lock
TEST(RunProcess, LargeOutput) {
  LogHandle handle;
  std::vector<std::string> const args = {
      "-c", "i=0; while [ $i -lt 20000 ]; do "
            "echo 0123456789012345678901234567890123456789; "
            "echo 0123456789012345678901234567890123456789 >&2; "
            "i=$((i+1)); done"};
  ProcessOutput output;
  ASSERT_TRUE(IsATResOK(run_process("sh", args, output)));
  EXPECT_EQ(output.out.size(), 20000u * 41);
  EXPECT_EQ(output.err.size(), 20000u * 41);
}

TEST(RunProcess, ExitStatus) {
  LogHandle handle;
  {
    std::vector<std::string> const args = {"-c", "exit 3"};
    ProcessOutput output;
    ASSERT_TRUE(IsATResOK(run_process("sh", args, output)));
    EXPECT_FALSE(output.exit_success());
    EXPECT_EQ(output.exit_code(), 3);
  }
  {
    std::vector<std::string> const args = {"-c", "kill -SEGV $$"};
    ProcessOutput output;
    ASSERT_TRUE(IsATResOK(run_process("sh", args, output)));
    EXPECT_FALSE(output.exit_success());
    EXPECT_EQ(output.exit_code(), 128 + SIGSEGV);
  }
}

TEST(RunProcess, SpawnFailure) {
  LogHandle handle;
  ProcessOutput output;
  output.out = "untouched";
  ATRes const res =
      run_process("/nonexistent/afltriage-no-such-binary", {}, output);
  EXPECT_EQ(res, atres_error(AT_WHAT_SPAWN));
  EXPECT_EQ(output.out, "untouched");
}

} // namespace afltriage

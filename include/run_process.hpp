// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"

#include <span>
#include <string>

namespace afltriage {

struct ProcessOutput {
  std::string out; // raw bytes written on stdout
  std::string err; // raw bytes written on stderr
  int status{0};   // waitpid status

  [[nodiscard]] bool exit_success() const;
  // exit code, or 128 + signal number when the process was killed
  [[nodiscard]] int exit_code() const;
};

/// Spawn `executable` (looked up in PATH) with `args`, stdin tied to
/// /dev/null. Blocks until the process exits and both of its output streams
/// are fully drained.
/// Errors: AT_WHAT_SPAWN when the executable can not be launched,
/// AT_WHAT_PROCESS_IO when the output can not be collected.
ATRes run_process(const std::string &executable,
                  std::span<const std::string> args, ProcessOutput &output);

} // namespace afltriage

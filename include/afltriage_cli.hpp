// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <string>
#include <vector>

namespace afltriage {

// NOLINTNEXTLINE(clang-analyzer-optin.performance.Padding)
struct AflTriageCLI {
public:
  int parse(int argc, const char *argv[]);

  void print() const;

  [[nodiscard]] bool print_reports_to_stdout() const {
    return output.empty() || output == "-";
  }

  // Triage options
  std::vector<std::string> inputs;
  std::string output;
  std::string script;
  bool raw_output{false};
  bool skip_sanity_check{false};

  // debug
  std::string log_level;
  std::string log_mode;
  bool show_config{false};
  bool version{false}; // request version

  bool continue_exec{false};

  // args
  std::vector<std::string> command_line;
};

} // namespace afltriage

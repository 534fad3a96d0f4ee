// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace afltriage {

/// Expand inputs into testcase files: files are kept as is, directories
/// contribute their regular files (sorted, not recursive).
ATRes collect_testcases(std::span<const std::string> inputs,
                        std::vector<std::string> &testcases);

bool has_testcase_placeholder(std::span<const std::string> command_line);

/// Replace every "@@" in the command line with the testcase path
std::vector<std::string>
substitute_testcase(std::span<const std::string> command_line,
                    std::string_view testcase);

/// Report path for a testcase: <output_dir>/<testcase file name>.json
std::string report_path(std::string_view output_dir,
                        std::string_view testcase);

/// Report paths for a batch of testcases, in the same order. A file name
/// seen earlier in the batch gets a ".<n>" suffix, so testcases with the same
/// name in different directories do not overwrite each other's reports.
std::vector<std::string> report_paths(std::string_view output_dir,
                                      std::span<const std::string> testcases);

} // namespace afltriage

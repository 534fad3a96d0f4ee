// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "testcase.hpp"

#include "atres_helpers.hpp"
#include "constants.hpp"

#include <absl/strings/match.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/str_cat.h>
#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace afltriage {

namespace fs = std::filesystem;

ATRes collect_testcases(std::span<const std::string> inputs,
                        std::vector<std::string> &testcases) {
  for (const auto &input : inputs) {
    std::error_code ec;
    if (fs::is_directory(input, ec)) {
      std::vector<std::string> entries;
      for (fs::directory_iterator it(input, ec), end; !ec && it != end;
           it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
          entries.push_back(it->path().string());
        }
      }
      ATRES_CHECK_ERRORCODE(ec, AT_WHAT_TESTCASE, "Unable to list %s",
                            input.c_str());
      std::sort(entries.begin(), entries.end());
      LG_DBG("%zu testcases found in %s", entries.size(), input.c_str());
      testcases.insert(testcases.end(), entries.begin(), entries.end());
    } else if (fs::is_regular_file(input, ec)) {
      testcases.push_back(input);
    } else {
      ATRES_RETURN_ERROR_LOG(AT_WHAT_TESTCASE,
                             "Testcase %s is not a file or a directory",
                             input.c_str());
    }
  }
  return {};
}

bool has_testcase_placeholder(std::span<const std::string> command_line) {
  return std::any_of(command_line.begin(), command_line.end(),
                     [](const std::string &arg) {
                       return absl::StrContains(arg, k_testcase_placeholder);
                     });
}

std::vector<std::string>
substitute_testcase(std::span<const std::string> command_line,
                    std::string_view testcase) {
  std::vector<std::string> res;
  res.reserve(command_line.size());
  for (const auto &arg : command_line) {
    res.push_back(
        absl::StrReplaceAll(arg, {{k_testcase_placeholder, testcase}}));
  }
  return res;
}

std::string report_path(std::string_view output_dir,
                        std::string_view testcase) {
  fs::path const name = fs::path{testcase}.filename();
  return (fs::path{output_dir} / name).string() + ".json";
}

std::vector<std::string> report_paths(std::string_view output_dir,
                                      std::span<const std::string> testcases) {
  std::vector<std::string> res;
  res.reserve(testcases.size());
  std::unordered_set<std::string> used;
  for (const auto &testcase : testcases) {
    std::string const name = fs::path{testcase}.filename().string();
    std::string unique_name = name;
    for (int suffix = 1; !used.insert(unique_name).second; ++suffix) {
      unique_name = absl::StrCat(name, ".", suffix);
    }
    if (unique_name != name) {
      LG_NTC("Report for %s renamed to %s.json", testcase.c_str(),
             unique_name.c_str());
    }
    res.push_back(report_path(output_dir, unique_name));
  }
  return res;
}

} // namespace afltriage

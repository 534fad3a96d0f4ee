// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace afltriage {

namespace {

constexpr std::array<std::string_view, 4> k_log_mode_names = {
    "stdout", "stderr", "syslog", "disabled"};
constexpr std::array<int, 4> k_log_modes = {LOG_STDOUT, LOG_STDERR,
                                            LOG_SYSLOG, LOG_DISABLE};

constexpr std::array<std::string_view, 5> k_log_level_names = {
    "debug", "informational", "notice", "warn", "error"};
constexpr std::array<int, 5> k_log_levels = {
    LL_DEBUG, LL_INFORMATIONAL, LL_NOTICE, LL_WARNING, LL_ERROR};

bool iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
        std::tolower(static_cast<unsigned char>(b));
  });
}

void open_log_destination(const char *log_mode) {
  // stderr when unset, anything unknown is taken as a file path
  int const idx = log_mode ? arg_which(log_mode, k_log_mode_names) : 1;
  if (idx >= 0) {
    LOG_open(k_log_modes[idx], "");
    return;
  }
  if (!LOG_open(LOG_FILE, log_mode)) {
    LOG_open(LOG_STDERR, "");
    LG_WRN("Unable to open log file %s, logging to stderr", log_mode);
  }
}

} // namespace

int arg_which(std::string_view str, std::span<const std::string_view> str_set) {
  auto it = std::ranges::find_if(
      str_set, [str](std::string_view candidate) {
        return iequals(str, candidate);
      });
  return it == str_set.end()
      ? -1
      : static_cast<int>(std::distance(str_set.begin(), it));
}

void setup_logger(const char *log_mode, const char *log_level) {
  open_log_destination(log_mode);

  int const idx = log_level ? arg_which(log_level, k_log_level_names) : -1;
  LOG_setlevel(idx >= 0 ? k_log_levels[idx] : LL_WARNING);
}

} // namespace afltriage

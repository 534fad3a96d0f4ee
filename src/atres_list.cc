// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "atres_list.hpp"

#include <iterator>

namespace {
const char *s_common_error_messages[] = {
    COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

const char *s_triage_error_messages[] = {
    TRIAGE_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

static_assert(std::size(s_common_error_messages) ==
                  COMMON_ERROR_SIZE - AT_COMMON_START_RANGE - 1,
              "Common error messages table is not in sync");
static_assert(std::size(s_triage_error_messages) ==
                  TRIAGE_ERROR_SIZE - AT_TRIAGE_START_RANGE - 1,
              "Triage error messages table is not in sync");
} // namespace

const char *atres_error_message(int16_t what) {
  if (what > AT_COMMON_START_RANGE && what < COMMON_ERROR_SIZE) {
    return s_common_error_messages[what - AT_COMMON_START_RANGE - 1];
  }
  if (what > AT_TRIAGE_START_RANGE && what < TRIAGE_ERROR_SIZE) {
    return s_triage_error_messages[what - AT_TRIAGE_START_RANGE - 1];
  }
  return "unknown error";
}

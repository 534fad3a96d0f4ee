// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

enum : uint16_t { AT_COMMON_START_RANGE = 1000, AT_TRIAGE_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) AT_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(UKNW, "undocumented error")                                                \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")

#define TRIAGE_ERROR_TABLE(X)                                                  \
  X(SPAWN, "unable to launch executable")                                      \
  X(PROCESS_IO, "error capturing child process output")                        \
  X(UNSUPPORTED_SCRIPT_LOCATION, "unsupported triage script path")             \
  X(MARKER_NOT_FOUND, "marker not found in debugger output")                   \
  X(MARKERS_OUT_OF_ORDER, "start marker and end marker out-of-order")          \
  X(CHILD_STDOUT, "could not extract child stdout")                            \
  X(CHILD_STDERR, "could not extract child stderr")                            \
  X(TRIAGE_JSON, "failed to get triage JSON from GDB")                         \
  X(TRIAGE_ERRORS, "failed to get triage errors from GDB")                     \
  X(TRIAGE_SCRIPT, "triage script emitted errors")                             \
  X(PAYLOAD_PARSE, "failed to parse triage JSON from GDB")                     \
  X(TEMP_FILE, "error during temporary file creation")                         \
  X(TESTCASE, "error collecting testcases")                                    \
  X(REPORT, "error writing crash report")                                      \
  X(ARGUMENT, "invalid arguments")                                             \
  X(UNITTEST, "unit test error")

enum ATRes_What : uint16_t {
  AT_WHAT_MIN_ERRNO = AT_COMMON_START_RANGE,
  // common errors
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  AT_WHAT_MIN_TRIAGE = AT_TRIAGE_START_RANGE,
  TRIAGE_ERROR_TABLE(EXPAND_ENUM) TRIAGE_ERROR_SIZE,
  // max
  AT_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *atres_error_message(int16_t what);

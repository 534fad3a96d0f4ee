// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"

#ifndef MYNAME
#  define MYNAME "afltriage"
#endif

namespace afltriage {

enum LOG_OPTS {
  LOG_DISABLE = 0,
  LOG_SYSLOG = 1,
  LOG_STDOUT = 2,
  LOG_STDERR = 3,
  LOG_FILE = 4,
};

// syslog severities. A negated level is printed whatever the configured level
enum LOG_LVL {
  LL_EMERGENCY = 0,
  LL_ALERT = 1,
  LL_CRITICAL = 2,
  LL_ERROR = 3,
  LL_WARNING = 4,
  LL_NOTICE = 5,
  LL_INFORMATIONAL = 6,
  LL_DEBUG = 7,
  LL_LENGTH,
};

// Allow for compile-time argument type checking for printf-like functions
#define printflike(x, y) __attribute__((format(printf, x, y)))

/// mode is one of LOG_OPTS, path is only used by LOG_FILE
bool LOG_open(int mode, const char *path);
void LOG_close();

void LOG_setlevel(int lvl);
int LOG_getlevel();

bool LOG_is_logging_enabled_for_level(int level);

// One line on the current sink:
// `<LEVEL>MMM DD hh:mm:ss.uuuuuu NAME[PID]: message`
printflike(3, 4) void log_printfln(int lvl, const char *name, const char *fmt,
                                   ...);

constexpr int log_level_abs(int lvl) { return lvl < 0 ? -lvl : lvl; }

/******************************* Logging Macros *******************************/
// Arguments are only evaluated when the level is enabled
#define LG_IF_LVL_OK(level, ...)                                               \
  do {                                                                         \
    if (unlikely(afltriage::LOG_is_logging_enabled_for_level(level))) {        \
      afltriage::log_printfln(afltriage::log_level_abs(level), MYNAME,         \
                              __VA_ARGS__);                                    \
    }                                                                          \
  } while (false)

#define LG_ERR(...) LG_IF_LVL_OK(afltriage::LL_ERROR, __VA_ARGS__)
#define LG_WRN(...) LG_IF_LVL_OK(afltriage::LL_WARNING, __VA_ARGS__)
#define LG_NTC(...) LG_IF_LVL_OK(afltriage::LL_NOTICE, __VA_ARGS__)
#define LG_NFO(...) LG_IF_LVL_OK(afltriage::LL_INFORMATIONAL, __VA_ARGS__)
#define LG_DBG(...) LG_IF_LVL_OK(afltriage::LL_DEBUG, __VA_ARGS__)
#define PRINT_NFO(...)                                                         \
  LG_IF_LVL_OK(-1 * afltriage::LL_INFORMATIONAL, __VA_ARGS__)

} // namespace afltriage

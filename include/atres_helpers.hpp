// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"
#include "atres_list.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

/// Error code with the location it was raised from
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", atres_error_message(what), __FILE__, __LINE__)

/// Log (printf-style arguments) and return a fatal result
#define ATRES_RETURN_ERROR_LOG(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return atres_error(what);                                                  \
  } while (0)

/// Hand a human readable reason back to the caller through `details_out`
/// (a std::string), log it and return a fatal result
#define ATRES_RETURN_ERROR_DETAILS(what, details_out, details)                 \
  do {                                                                         \
    (details_out) = (details);                                                 \
    LG_ERR("%s", (details_out).c_str());                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return atres_error(what);                                                  \
  } while (0)

/// Return a fatal result if eval is -1, logging errno
#define ATRES_CHECK_ERRNO(eval, what, ...)                                     \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      const int e = errno;                                                     \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("errno(%d): %s", e, strerror(e));                                 \
      return atres_error(what);                                                \
    }                                                                          \
  } while (0)

/// Return a fatal result if the std::error_code is set
#define ATRES_CHECK_ERRORCODE(eval, what, ...)                                 \
  do {                                                                         \
    const std::error_code err = (eval);                                        \
    if (err) {                                                                 \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("error_code(%d): %s", err.value(), err.message().c_str());        \
      return atres_error(what);                                                \
    }                                                                          \
  } while (0)

/// Forward fatal results, log and carry on for the others
#define ATRES_CHECK_FWD(atres)                                                 \
  do {                                                                         \
    ATRes latres = atres; /* single eval */                                    \
    if (IsATResFatal(latres)) {                                                \
      LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,                \
             atres_error_message(latres._what));                               \
      return latres;                                                           \
    }                                                                          \
    if (IsATResNotOK(latres)) {                                                \
      LG_WRN("Recover from sev=%d at %s:%u - %s", latres._sev, __FILE__,       \
             __LINE__, atres_error_message(latres._what));                     \
    }                                                                          \
  } while (0)

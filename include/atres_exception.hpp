// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"
#include "atres_helpers.hpp"
#include "atres_list.hpp"

#include <exception>
#include <new>

/// Catch clauses turning exceptions into a returned ATRes, to place after a
/// try block in a function returning ATRes
#define CatchExcept2ATRes()                                                    \
  catch (const std::bad_alloc &) {                                             \
    LOG_ERROR_DETAILS(LG_ERR, AT_WHAT_BADALLOC);                               \
    return atres_error(AT_WHAT_BADALLOC);                                      \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("%s", e.what());                                                    \
    LOG_ERROR_DETAILS(LG_ERR, AT_WHAT_STDEXCEPT);                              \
    return atres_error(AT_WHAT_STDEXCEPT);                                     \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, AT_WHAT_UKNWEXCEPT);                             \
    return atres_error(AT_WHAT_UKNWEXCEPT);                                    \
  }

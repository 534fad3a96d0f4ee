// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>

#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)

enum AT_RES_SEV : uint8_t {
  AT_SEV_OK = 0,
  AT_SEV_NOTICE = 1,
  AT_SEV_WARN = 2,
  AT_SEV_ERROR = 3,
};

/// Result of a triage step: what went wrong (see atres_list.hpp) and how bad.
/// Fits in a register so it is returned by value everywhere.
struct ATRes {
  union {
    struct {
      int16_t _what;
      int16_t _sev;
    };
    int32_t _val;
  };
};

inline ATRes atres_create(int16_t sev, int16_t what) {
  ATRes atres;
  atres._what = what;
  atres._sev = sev;
  return atres;
}

/// Fatal result for the error code `what`
inline ATRes atres_error(int16_t what) {
  return atres_create(AT_SEV_ERROR, what);
}

inline ATRes atres_warn(int16_t what) { return atres_create(AT_SEV_WARN, what); }

/// OK result
inline ATRes atres_init() { return ATRes{}; }

inline bool atres_equal(ATRes lhs, ATRes rhs) { return lhs._val == rhs._val; }

inline bool operator==(ATRes lhs, ATRes rhs) { return atres_equal(lhs, rhs); }

// errors are the unlikely path
#define IsATResNotOK(res) unlikely((res)._sev != AT_SEV_OK)
#define IsATResOK(res) likely((res)._sev == AT_SEV_OK)
#define IsATResFatal(res) unlikely((res)._sev == AT_SEV_ERROR)

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "logger.hpp"

class LogHandle {
public:
  explicit LogHandle(int lvl = afltriage::LL_DEBUG) {
    afltriage::LOG_open(afltriage::LOG_STDERR, nullptr);
    afltriage::LOG_setlevel(lvl);
  }
  ~LogHandle() { afltriage::LOG_close(); }
};

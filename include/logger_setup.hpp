// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <span>
#include <string_view>

namespace afltriage {

/// Returns index to element that matches str (case insensitive), otherwise -1
int arg_which(std::string_view str, std::span<const std::string_view> str_set);

/// log_mode: stdout, stderr, syslog, disabled or a file path
/// log_level: debug, informational, notice, warn, error
void setup_logger(const char *log_mode, const char *log_level);

} // namespace afltriage

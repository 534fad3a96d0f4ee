// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstddef>
#include <span>

namespace afltriage {
/// GDB python triage script linked into the binary (gdb/triage.py)
std::span<const std::byte> triage_script_data();
} // namespace afltriage

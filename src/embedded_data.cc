// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "embedded_data.hpp"

// NOLINTBEGIN(bugprone-reserved-identifier,cert-dcl37-c*,cert-dcl51-c*)
// symbols created by `ld -r -b binary triage.py`
extern "C" const char _binary_triage_py_start[];
extern "C" const char _binary_triage_py_end[];
// NOLINTEND(bugprone-reserved-identifier,cert-dcl37-c*,cert-dcl51-c*)

namespace afltriage {
std::span<const std::byte> triage_script_data() {
  return as_bytes(std::span{_binary_triage_py_start, _binary_triage_py_end});
}
} // namespace afltriage

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"

#include <string>
#include <string_view>

namespace afltriage {

/// Pair of sentinels bracketing a region of the debugger output.
/// Markers are always printed on their own line.
struct Marker {
  std::string start;
  std::string end;
};

/// "----<tag>_START----" / "----<tag>_END----"
Marker build_marker(std::string_view tag);

/// Brackets the output of the triaged program (on stdout and stderr)
const Marker &marker_child_output();

/// Brackets the triage script JSON (stdout) and its errors (stderr)
const Marker &marker_backtrace();

/// Extract the text between the first start sentinel and the first end
/// sentinel. The newline following the start sentinel is skipped; nothing
/// else is trimmed. `payload` points into `text`.
/// Errors: AT_WHAT_MARKER_NOT_FOUND, AT_WHAT_MARKERS_OUT_OF_ORDER
ATRes extract_marker(std::string_view text, const Marker &marker,
                     std::string_view &payload);

} // namespace afltriage

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "marker.hpp"

#include "atres_helpers.hpp"
#include "constants.hpp"

#include <absl/strings/str_cat.h>

namespace afltriage {

Marker build_marker(std::string_view tag) {
  return {absl::StrCat("----", tag, "_START----"),
          absl::StrCat("----", tag, "_END----")};
}

const Marker &marker_child_output() {
  static const Marker marker = build_marker(k_marker_tag_child_output);
  return marker;
}

const Marker &marker_backtrace() {
  static const Marker marker = build_marker(k_marker_tag_backtrace);
  return marker;
}

ATRes extract_marker(std::string_view text, const Marker &marker,
                     std::string_view &payload) {
  size_t start_idx = text.find(marker.start);
  if (start_idx == std::string_view::npos) {
    ATRES_RETURN_ERROR_LOG(AT_WHAT_MARKER_NOT_FOUND, "Could not find %s",
                           marker.start.c_str());
  }
  size_t const end_idx = text.find(marker.end);
  if (end_idx == std::string_view::npos) {
    ATRES_RETURN_ERROR_LOG(AT_WHAT_MARKER_NOT_FOUND, "Could not find %s",
                           marker.end.c_str());
  }

  // markers are printed followed by a newline
  start_idx += marker.start.size() + 1;
  if (start_idx > end_idx) {
    ATRES_RETURN_ERROR_LOG(AT_WHAT_MARKERS_OUT_OF_ORDER,
                           "Start marker and end marker out-of-order (%s)",
                           marker.start.c_str());
  }

  payload = text.substr(start_idx, end_idx - start_idx);
  return {};
}

} // namespace afltriage

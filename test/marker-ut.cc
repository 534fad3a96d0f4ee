// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "atres.hpp"
#include "loghandle.hpp"
#include "marker.hpp"

#include <absl/strings/str_cat.h>

namespace afltriage {

TEST(Marker, Build) {
  Marker const marker = build_marker("TAG");
  EXPECT_EQ(marker.start, "----TAG_START----");
  EXPECT_EQ(marker.end, "----TAG_END----");
}

TEST(Marker, DistinctSentinels) {
  const Marker &child = marker_child_output();
  const Marker &backtrace = marker_backtrace();
  const std::string *sentinels[] = {&child.start, &child.end,
                                    &backtrace.start, &backtrace.end};
  for (const auto *lhs : sentinels) {
    for (const auto *rhs : sentinels) {
      if (lhs == rhs) {
        continue;
      }
      EXPECT_NE(*lhs, *rhs);
      EXPECT_EQ(lhs->find(*rhs), std::string::npos)
          << *rhs << " is contained in " << *lhs;
    }
  }
}

TEST(Marker, Extract) {
  LogHandle handle;
  const Marker &marker = marker_backtrace();
  std::string const text = absl::StrCat("noise\n", marker.start, "\n",
                                        "{\"a\": 1}\n", marker.end, "\ntail");
  std::string_view payload;
  ATRes const res = extract_marker(text, marker, payload);
  ASSERT_TRUE(IsATResOK(res));
  EXPECT_EQ(payload, "{\"a\": 1}\n");
}

TEST(Marker, ExtractEmptyRegion) {
  LogHandle handle;
  const Marker &marker = marker_child_output();
  std::string const text = absl::StrCat(marker.start, "\n", marker.end, "\n");
  std::string_view payload = "untouched";
  ASSERT_TRUE(IsATResOK(extract_marker(text, marker, payload)));
  EXPECT_TRUE(payload.empty());
}

TEST(Marker, FirstOccurrenceWins) {
  LogHandle handle;
  const Marker &marker = marker_child_output();
  std::string const text =
      absl::StrCat(marker.start, "\none\n", marker.end, "\n", marker.start,
                   "\ntwo\n", marker.end, "\n");
  std::string_view payload;
  ASSERT_TRUE(IsATResOK(extract_marker(text, marker, payload)));
  EXPECT_EQ(payload, "one\n");
}

TEST(Marker, NotFound) {
  LogHandle handle;
  const Marker &marker = marker_child_output();
  std::string_view payload;
  EXPECT_EQ(extract_marker("no markers here", marker, payload),
            atres_error(AT_WHAT_MARKER_NOT_FOUND));
  // start without end
  EXPECT_EQ(extract_marker(absl::StrCat(marker.start, "\ndata\n"), marker,
                           payload),
            atres_error(AT_WHAT_MARKER_NOT_FOUND));
  // end without start
  EXPECT_EQ(
      extract_marker(absl::StrCat("data\n", marker.end), marker, payload),
      atres_error(AT_WHAT_MARKER_NOT_FOUND));
}

TEST(Marker, OutOfOrder) {
  LogHandle handle;
  const Marker &marker = marker_backtrace();
  std::string_view payload;
  EXPECT_EQ(extract_marker(absl::StrCat(marker.end, "\n", marker.start, "\n"),
                           marker, payload),
            atres_error(AT_WHAT_MARKERS_OUT_OF_ORDER));
  // no room for the newline following the start sentinel
  EXPECT_EQ(
      extract_marker(absl::StrCat(marker.start, marker.end), marker, payload),
      atres_error(AT_WHAT_MARKERS_OUT_OF_ORDER));
}

} // namespace afltriage

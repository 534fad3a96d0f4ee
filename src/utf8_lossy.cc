// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "utf8_lossy.hpp"

#include <cstdint>

namespace afltriage {

namespace {
constexpr std::string_view k_replacement_char = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at pos (0 if ill-formed).
// On failure, `consumed` holds the length of the maximal invalid subpart.
size_t valid_sequence_length(std::string_view bytes, size_t pos,
                             size_t &consumed) {
  auto const b0 = static_cast<uint8_t>(bytes[pos]);
  consumed = 1;
  if (b0 < 0x80) {
    return 1;
  }
  size_t len = 0;
  uint8_t lo = 0x80;
  uint8_t hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) {
      lo = 0xA0;
    } else if (b0 == 0xED) {
      hi = 0x9F; // surrogates
    }
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) {
      lo = 0x90;
    } else if (b0 == 0xF4) {
      hi = 0x8F;
    }
  } else {
    return 0;
  }

  for (size_t i = 1; i < len; ++i) {
    if (pos + i >= bytes.size()) {
      return 0;
    }
    auto const b = static_cast<uint8_t>(bytes[pos + i]);
    if (b < lo || b > hi) {
      return 0;
    }
    // only the second byte has a restricted range
    lo = 0x80;
    hi = 0xBF;
    consumed = i + 1;
  }
  return len;
}
} // namespace

std::string decode_utf8_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  size_t pos = 0;
  while (pos < bytes.size()) {
    size_t consumed = 0;
    size_t const len = valid_sequence_length(bytes, pos, consumed);
    if (len) {
      out.append(bytes.substr(pos, len));
      pos += len;
    } else {
      out.append(k_replacement_char);
      pos += consumed;
    }
  }
  return out;
}

} // namespace afltriage

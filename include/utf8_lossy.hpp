// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

namespace afltriage {

/// Copy `bytes`, replacing each ill-formed UTF-8 subsequence with U+FFFD
std::string decode_utf8_lossy(std::string_view bytes);

} // namespace afltriage

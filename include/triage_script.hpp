// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"
#include "tempfile.hpp"

#include <string>
#include <variant>

namespace afltriage {

// Embedded script written to a temp file, removed with its holder
struct InternalTriageScript {
  TempFileHolder file;
};

// Script provided by the user, used as is
struct ExternalTriageScript {
  std::string path;
};

/// Python script sourced by GDB to emit the crash JSON.
/// Move-only: the internal variant owns its file on disk.
class TriageScript {
public:
  TriageScript() = default;

  /// Write the embedded script to a fresh temp file
  static ATRes create_internal(TriageScript &script);
  static TriageScript external(std::string path);

  /// Path GDB can source.
  /// External scripts are not supported yet:
  /// AT_WHAT_UNSUPPORTED_SCRIPT_LOCATION
  ATRes path(std::string &path) const;

  [[nodiscard]] bool is_internal() const {
    return std::holds_alternative<InternalTriageScript>(_source);
  }

  [[nodiscard]] const std::string &location() const;

private:
  std::variant<ExternalTriageScript, InternalTriageScript> _source;
};

} // namespace afltriage

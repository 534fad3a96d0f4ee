// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"
#include "constants.hpp"
#include "crash_report.hpp"
#include "triage_script.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace afltriage {

struct GdbVersion {
  std::string gdb;
  std::string python;
};

/// Runs a program under GDB and turns the crash state into a GdbThreadInfo.
/// One blocking GDB process per triage. The triager is immutable once built
/// and can be reused for sequential triages.
class GdbTriager {
public:
  explicit GdbTriager(TriageScript triage_script,
                      std::string gdb = k_default_gdb_exe)
      : _triage_script(std::move(triage_script)), _gdb(std::move(gdb)) {}

  /// Triager using the embedded triage script.
  /// Fails when the script can not be written to disk.
  static ATRes create(std::unique_ptr<GdbTriager> &triager,
                      std::string gdb = k_default_gdb_exe);

  /// Check that GDB runs and has python support. Never fails hard: problems
  /// are logged with the GDB output and false is returned.
  bool has_supported_gdb(GdbVersion *version = nullptr) const;

  /// Run prog_args (program path followed by its arguments) under GDB.
  /// On failure `result` is untouched and `error_details` describes what
  /// went wrong (marker, script errors, parser message and payload).
  ATRes triage_testcase(std::span<const std::string> prog_args,
                        bool show_raw_output, GdbTriageResult &result,
                        std::string &error_details) const;

  [[nodiscard]] const std::string &gdb() const { return _gdb; }
  [[nodiscard]] const TriageScript &triage_script() const {
    return _triage_script;
  }

private:
  TriageScript _triage_script;
  std::string _gdb;
};

/// GDB arguments up to and including "--args"; the program follows
std::vector<std::string> build_gdb_triage_args(std::string_view script_path);

/// Arguments of the version / python sanity check
std::vector<std::string> build_gdb_sanity_args();

/// Slice decoded GDB output on the markers and parse the triage payload.
/// The child status is the stop status found in the payload, status_code
/// (the debugger exit status) when there is none.
ATRes parse_gdb_output(std::string_view gdb_stdout,
                       std::string_view gdb_stderr, int status_code,
                       GdbTriageResult &result, std::string &error_details);

} // namespace afltriage

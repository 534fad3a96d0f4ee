// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "gdb_triager.hpp"

#include "atres_helpers.hpp"
#include "marker.hpp"
#include "run_process.hpp"
#include "utf8_lossy.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <cstdio>
#include <optional>

namespace afltriage {

namespace {
constexpr std::string_view k_sanity_check_cmd =
    "python import gdb, sys; "
    "print('V:'+gdb.execute('show version', to_string=True).splitlines()[0]); "
    "print('P:'+sys.version.splitlines()[0].strip())";

// Write the marker to both stdout and stderr: they are not interleaved
std::string marker_cmd(std::string_view marker) {
  return absl::StrCat("python [x.write('", marker,
                      "\\n') for x in [sys.stdout, sys.stderr]]");
}

// Rest of the line following the first occurrence of prefix
std::optional<std::string_view> find_prefixed_line(std::string_view text,
                                                   std::string_view prefix) {
  size_t const pos = text.find(prefix);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view line = text.substr(pos + prefix.size());
  line = line.substr(0, line.find('\n'));
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

ATRes extract_region(std::string_view text, const Marker &marker,
                     int16_t what, std::string_view region_name,
                     std::string_view &payload, std::string &error_details) {
  ATRes const res = extract_marker(text, marker, payload);
  if (IsATResNotOK(res)) {
    ATRES_RETURN_ERROR_DETAILS(
        what, error_details,
        absl::StrCat("Could not extract ", region_name, ": ",
                     atres_error_message(res._what), " (", marker.start,
                     " / ", marker.end, ")"));
  }
  return {};
}
} // namespace

std::vector<std::string> build_gdb_triage_args(std::string_view script_path) {
  return {"--batch",
          "--nx",
          "-iex",
          "set index-cache on",
          "-iex",
          absl::StrCat("set index-cache directory ", k_gdb_index_cache_dir),
          "-ex",
          marker_cmd(marker_child_output().start),
          "-ex",
          "set logging file /dev/null",
          "-ex",
          "set logging redirect on",
          "-ex",
          "set logging on",
          "-ex",
          "run",
          "-ex",
          "set logging redirect off",
          "-ex",
          "set logging off",
          "-ex",
          marker_cmd(marker_child_output().end),
          "-ex",
          marker_cmd(marker_backtrace().start),
          "-x",
          std::string{script_path},
          "-ex",
          marker_cmd(marker_backtrace().end),
          "--args"};
}

std::vector<std::string> build_gdb_sanity_args() {
  return {"--nx", "--batch", "-iex", std::string{k_sanity_check_cmd}};
}

ATRes GdbTriager::create(std::unique_ptr<GdbTriager> &triager,
                         std::string gdb) {
  TriageScript script;
  ATRES_CHECK_FWD(TriageScript::create_internal(script));
  triager = std::make_unique<GdbTriager>(std::move(script), std::move(gdb));
  return {};
}

bool GdbTriager::has_supported_gdb(GdbVersion *version) const {
  std::vector<std::string> const gdb_args = build_gdb_sanity_args();
  ProcessOutput output;
  if (IsATResNotOK(run_process(_gdb, gdb_args, output))) {
    LG_ERR("[X] Failed to execute '%s'", _gdb.c_str());
    return false;
  }

  std::string const decoded_stdout = decode_utf8_lossy(output.out);
  std::string const decoded_stderr = decode_utf8_lossy(output.err);

  auto gdb_version = find_prefixed_line(decoded_stdout, "V:");
  auto python_version = find_prefixed_line(decoded_stdout, "P:");

  if (!output.exit_success() || !gdb_version || !python_version) {
    LG_ERR("[X] GDB sanity check failure");
    // gdb output can exceed the log line size
    std::string const dump =
        absl::StrCat("ARGS:", absl::StrJoin(gdb_args, " "), "\nSTDOUT: ",
                     decoded_stdout, "\nSTDERR: ", decoded_stderr, "\n");
    fwrite(dump.data(), 1, dump.size(), stderr);
    fflush(stderr);
    return false;
  }

  PRINT_NFO("[+] GDB is working (%.*s - Python %.*s)",
            static_cast<int>(gdb_version->size()), gdb_version->data(),
            static_cast<int>(python_version->size()), python_version->data());
  if (version) {
    version->gdb = std::string{*gdb_version};
    version->python = std::string{*python_version};
  }
  return true;
}

ATRes GdbTriager::triage_testcase(std::span<const std::string> prog_args,
                                  bool show_raw_output,
                                  GdbTriageResult &result,
                                  std::string &error_details) const {
  std::string script_path;
  if (IsATResNotOK(_triage_script.path(script_path))) {
    error_details = absl::StrCat("Unsupported triage script path: ",
                                 _triage_script.location());
    return atres_error(AT_WHAT_UNSUPPORTED_SCRIPT_LOCATION);
  }
  if (prog_args.empty()) {
    ATRES_RETURN_ERROR_DETAILS(AT_WHAT_ARGUMENT, error_details,
                               "No program to triage");
  }

  std::vector<std::string> const gdb_args = build_gdb_triage_args(script_path);
  std::vector<std::string> full_args = gdb_args;
  full_args.insert(full_args.end(), prog_args.begin(), prog_args.end());

  ProcessOutput output;
  ATRes const run_res = run_process(_gdb, full_args, output);
  if (IsATResNotOK(run_res)) {
    error_details = absl::StrCat("Failed to execute GDB command '", _gdb,
                                 "': ", atres_error_message(run_res._what));
    return run_res;
  }

  std::string const decoded_stdout = decode_utf8_lossy(output.out);
  std::string const decoded_stderr = decode_utf8_lossy(output.err);

  if (show_raw_output) {
    std::string const raw = absl::StrCat(
        "--- RAW GDB OUTPUT ---\nGDB ARGS: ", absl::StrJoin(gdb_args, " "),
        "\nPROGRAM ARGS: ", absl::StrJoin(prog_args, " "), "\nSTDOUT:\n",
        decoded_stdout, "\nSTDERR:\n", decoded_stderr, "\n");
    fwrite(raw.data(), 1, raw.size(), stdout);
    fflush(stdout);
  }

  return parse_gdb_output(decoded_stdout, decoded_stderr, output.exit_code(),
                          result, error_details);
}

ATRes parse_gdb_output(std::string_view gdb_stdout,
                       std::string_view gdb_stderr, int status_code,
                       GdbTriageResult &result, std::string &error_details) {
  std::string_view child_stdout;
  std::string_view child_stderr;
  std::string_view backtrace_output;
  std::string_view backtrace_errors;

  ATRES_CHECK_FWD(extract_region(gdb_stdout, marker_child_output(),
                                 AT_WHAT_CHILD_STDOUT, "child stdout",
                                 child_stdout, error_details));
  ATRES_CHECK_FWD(extract_region(gdb_stderr, marker_child_output(),
                                 AT_WHAT_CHILD_STDERR, "child stderr",
                                 child_stderr, error_details));
  ATRES_CHECK_FWD(extract_region(gdb_stdout, marker_backtrace(),
                                 AT_WHAT_TRIAGE_JSON, "triage JSON",
                                 backtrace_output, error_details));
  ATRES_CHECK_FWD(extract_region(gdb_stderr, marker_backtrace(),
                                 AT_WHAT_TRIAGE_ERRORS, "triage errors",
                                 backtrace_errors, error_details));

  if (!backtrace_errors.empty()) {
    ATRES_RETURN_ERROR_DETAILS(
        AT_WHAT_TRIAGE_SCRIPT, error_details,
        absl::StrCat("Triage script emitted errors: ", backtrace_errors));
  }

  GdbThreadInfo thread_info;
  std::string parse_error;
  if (IsATResNotOK(
          parse_thread_info(backtrace_output, thread_info, parse_error))) {
    error_details =
        absl::StrCat("Failed to parse triage JSON from GDB: ", parse_error,
                     "\nPAYLOAD:\n", backtrace_output);
    return atres_error(AT_WHAT_PAYLOAD_PARSE);
  }

  int const child_status = thread_info.stop_status.value_or(status_code);
  result.thread_info = std::move(thread_info);
  result.child = GdbChildResult{std::string{child_stdout},
                                std::string{child_stderr}, child_status};
  return {};
}

} // namespace afltriage

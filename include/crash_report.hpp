// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace afltriage {

inline constexpr int64_t k_unknown_line = -1;

struct GdbSymbol {
  std::string function_name;
  std::string mangled_function_name;
  std::string function_signature;
  std::string file;
  int64_t line{k_unknown_line};

  [[nodiscard]] bool has_line() const { return line >= 0; }
};

// Argument or local, formatted by the debugger
struct GdbVariable {
  std::string type;
  std::string name;
  std::string value;
};

struct GdbFrameInfo {
  int64_t address{0};
  // offset from the load base of the module
  int64_t relative_address{0};
  std::string module;
  std::string pretty_address;
  GdbSymbol symbol;
  std::vector<GdbVariable> args;
  std::vector<GdbVariable> locals;
};

struct GdbThread {
  int32_t tid{0};
  // innermost frame first
  std::vector<GdbFrameInfo> backtrace;
};

struct GdbThreadInfo {
  int32_t current_tid{0};
  std::vector<GdbThread> threads;
  // 128 + signal number the program stopped on, when the script could read it
  std::optional<int> stop_status;

  /// Thread matching current_tid, nullptr if there is none
  [[nodiscard]] const GdbThread *current_thread() const;
};

// Output of the triaged program, as relayed by the debugger
struct GdbChildResult {
  std::string out;
  std::string err;
  // Status of the triaged program: the stop status reported by the script
  // (128 + signal), else the debugger's own exit status
  int status_code{0};
};

struct GdbTriageResult {
  GdbThreadInfo thread_info;
  GdbChildResult child;
};

void from_json(const nlohmann::json &j, GdbSymbol &symbol);
void from_json(const nlohmann::json &j, GdbVariable &var);
void from_json(const nlohmann::json &j, GdbFrameInfo &frame);
void from_json(const nlohmann::json &j, GdbThread &thread);
void from_json(const nlohmann::json &j, GdbThreadInfo &info);

void to_json(nlohmann::json &j, const GdbSymbol &symbol);
void to_json(nlohmann::json &j, const GdbVariable &var);
void to_json(nlohmann::json &j, const GdbFrameInfo &frame);
void to_json(nlohmann::json &j, const GdbThread &thread);
void to_json(nlohmann::json &j, const GdbThreadInfo &info);
void to_json(nlohmann::json &j, const GdbChildResult &child);
void to_json(nlohmann::json &j, const GdbTriageResult &result);

/// Deserialize the triage script payload.
/// On failure, returns AT_WHAT_PAYLOAD_PARSE and sets error_message to the
/// parser message. `info` is only written on success.
ATRes parse_thread_info(std::string_view payload, GdbThreadInfo &info,
                        std::string &error_message);

/// Crash report document: thread info with the child output under "child"
std::string crash_report_to_string(const GdbTriageResult &result,
                                   int indent = 2);

/// Write the crash report to `path`, replacing any existing file
ATRes write_crash_report(const GdbTriageResult &result,
                         const std::string &path);

} // namespace afltriage

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "crash_report.hpp"

#include "atres_helpers.hpp"

#include <absl/strings/str_cat.h>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace afltriage {

using json = nlohmann::json;

namespace {
// Symbols of stripped frames can miss any of these fields
std::string optional_string(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

// get_to() on an integer field wraps values that do not fit the destination
template <typename Int>
Int checked_integer(const json &value, const char *key) {
  if (!value.is_number_integer()) {
    throw std::out_of_range(absl::StrCat(key, " is not an integer"));
  }
  if (value.is_number_unsigned()) {
    auto const u = value.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<Int>::max())) {
      throw std::out_of_range(absl::StrCat(key, " out of range: ", u));
    }
    return static_cast<Int>(u);
  }
  auto const s = value.get<int64_t>();
  if (s < std::numeric_limits<Int>::min() ||
      s > std::numeric_limits<Int>::max()) {
    throw std::out_of_range(absl::StrCat(key, " out of range: ", s));
  }
  return static_cast<Int>(s);
}

template <typename Int>
void get_integer_to(const json &j, const char *key, Int &out) {
  out = checked_integer<Int>(j.at(key), key);
}
} // namespace

const GdbThread *GdbThreadInfo::current_thread() const {
  for (const auto &thread : threads) {
    if (thread.tid == current_tid) {
      return &thread;
    }
  }
  return nullptr;
}

void from_json(const json &j, GdbSymbol &symbol) {
  symbol.function_name = optional_string(j, "function_name");
  symbol.mangled_function_name = optional_string(j, "mangled_function_name");
  symbol.function_signature = optional_string(j, "function_signature");
  symbol.file = optional_string(j, "file");
  auto it = j.find("line");
  symbol.line = (it == j.end() || it->is_null())
      ? k_unknown_line
      : checked_integer<int64_t>(*it, "line");
}

void from_json(const json &j, GdbVariable &var) {
  j.at("type").get_to(var.type);
  j.at("name").get_to(var.name);
  j.at("value").get_to(var.value);
}

void from_json(const json &j, GdbFrameInfo &frame) {
  get_integer_to(j, "address", frame.address);
  get_integer_to(j, "relative_address", frame.relative_address);
  j.at("module").get_to(frame.module);
  j.at("pretty_address").get_to(frame.pretty_address);
  j.at("symbol").get_to(frame.symbol);
  j.at("args").get_to(frame.args);
  j.at("locals").get_to(frame.locals);
}

void from_json(const json &j, GdbThread &thread) {
  get_integer_to(j, "tid", thread.tid);
  j.at("backtrace").get_to(thread.backtrace);
}

void from_json(const json &j, GdbThreadInfo &info) {
  get_integer_to(j, "current_tid", info.current_tid);
  j.at("threads").get_to(info.threads);
  auto it = j.find("stop_status");
  if (it != j.end() && !it->is_null()) {
    info.stop_status = checked_integer<int>(*it, "stop_status");
  }
}

void to_json(json &j, const GdbSymbol &symbol) {
  j = json{{"function_name", symbol.function_name},
           {"mangled_function_name", symbol.mangled_function_name},
           {"function_signature", symbol.function_signature},
           {"file", symbol.file},
           {"line", symbol.line}};
}

void to_json(json &j, const GdbVariable &var) {
  j = json{{"type", var.type}, {"name", var.name}, {"value", var.value}};
}

void to_json(json &j, const GdbFrameInfo &frame) {
  j = json{{"address", frame.address},
           {"relative_address", frame.relative_address},
           {"module", frame.module},
           {"pretty_address", frame.pretty_address},
           {"symbol", frame.symbol},
           {"args", frame.args},
           {"locals", frame.locals}};
}

void to_json(json &j, const GdbThread &thread) {
  j = json{{"tid", thread.tid}, {"backtrace", thread.backtrace}};
}

void to_json(json &j, const GdbThreadInfo &info) {
  j = json{{"current_tid", info.current_tid}, {"threads", info.threads}};
}

void to_json(json &j, const GdbChildResult &child) {
  j = json{{"stdout", child.out},
           {"stderr", child.err},
           {"status_code", child.status_code}};
}

void to_json(json &j, const GdbTriageResult &result) {
  j = result.thread_info;
  j["child"] = result.child;
}

ATRes parse_thread_info(std::string_view payload, GdbThreadInfo &info,
                        std::string &error_message) {
  try {
    GdbThreadInfo parsed = json::parse(payload).get<GdbThreadInfo>();
    info = std::move(parsed);
  } catch (const json::exception &e) {
    error_message = e.what();
    ATRES_RETURN_ERROR_LOG(AT_WHAT_PAYLOAD_PARSE,
                           "Unable to parse triage payload: %s", e.what());
  } catch (const std::out_of_range &e) {
    error_message = e.what();
    ATRES_RETURN_ERROR_LOG(AT_WHAT_PAYLOAD_PARSE,
                           "Unable to parse triage payload: %s", e.what());
  }
  return {};
}

std::string crash_report_to_string(const GdbTriageResult &result, int indent) {
  // debugger output is not guaranteed to be valid UTF-8
  return json(result).dump(indent, ' ', false,
                           json::error_handler_t::replace);
}

ATRes write_crash_report(const GdbTriageResult &result,
                         const std::string &path) {
  std::ofstream out_file(path, std::ios::out | std::ios::trunc);
  if (!out_file) {
    ATRES_RETURN_ERROR_LOG(AT_WHAT_REPORT, "Unable to open report file %s",
                           path.c_str());
  }
  out_file << crash_report_to_string(result) << '\n';
  out_file.close();
  if (!out_file) {
    ATRES_RETURN_ERROR_LOG(AT_WHAT_REPORT, "Unable to write report file %s",
                           path.c_str());
  }
  LG_NTC("Wrote crash report %s", path.c_str());
  return {};
}

} // namespace afltriage

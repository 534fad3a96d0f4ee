// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "triage_script.hpp"

#include "atres_helpers.hpp"
#include "constants.hpp"
#include "embedded_data.hpp"

namespace afltriage {

ATRes TriageScript::create_internal(TriageScript &script) {
  std::string path;
  ATRES_CHECK_FWD(create_temp_file(k_triage_script_prefix,
                                   triage_script_data(), 0600, path,
                                   k_triage_script_suffix));
  LG_DBG("Triage script written to %s", path.c_str());
  script._source = InternalTriageScript{TempFileHolder{std::move(path), true}};
  return {};
}

TriageScript TriageScript::external(std::string path) {
  TriageScript script;
  script._source = ExternalTriageScript{std::move(path)};
  return script;
}

ATRes TriageScript::path(std::string &path) const {
  if (const auto *internal = std::get_if<InternalTriageScript>(&_source)) {
    path = internal->file.path();
    return {};
  }
  // TODO: pass external scripts to GDB once their location can be validated
  ATRES_RETURN_ERROR_LOG(AT_WHAT_UNSUPPORTED_SCRIPT_LOCATION,
                         "Unsupported triage script path %s",
                         location().c_str());
}

const std::string &TriageScript::location() const {
  if (const auto *internal = std::get_if<InternalTriageScript>(&_source)) {
    return internal->file.path();
  }
  return std::get<ExternalTriageScript>(_source).path;
}

} // namespace afltriage

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "afltriage_cli.hpp"
#include "atres.hpp"
#include "crash_report.hpp"
#include "gdb_triager.hpp"
#include "logger.hpp"
#include "logger_setup.hpp"
#include "testcase.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace afltriage;
namespace fs = std::filesystem;

namespace afltriage {

namespace {

ATRes make_triager(const AflTriageCLI &cli,
                   std::unique_ptr<GdbTriager> &triager) {
  if (!cli.script.empty()) {
    triager =
        std::make_unique<GdbTriager>(TriageScript::external(cli.script));
    return {};
  }
  return GdbTriager::create(triager);
}

ATRes prepare_output_dir(const AflTriageCLI &cli) {
  if (cli.print_reports_to_stdout()) {
    return {};
  }
  std::error_code ec;
  fs::create_directories(cli.output, ec);
  ATRES_CHECK_ERRORCODE(ec, AT_WHAT_REPORT,
                        "Unable to create output directory %s",
                        cli.output.c_str());
  return {};
}

// Triage one invocation and emit its report. testcase is empty when the
// command line is triaged as is.
ATRes triage_one_impl(const AflTriageCLI &cli, const GdbTriager &triager,
                      const std::string &testcase,
                      const std::string &report) {
  std::vector<std::string> const prog_args = testcase.empty()
      ? cli.command_line
      : substitute_testcase(cli.command_line, testcase);

  GdbTriageResult result;
  std::string error_details;
  ATRes const res = triager.triage_testcase(prog_args, cli.raw_output, result,
                                            error_details);
  if (IsATResNotOK(res)) {
    LG_ERR("[X] Triage failed for %s: %s",
           testcase.empty() ? prog_args[0].c_str() : testcase.c_str(),
           error_details.c_str());
    return res;
  }

  const GdbThread *current = result.thread_info.current_thread();
  LG_NTC("[+] Triaged %s (%zu threads, %zu frames in current thread)",
         testcase.empty() ? prog_args[0].c_str() : testcase.c_str(),
         result.thread_info.threads.size(),
         current ? current->backtrace.size() : 0);

  if (cli.print_reports_to_stdout()) {
    std::string const document = crash_report_to_string(result);
    printf("%s\n", document.c_str());
    fflush(stdout);
    return {};
  }
  ATRES_CHECK_FWD(write_crash_report(result, report));
  return {};
}

// A failing testcase (filesystem error, allocation...) must not stop the
// triage of the others
ATRes triage_one(const AflTriageCLI &cli, const GdbTriager &triager,
                 const std::string &testcase, const std::string &report) {
  try {
    return triage_one_impl(cli, triager, testcase, report);
  }
  CatchExcept2ATRes();
  return {};
}

int run_triage(const AflTriageCLI &cli) {
  std::unique_ptr<GdbTriager> triager;
  if (IsATResNotOK(make_triager(cli, triager))) {
    LG_ERR("Unable to set up the triage script");
    return 1;
  }

  if (!cli.skip_sanity_check && !triager->has_supported_gdb()) {
    LG_ERR("GDB is not usable for triage");
    return 1;
  }

  std::vector<std::string> testcases;
  if (IsATResNotOK(collect_testcases(cli.inputs, testcases)) ||
      IsATResNotOK(prepare_output_dir(cli))) {
    return 1;
  }

  if (cli.inputs.empty()) {
    std::string const report = cli.command_line.empty()
        ? std::string{}
        : report_path(cli.output, cli.command_line[0]);
    return IsATResOK(triage_one(cli, *triager, {}, report)) ? 0 : 1;
  }

  std::vector<std::string> const reports = report_paths(cli.output, testcases);
  size_t failures = 0;
  for (size_t i = 0; i < testcases.size(); ++i) {
    if (IsATResNotOK(triage_one(cli, *triager, testcases[i], reports[i]))) {
      ++failures;
    }
  }
  PRINT_NFO("Triaged %zu/%zu testcases", testcases.size() - failures,
            testcases.size());
  return failures == 0 ? 0 : 1;
}

} // namespace
} // namespace afltriage

/**************************** Program Entry Point *****************************/
int main(int argc, char *argv[]) {
  AflTriageCLI cli;
  int const res = cli.parse(argc, const_cast<const char **>(argv));
  if (!cli.continue_exec) {
    return res;
  }

  setup_logger(cli.log_mode.c_str(), cli.log_level.c_str());
  if (cli.show_config) {
    cli.print();
  }

  int const ret = run_triage(cli);
  LOG_close();
  return ret;
}

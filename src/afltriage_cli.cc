// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "afltriage_cli.hpp"

#include "constants.hpp"
#include "logger.hpp"
#include "testcase.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <absl/strings/str_join.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace afltriage {

namespace {
std::string get_default_config_file() {
  // The CLI docs says config files are compatible with envname, however the
  // _process_env function is called after the file function
  // Hence this hack to set the default to the actual env variable
  if (char *env_config_path = std::getenv(k_config_env_variable);
      env_config_path != nullptr) {
    return env_config_path;
  }
  return "./afltriage.toml";
}

void write_config_file(const CLI::App &app, const std::string &file_path) {
  std::ofstream out_file;
  out_file.open(file_path);
  if (!out_file) {
    // logger is not configured
    (void)fprintf(stderr, MYNAME ": cannot open the file %s\n",
                  file_path.c_str());
    return;
  }
  out_file << app.config_to_str();
  out_file.close();
}
} // namespace

int AflTriageCLI::parse(int argc, const char *argv[]) {
  std::string capture_config;
  CLI::App app{MYNAME " runs a crashing program under GDB and reports the "
                      "state of its threads (backtraces, symbols, arguments "
                      "and locals) as JSON.\n"
                      " eg: " MYNAME " -i crashes/ -o reports/ "
                      "./fuzz_target @@\n",
               MYNAME};

  app.add_option("command_line", command_line,
                 "Program to triage (including arguments).\n"
                 "@@ is replaced by the path of each testcase.");
  app.positionals_at_end();

  app.add_option("--input,-i", inputs,
                 "Testcase file or directory of testcases.\n"
                 "Without inputs, the command line is triaged once.")
      ->allow_extra_args(false)
      ->group("Triage settings");
  app.add_option("--output,-o", output,
                 "Directory receiving one <testcase>.json report per "
                 "testcase.\n"
                 "Reports are printed on stdout when empty or '-'.")
      ->envname(k_output_env_variable)
      ->group("Triage settings");
  app.add_option("--script", script,
                 "Use an external GDB triage script instead of the embedded "
                 "one.")
      ->group("Triage settings");
  app.add_flag("--raw_output,--raw-output", raw_output,
               "Display the raw GDB output of each run.")
      ->group("Triage settings");
  app.add_flag("--skip_sanity_check,--skip-sanity-check", skip_sanity_check,
               "Do not check the GDB installation before triaging.")
      ->group("Triage settings");

  // allow configuration files - default is local toml file
  app.set_config("--config", get_default_config_file(),
                 "A configuration file\n"
                 "Check the capture_config to generate the initial file")
      ->group("Advanced settings");

  // Debug
  app.add_option("--log_level,--log-level,-l", log_level,
                 "One of debug, informational, notice, warn, error.")
      ->default_val("warn")
      ->check(
          CLI::IsMember({"debug", "informational", "notice", "warn", "error"}))
      ->group("Debug options")
      ->envname(k_log_level_env_variable);
  app.add_option("--log_mode,--log-mode", log_mode,
                 "One of stdout, stderr, syslog, disabled or a file path.")
      ->default_val("stderr")
      ->group("Debug options")
      ->envname(k_log_mode_env_variable);
  app.add_flag("--show_config,--show-config", show_config,
               "Display the configuration.")
      ->default_val(false)
      ->group("Debug options");
  app.add_flag("--version,-v", version, "Display the version.\n")
      ->group("Debug options");
  app.add_option("--capture_config,--capture-config", capture_config,
                 "Capture the current configuration to a file.\n"
                 "You can then give this configuration through --config.\n")
      ->group("Debug options");

  CLI11_PARSE(app, argc, argv);

  if (!capture_config.empty()) {
    write_config_file(app, capture_config);
  }

  if (version) {
    printf(MYNAME " %.*s\n", static_cast<int>(k_version.size()),
           k_version.data());
    return static_cast<int>(CLI::ExitCodes::Success);
  }

  if (command_line.empty()) {
    (void)fprintf(stderr, "Please specify a program to triage\n");
    return static_cast<int>(CLI::ExitCodes::RequiredError);
  }

  if (!inputs.empty() && !has_testcase_placeholder(command_line)) {
    (void)fprintf(stderr,
                  "Testcases were given but the command line has no %s "
                  "placeholder\n",
                  k_testcase_placeholder);
    return static_cast<int>(CLI::ExitCodes::RequiredError);
  }

  continue_exec = true;
  return static_cast<int>(CLI::ExitCodes::Success);
}

void AflTriageCLI::print() const {
  PRINT_NFO("Version: %.*s", static_cast<int>(k_version.size()),
            k_version.data());
  PRINT_NFO("Triage options:");
  PRINT_NFO("  - command line: [%s]",
            absl::StrJoin(command_line, ", ").c_str());
  if (!inputs.empty()) {
    PRINT_NFO("  - inputs:");
    for (const auto &input : inputs) {
      PRINT_NFO("    - %s", input.c_str());
    }
  }
  PRINT_NFO("  - output: %s",
            print_reports_to_stdout() ? "stdout" : output.c_str());
  if (!script.empty()) {
    PRINT_NFO("  - script: %s", script.c_str());
  }
  PRINT_NFO("  - raw_output: %s", raw_output ? "true" : "false");
  PRINT_NFO("  - skip_sanity_check: %s", skip_sanity_check ? "true" : "false");
  PRINT_NFO("Debug:");
  PRINT_NFO("  - log_level: %s", log_level.c_str());
  PRINT_NFO("  - log_mode: %s", log_mode.c_str());
}

} // namespace afltriage

// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

// Debugger executable used when none is given to the triager
inline constexpr const char *k_default_gdb_exe = "gdb";

// Tags of the markers bracketing the regions of the debugger output
inline constexpr const char *k_marker_tag_child_output =
    "AFLTRIAGE_CHILD_OUTPUT";
inline constexpr const char *k_marker_tag_backtrace = "AFLTRIAGE_BACKTRACE";

// Prefix of the temporary file holding the embedded triage script
inline constexpr const char *k_triage_script_prefix = "afltriage-triage";
inline constexpr const char *k_triage_script_suffix = ".py";

// Directory (relative to the working directory) of the GDB index cache
inline constexpr const char *k_gdb_index_cache_dir = "gdb_cache";

// Placeholder replaced by the testcase path in the target command line
inline constexpr const char *k_testcase_placeholder = "@@";

// Environment variables
inline constexpr const char *k_config_env_variable = "AFLTRIAGE_CONFIG";
inline constexpr const char *k_output_env_variable = "AFLTRIAGE_OUTPUT";
inline constexpr const char *k_log_level_env_variable = "AFLTRIAGE_LOG_LEVEL";
inline constexpr const char *k_log_mode_env_variable = "AFLTRIAGE_LOG_MODE";

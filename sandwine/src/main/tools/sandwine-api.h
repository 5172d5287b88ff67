/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

// This header contains the APIs for C++ only and thus we can
// use std::string and std::vector

#ifndef SRC_MAIN_TOOLS_SANDWINE_API_H_
#define SRC_MAIN_TOOLS_SANDWINE_API_H_

#include <string>
#include <vector>

// Parses sandwine's command line arguments (without the program name) into
// the configuration used by the calls below. Can be called again after
// sandwine_reset().
int sandwine_parse_arguments(const std::vector<std::string>& args);

// Fills `argv` with the bubblewrap command line for the parsed configuration
// without running anything. A nested X11 display number is picked but no
// server is started.
int sandwine_create_bwrap_argv(std::vector<std::string>& argv);

// Runs the sandbox and returns the exit code of the sandboxed program.
int sandwine_start();

// Returns error code and error messages
int sandwine_get_last_error_code();
const char* sandwine_get_last_error_msg();

// Forgets the parsed configuration and the last error, and closes the log
// file opened for -D.
void sandwine_reset();

#endif  // SRC_MAIN_TOOLS_SANDWINE_API_H_

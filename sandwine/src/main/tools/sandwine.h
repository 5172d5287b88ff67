/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_SANDWINE_H_
#define SRC_MAIN_TOOLS_SANDWINE_H_

#include "src/main/tools/argv-builder.h"
#include "src/main/tools/sandwine-options.h"

// Fails with ErrorCode::BubblewrapTooOld unless `bwrap --disable-userns` is
// understood, which needs bubblewrap 0.8.0.
int RequireRecentBubblewrap();

// Turns X11Mode::AUTO into a concrete server and picks the display number.
int ResolveX11Display(Options& config);

// Resolves the X11 display and builds the bubblewrap command line for `config`.
int SandwineCreateBwrapArgv(Options& config, ArgvBuilder& argv);

// Runs `argv` and waits for it. SIGTERM is passed on to it, SIGINT kills it
// and makes the exit code 128 + SIGINT.
int RunSupervised(const std::vector<std::string>& argv, int* exit_code);

// Runs the sandbox described by the global opt struct and returns the exit code
// of the sandboxed program. ParseOptions() must have been called.
int SandwineStart();

// Stops a nested X11 server and the sandbox if they are still running. Called
// before the process exits on an error.
void Cleanup();

#endif  // SRC_MAIN_TOOLS_SANDWINE_H_

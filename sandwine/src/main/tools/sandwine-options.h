// Copyright 2016 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_SANDWINE_OPTIONS_H_
#define SRC_MAIN_TOOLS_SANDWINE_OPTIONS_H_

#include <stdbool.h>
#include <stddef.h>

#include <string>
#include <vector>

#include "src/main/tools/x11.h"

#ifndef SANDWINE_VERSION
#define SANDWINE_VERSION "unknown"
#endif

// Options parsing result.
struct Options {
  // Program to run (PROGRAM), empty if none was given
  std::string argv_0;
  // Arguments passed to the program (ARG ..)
  std::vector<std::string> argv_1_plus;
  // Which X11 server to use, if any (--x11, --xephyr, ...)
  X11Mode x11 = X11Mode::NONE;
  // Display number, resolved once the X11 mode is known
  int x11_display_number = -1;
  // Share the host network (--network)
  bool network = false;
  // Give access to the PulseAudio socket (--pulseaudio)
  bool pulseaudio = false;
  // PATH:{ro,rw} to use for ~/.wine, empty for a tmpfs (--dotwine)
  std::string dotwine;
  // PATH:{ro,rw} entries to bind on themselves (--pass)
  std::vector<std::string> extra_binds;
  // Force running winecfg first (--configure)
  bool configure = false;
  // Wrap the program in a pseudo-terminal (--no-pty disables)
  bool with_pty = true;
  // Run the program through wine (--no-wine disables)
  bool with_wine = true;
  // Run the program a second time on failure (--retry)
  bool second_try = false;
  // Log file, stderr if empty (-D)
  std::string debug_path;
  // Only log warnings and errors (--quiet)
  bool quiet = false;
  // Print the bubblewrap command but do not run it (--dry-run)
  bool dry_run = false;
  // --help or --version was handled, nothing left to do
  bool exit_after_parse = false;
};

extern struct Options opt;

// Handles parsing all command line flags and populates the global opt struct.
// In CLI mode errors terminate the process with exit code 2, in library mode
// they are recorded and a negative value is returned.
int ParseOptions(int argc, char *argv[]);
int ParseOptions(const std::vector<std::string>& args);

// Restores the defaults, so that options can be parsed again.
void ResetOptions();

#endif  // SRC_MAIN_TOOLS_SANDWINE_OPTIONS_H_

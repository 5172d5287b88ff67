/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_BWRAP_ARGV_H_
#define SRC_MAIN_TOOLS_BWRAP_ARGV_H_

#include <string>
#include <vector>

#include "src/main/tools/argv-builder.h"
#include "src/main/tools/mount-tasks.h"
#include "src/main/tools/sandwine-options.h"

#define HOSTNAME_LENGTH 12
#define WINE_LIBDIR "/usr/lib/wine"

// Shell snippets wrapped around the program. "$0" "$@" is the rest of the
// command line.
#define WINESERVER_WRAPPER \
  "wineserver -p0 && \"$0\" \"$@\" ; ret=$? ; wineserver -k ; exit ${ret}"
#define WINECFG_WRAPPER "winecfg && exec \"$0\" \"$@\""
#define RETRY_WRAPPER "\"$0\" \"$@\" || exec \"$0\" \"$@\""

// Twelve random lowercase hex digits.
std::string RandomHostname();

// Mount stack every sandbox starts from, before any option is applied.
std::vector<MountTask> BaseMountTasks(const std::string& home_dir);

// Translates `config` into a complete bubblewrap command line, appended to
// `argv`. Host paths are checked while the mount stack is emitted: a missing
// required path is reported as ErrorCode::PathDoesNotExist, optional ones are
// dropped. Returns 0 on success.
//
// If X11 is enabled, config.x11_display_number must already be resolved.
int CreateBwrapArgv(const Options& config, ArgvBuilder& argv);

#endif  // SRC_MAIN_TOOLS_BWRAP_ARGV_H_

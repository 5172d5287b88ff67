/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/sandwine-api.h"
#include "src/main/tools/argv-builder.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/sandwine-options.h"
#include "src/main/tools/sandwine.h"

int sandwine_get_last_error_code() {
  return SandwineGetErrorCode();
}


const char* sandwine_get_last_error_msg() {
  return SandwineGetErrorMsg();
}


int sandwine_parse_arguments(const std::vector<std::string>& args) {
  SandwineSetErrorMode(Mode::Library);
  ResetOptions();
  std::vector<std::string> argv = {"sandwine"};
  argv.insert(argv.end(), args.begin(), args.end());
  return ParseOptions(argv);
}


int sandwine_create_bwrap_argv(std::vector<std::string>& argv) {
  SandwineSetErrorMode(Mode::Library);
  ArgvBuilder argv_builder;
  int res = SandwineCreateBwrapArgv(opt, argv_builder);
  if (res < 0) {
    return res;
  }
  argv = argv_builder.Flat();
  return 0;
}


int sandwine_start() {
  SandwineSetErrorMode(Mode::Library);
  return SandwineStart();
}


void sandwine_reset() {
  Cleanup();
  CloseLogFile();
  ResetOptions();
  SandwineClearError();
}

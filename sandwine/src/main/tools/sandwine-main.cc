/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/sandwine-options.h"
#include "src/main/tools/sandwine.h"

int main(int argc, char *argv[]) {
  int exit_code = 0;
  SandwineSetErrorMode(Mode::CLI);
  ParseOptions(argc, argv);
  if (opt.exit_after_parse) {
    return 0;
  }
  exit_code = SandwineStart();
  CloseLogFile();
  return exit_code;
}

/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/argv-builder.h"

#include <ctype.h>
#include <string.h>


static bool IsShellSafe(unsigned char c) {
  return isalnum(c) || strchr("_@%+=:,./-", c) != nullptr;
}


std::string ShellQuote(const std::string& arg) {
  if (arg.empty()) {
    return "''";
  }

  bool safe = true;
  for (unsigned char c : arg) {
    // strchr() would match the terminating NUL.
    if (c == '\0' || !IsShellSafe(c)) {
      safe = false;
      break;
    }
  }
  if (safe) {
    return arg;
  }

  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\"'\"'";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}


std::string ShellJoin(const std::vector<std::string>& args) {
  std::string joined;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      joined += ' ';
    }
    joined += ShellQuote(args[i]);
  }
  return joined;
}


void ArgvBuilder::Add(std::initializer_list<std::string> args) {
  Add(std::vector<std::string>(args));
}


void ArgvBuilder::Add(const std::vector<std::string>& args) {
  if (args.empty()) {
    return;
  }
  groups_.push_back(args);
}


std::vector<std::string> ArgvBuilder::Flat() const {
  std::vector<std::string> flat;
  for (const auto& group : groups_) {
    flat.insert(flat.end(), group.begin(), group.end());
  }
  return flat;
}


void ArgvBuilder::AnnounceTo(FILE* target) const {
  for (size_t i = 0; i < groups_.size(); ++i) {
    const char* prefix = (i == 0) ? "# " : "    ";
    const char* suffix = (i == groups_.size() - 1) ? "" : " \\";
    fprintf(target, "%s%s%s\n", prefix, ShellJoin(groups_[i]).c_str(), suffix);
  }
  fflush(target);
}

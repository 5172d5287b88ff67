/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_ARGV_BUILDER_H_
#define SRC_MAIN_TOOLS_ARGV_BUILDER_H_

#include <stdio.h>

#include <initializer_list>
#include <string>
#include <vector>

// Quotes `arg` for a POSIX shell. Strings made only of safe characters are
// returned as they are.
std::string ShellQuote(const std::string& arg);

// Quotes every element and joins them with single spaces.
std::string ShellJoin(const std::vector<std::string>& args);

// Collects a command line as a list of argument groups. The grouping has no
// meaning for execution; it only keeps related arguments on one line when the
// command is announced.
class ArgvBuilder {
 public:
  // Appends one group. Empty groups are ignored.
  void Add(std::initializer_list<std::string> args);
  void Add(const std::vector<std::string>& args);

  std::vector<std::string> Flat() const;
  const std::vector<std::vector<std::string>>& Groups() const {
    return groups_;
  }

  // Writes the command to `target` as a copy-pasteable shell comment, one
  // group per line:
  //
  //   # bwrap <backslash>
  //       --disable-userns <backslash>
  //       true
  //
  // where every line but the last ends in a backslash.
  void AnnounceTo(FILE* target) const;

 private:
  std::vector<std::vector<std::string>> groups_;
};

#endif  // SRC_MAIN_TOOLS_ARGV_BUILDER_H_

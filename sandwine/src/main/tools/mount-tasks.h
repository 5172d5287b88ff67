/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_MOUNT_TASKS_H_
#define SRC_MAIN_TOOLS_MOUNT_TASKS_H_

#include <string>
#include <vector>

enum class AccessMode { READ_ONLY, READ_WRITE };

enum class MountMode { DEVTMPFS, BIND_RO, BIND_RW, BIND_DEV, TMPFS, PROC };

// One entry of the mount stack handed to bubblewrap. An empty source means
// "same as target" for the bind modes and is ignored otherwise.
struct MountTask {
  MountMode mode;
  std::string target;
  std::string source;
  bool required = true;

  MountTask(MountMode mode, const std::string& target,
            const std::string& source = "", bool required = true)
      : mode(mode), target(target), source(source), required(required) {}

  bool IsBind() const {
    return mode == MountMode::BIND_RO || mode == MountMode::BIND_RW ||
           mode == MountMode::BIND_DEV;
  }
};

// Splits "PATH:ro" / "PATH:rw" at the last colon without reporting an error.
bool SplitPathColonAccess(const std::string& candidate, std::string& path,
                          AccessMode& access);

// Message for a value SplitPathColonAccess() rejects.
std::string PathColonAccessError(const std::string& candidate);

// Splits "PATH:ro" / "PATH:rw" at the last colon. Returns 0 on success,
// otherwise reports ErrorCode::InvalidPathAccess and returns a negative value.
int ParsePathColonAccess(const std::string& candidate, std::string& path,
                         AccessMode& access);

// BIND_RW for READ_WRITE, BIND_RO otherwise.
MountMode BindModeFor(AccessMode access);

// Stable sort by target path, so that parents are mounted before children.
void SortMountTasks(std::vector<MountTask>& tasks);

const char* MountModeName(MountMode mode);

#endif  // SRC_MAIN_TOOLS_MOUNT_TASKS_H_

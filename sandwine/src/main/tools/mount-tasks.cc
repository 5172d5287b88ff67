/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/mount-tasks.h"
#include "src/main/tools/error-handling.h"

#include <algorithm>


std::string PathColonAccessError(const std::string& candidate) {
  return "Value '" + candidate + "' does not match pattern \"PATH:{ro,rw}\".";
}


bool SplitPathColonAccess(const std::string& candidate, std::string& path,
                          AccessMode& access) {
  const size_t colon = candidate.rfind(':');
  if (colon == std::string::npos) {
    return false;
  }

  const std::string access_candidate = candidate.substr(colon + 1);
  if (access_candidate == "ro") {
    access = AccessMode::READ_ONLY;
  } else if (access_candidate == "rw") {
    access = AccessMode::READ_WRITE;
  } else {
    return false;
  }
  path = candidate.substr(0, colon);
  return true;
}


int ParsePathColonAccess(const std::string& candidate, std::string& path,
                         AccessMode& access) {
  if (!SplitPathColonAccess(candidate, path, access)) {
    return SandwineReportErrorAndMessage(PathColonAccessError(candidate),
                                         ErrorCode::InvalidPathAccess);
  }
  return 0;
}


MountMode BindModeFor(AccessMode access) {
  return access == AccessMode::READ_WRITE ? MountMode::BIND_RW
                                          : MountMode::BIND_RO;
}


void SortMountTasks(std::vector<MountTask>& tasks) {
  std::stable_sort(tasks.begin(), tasks.end(),
                   [](const MountTask& a, const MountTask& b) {
                     return a.target < b.target;
                   });
}


const char* MountModeName(MountMode mode) {
  switch (mode) {
    case MountMode::DEVTMPFS:
      return "devtmpfs";
    case MountMode::BIND_RO:
      return "bind-ro";
    case MountMode::BIND_RW:
      return "bind-rw";
    case MountMode::BIND_DEV:
      return "bind-dev";
    case MountMode::TMPFS:
      return "tmpfs";
    case MountMode::PROC:
    default:
      return "proc";
  }
}

// Copyright 2015 The Bazel Authors. All rights reserved.
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

#ifndef SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
#define SRC_MAIN_TOOLS_PROCESS_TOOLS_H_

#include <stdbool.h>
#include <sys/types.h>
#include <string>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#define _EXPERIMENTAL_FILESYSTEM_
#endif

struct utsname;

// Set up a signal handler for a signal.
void InstallSignalHandler(int signum, void (*handler)(int));

// Set the signal handler for `signum` to SIG_DFL (default).
void InstallDefaultSignalHandler(int sig);

// Use an empty signal mask for the process and set all signal handlers to their
// default.
void ClearSignalMask();

// Forks and executes `argv`, searching $PATH for argv[0]. With `quiet` the
// child's stdout and stderr go to /dev/null. The pid of the child is stored in
// `pid`.
//
// Failure to execute the command is detected before returning: a missing
// command is reported as ErrorCode::CommandNotFound, anything else as a
// generic OS error. Returns 0 on success.
int SpawnProcess(const std::vector<std::string>& argv, bool quiet, pid_t* pid);

// Waits for `pid` to exit, restarting on EINTR. Returns the exit status of the
// process, or 128 + signal number if it was killed by a signal. Returns a
// negative value if waiting failed.
int WaitForProcess(pid_t pid);

// Non-blocking variant of WaitForProcess(). Returns true and stores the exit
// status in `exit_code` if the process is gone.
bool ProcessHasExited(pid_t pid, int* exit_code);

// SpawnProcess() followed by WaitForProcess().
int RunAndWait(const std::vector<std::string>& argv, bool quiet, int* exit_code);

void KillAndWait(pid_t pid);

// Searches $PATH for an executable named `name`. Names containing a slash are
// checked as they are.
bool FindExecutable(const std::string& name, std::string& out);

// True if `path` exists, following symlinks.
bool PathExists(const std::string& path);

// Absolute, lexically normalized path without resolving symlinks.
std::string AbsolutePath(const std::string& path);

// Absolute path with every existing symlink resolved.
std::string RealPath(const std::string& path);

// `path` with all trailing slashes replaced by exactly one.
std::string SingleTrailingSep(const std::string& path);

std::vector<std::string> SplitString(const std::string& str, char separator);

int CreateDirectories(const std::string& path, mode_t mode);
std::string GetHomeDir();

bool GetOSName(std::string& printable_name, std::string& version_id);
bool GetKernelInfo(struct utsname* buf);

#endif  // SRC_MAIN_TOOLS_PROCESS_TOOLS_H_

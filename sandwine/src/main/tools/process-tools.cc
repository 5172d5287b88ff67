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

#include "src/main/tools/process-tools.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"

#include <errno.h>
#include <fcntl.h>
#include <pwd.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#ifndef TEMP_FAILURE_RETRY
// Some C standard libraries like musl do not define this macro, so we'll
// include our own version for compatibility.
#define TEMP_FAILURE_RETRY(exp)                                                \
  ({                                                                           \
    decltype(exp) _rc;                                                         \
    do {                                                                       \
      _rc = (exp);                                                             \
    } while (_rc == -1 && errno == EINTR);                                     \
    _rc;                                                                       \
  })
#endif // TEMP_FAILURE_RETRY

void InstallSignalHandler(int signum, void (*handler)(int)) {
  struct sigaction sa = {};
  sa.sa_handler = handler;
  if (handler == SIG_IGN || handler == SIG_DFL) {
    // No point in blocking signals when using the default handler or ignoring
    // the signal.
    if (sigemptyset(&sa.sa_mask) < 0) {
      SandwineReport("sigemptyset");
    }
  } else {
    // When using a custom handler, block all signals from firing while the
    // handler is running.
    if (sigfillset(&sa.sa_mask) < 0) {
      SandwineReport("sigfillset");
    }
  }
  // sigaction may fail for certain reserved signals. Ignore failure in this
  // case, but report it in debug mode, just in case.
  if (sigaction(signum, &sa, nullptr) < 0) {
    PRINT_DEBUG("sigaction(%d, &sa, nullptr) failed", signum);
  }
}

void InstallDefaultSignalHandler(int signum) {
  // These signals can't be handled, so we'll just not do anything for these.
  if (signum != SIGSTOP && signum != SIGKILL) {
    InstallSignalHandler(signum, SIG_DFL);
  }
}

void ClearSignalMask() {
  // Use an empty signal mask for the process.
  sigset_t empty_sset;
  if (sigemptyset(&empty_sset) < 0) {
    DIE("sigemptyset");
  }
  if (sigprocmask(SIG_SETMASK, &empty_sset, nullptr) < 0) {
    DIE("sigprocmask");
  }

  // Set the default signal handler for all signals.
  for (int i = 1; i < NSIG; ++i) {
    if (i == SIGKILL || i == SIGSTOP) {
      continue;
    }

    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    if (sigemptyset(&sa.sa_mask) < 0) {
      DIE("sigemptyset");
    }
    // Ignore possible errors, because we might not be allowed to set the
    // handler for certain signals, but we still want to try.
    sigaction(i, &sa, nullptr);
  }
}

// Runs in the forked child. Never returns.
static void ExecChild(std::vector<char *>& args, bool quiet, int error_fd) {
  ClearSignalMask();

  if (quiet) {
    int devnull = open("/dev/null", O_WRONLY);
    if (devnull < 0 || dup2(devnull, STDOUT_FILENO) < 0 ||
        dup2(devnull, STDERR_FILENO) < 0) {
      DIE("redirecting output to /dev/null");
    }
    close(devnull);
  }

  execvp(args[0], args.data());

  // Only reached if execvp failed. The parent reads errno from the pipe.
  int err = errno;
  ssize_t unused = write(error_fd, &err, sizeof(err));
  (void)unused;
  _exit(EXIT_COMMAND_NOT_FOUND);
}

int SpawnProcess(const std::vector<std::string>& argv, bool quiet, pid_t* pid) {
  if (argv.empty()) {
    return SandwineReportGenericError("SpawnProcess: empty command");
  }

  // argv[] passed to execve() must be a null-terminated array.
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  // The write end is close-on-exec: EOF without data means execvp succeeded.
  int exec_pipe[2];
  if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
    return SandwineReport("pipe2");
  }

  PRINT_DEBUG("calling fork for %s...", argv[0].c_str());
  const pid_t child_pid = fork();
  if (child_pid < 0) {
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    return SandwineReport("fork");
  }
  if (child_pid == 0) {
    close(exec_pipe[0]);
    ExecChild(args, quiet, exec_pipe[1]);
  }

  close(exec_pipe[1]);
  int child_errno = 0;
  const ssize_t n = TEMP_FAILURE_RETRY(read(exec_pipe[0], &child_errno, sizeof(child_errno)));
  close(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    TEMP_FAILURE_RETRY(waitpid(child_pid, nullptr, 0));
    if (child_errno == ENOENT) {
      return SandwineReportErrorAndMessage(
          "Command '" + argv[0] + "' is not available, aborting.",
          ErrorCode::CommandNotFound);
    }
    return SandwineReportGenericError("execvp(" + argv[0] + "): " +
                                      strerror(child_errno));
  }

  PRINT_DEBUG("child started with PID %d", child_pid);
  *pid = child_pid;
  return 0;
}

static int DecodeStatus(int status) {
  // We want to exit in the same manner as the child.
  if (WIFSIGNALED(status)) {
    const int signal = WTERMSIG(status);
    PRINT_DEBUG("child exited due to receiving signal: %s", strsignal(signal));
    return 128 + signal;
  }

  const int exit_code = WEXITSTATUS(status);
  PRINT_DEBUG("child exited normally with code %d", exit_code);
  return exit_code;
}

int WaitForProcess(pid_t pid) {
  int status;
  while (true) {
    const pid_t ret = waitpid(pid, &status, 0);
    if (ret == pid) {
      break;
    }
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    return SandwineReport("waitpid(%d)", pid);
  }
  return DecodeStatus(status);
}

bool ProcessHasExited(pid_t pid, int* exit_code) {
  int status;
  const pid_t ret = TEMP_FAILURE_RETRY(waitpid(pid, &status, WNOHANG));
  if (ret == pid) {
    *exit_code = DecodeStatus(status);
    return true;
  }
  if (ret < 0) {
    // ECHILD: somebody else reaped it already.
    *exit_code = -1;
    return true;
  }
  return false;
}

int RunAndWait(const std::vector<std::string>& argv, bool quiet, int* exit_code) {
  pid_t pid;
  int res = SpawnProcess(argv, quiet, &pid);
  if (res < 0) {
    return res;
  }
  res = WaitForProcess(pid);
  if (res < 0) {
    return res;
  }
  *exit_code = res;
  return 0;
}

void KillAndWait(pid_t pid) {
  kill(pid, SIGKILL);
  TEMP_FAILURE_RETRY(waitpid(pid, nullptr, 0));
}

static bool IsExecutableFile(const std::string& path) {
  struct stat sb;
  return stat(path.c_str(), &sb) == 0 && S_ISREG(sb.st_mode) &&
         access(path.c_str(), X_OK) == 0;
}

bool FindExecutable(const std::string& name, std::string& out) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    if (IsExecutableFile(name)) {
      out = name;
      return true;
    }
    return false;
  }

  const char *path_env = getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }
  for (std::string dir : SplitString(path_env, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) {
      out = candidate;
      return true;
    }
  }
  return false;
}

bool PathExists(const std::string& path) {
  struct stat sb;
  return stat(path.c_str(), &sb) == 0;
}

std::string AbsolutePath(const std::string& path) {
  std::error_code ec;
  fs::path abs;
  if (path.empty()) {
    abs = fs::current_path(ec);
  } else {
    abs = fs::absolute(fs::path(path), ec);
  }
  if (ec) {
    abs = fs::path(path);
  }
  std::string res = abs.lexically_normal().string();
  while (res.size() > 1 && res.back() == '/') {
    res.pop_back();
  }
  return res;
}

std::string RealPath(const std::string& path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(fs::path(AbsolutePath(path)), ec);
  if (ec) {
    return AbsolutePath(path);
  }
  std::string res = resolved.lexically_normal().string();
  while (res.size() > 1 && res.back() == '/') {
    res.pop_back();
  }
  return res;
}

std::string SingleTrailingSep(const std::string& path) {
  size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) {
    return "/";
  }
  return path.substr(0, end + 1) + "/";
}

std::vector<std::string> SplitString(const std::string& str, char separator) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(separator, start);
    if (pos == std::string::npos) {
      parts.push_back(str.substr(start));
      break;
    }
    parts.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

int CreateDirectories(const std::string& path, mode_t mode) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    return SandwineReportGenericError("Could not create directory '" + path +
                                      "': " + ec.message());
  }
  if (chmod(path.c_str(), mode) < 0) {
    return SandwineReport("chmod(%s)", path.c_str());
  }
  return 0;
}

std::string GetHomeDir() {
  const char *home = getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return std::string(home);
  }
  struct passwd *pw = getpwuid(getuid());
  if (pw != nullptr && pw->pw_dir != nullptr) {
    return std::string(pw->pw_dir);
  }
  return "/";
}

static inline void trim(std::string& s) {
  auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), is_not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), is_not_space).base(), s.end());
}

// Remove surrounding single or double quotes if present
static inline void unquote(std::string& s) {
  if (s.size() >= 2 &&
      ((s.front() == '"' && s.back() == '"') ||
       (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

// Parses /etc/os-release and returns NAME and VERSION_ID via out-params.
// Returns true iff at least one of the requested keys was found.
bool GetOSName(std::string& printable_name, std::string& version_id) {
  printable_name.clear();
  version_id.clear();

  std::ifstream file("/etc/os-release");
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') continue;

    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) continue;

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);

    trim(key);
    trim(value);
    unquote(value);

    if (key == "NAME") {
      printable_name = value;
    } else if (key == "VERSION_ID") {
      version_id = value;
    }

    if (!printable_name.empty() && !version_id.empty()) {
      break;
    }
  }
  return (!printable_name.empty() || !version_id.empty());
}

bool GetKernelInfo(struct utsname* buf) {
  return (uname(buf) == 0);
}

/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

/**
 * sandwine runs Windows programs with Wine inside a bubblewrap sandbox:
 *
 *  - The root filesystem is an empty tmpfs. /bin, /etc, /lib*, /sys and /usr
 *    are bound read-only, /dev/dri is passed through for graphics.
 *  - $HOME and ~/.wine are empty tmpfs unless --dotwine says otherwise.
 *  - All namespaces are unshared. Networking is off unless --network.
 *  - The environment is cleared except for a few harmless variables.
 *  - X11 is off by default. With --x11 and friends a nested X server is
 *    started on a fresh display and only its socket is bound.
 *  - The program runs inside a pseudo-terminal (script(1)) so it cannot push
 *    input into our terminal via TIOCSTI.
 *  - If sandwine gets killed, bubblewrap takes the sandbox down with it.
 */

#include "src/main/tools/sandwine.h"
#include "src/main/tools/bwrap-argv.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/x11.h"

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <atomic>
#include <memory>

// The PID of our child process, for use in signal handlers.
static std::atomic<pid_t> global_child_pid{0};

// Set once a SIGINT arrived; we then exit like an interrupted shell command.
static std::atomic<int> global_interrupted{0};

#if __cplusplus >= 201703L
static_assert(decltype(global_child_pid)::is_always_lock_free);
static_assert(decltype(global_interrupted)::is_always_lock_free);
#endif

static std::unique_ptr<X11Context> global_x11_context;

static void OnInterrupt(int) {
  global_interrupted.store(1, std::memory_order_relaxed);
  const pid_t child_pid = global_child_pid.load(std::memory_order_relaxed);
  if (child_pid > 0) {
    kill(child_pid, SIGKILL);
  }
}

static void OnTerm(int signum) {
  const pid_t child_pid = global_child_pid.load(std::memory_order_relaxed);
  if (child_pid > 0) {
    kill(child_pid, signum);
  }
}

int RequireRecentBubblewrap() {
  std::string bwrap_path;
  if (!FindExecutable("bwrap", bwrap_path)) {
    PRINT_DEBUG("bwrap not found on PATH");
    return SandwineReportError(ErrorCode::BubblewrapTooOld);
  }

  int exit_code = 0;
  const std::vector<std::string> argv = {"bwrap", "--disable-userns", "--help"};
  int res = RunAndWait(argv, true, &exit_code);
  if (res < 0) {
    return res;
  }
  if (exit_code != 0) {
    return SandwineReportError(ErrorCode::BubblewrapTooOld);
  }
  return 0;
}

int ResolveX11Display(Options& config) {
  int res = 0;
  if (config.x11 == X11Mode::NONE) {
    return 0;
  }

  if (config.x11 == X11Mode::AUTO) {
    if ((res = DetectAndRequireNestedX11(&config.x11)) < 0) {
      return res;
    }
  }

  if (config.x11 == X11Mode::HOST) {
    if ((res = X11Display::FindUsed(&config.x11_display_number)) < 0) {
      return res;
    }
  } else {
    const int minimum = (config.x11 == X11Mode::XPRA) ? XPRA_MINIMUM_DISPLAY : 0;
    config.x11_display_number = X11Display::FindUnused(minimum);
  }

  PRINT_DEBUG("X11 server: %s", X11ModeName(config.x11));
  PRINT_INFO("Using display \":%d\"...", config.x11_display_number);
  return 0;
}

int SandwineCreateBwrapArgv(Options& config, ArgvBuilder& argv) {
  int res = ResolveX11Display(config);
  if (res < 0) {
    return res;
  }
  return CreateBwrapArgv(config, argv);
}

int RunSupervised(const std::vector<std::string>& argv, int* exit_code) {
  pid_t child_pid;
  global_interrupted.store(0, std::memory_order_relaxed);

  // The child resets these to the defaults before exec.
  InstallSignalHandler(SIGINT, OnInterrupt);
  InstallSignalHandler(SIGTERM, OnTerm);

  int res = SpawnProcess(argv, false, &child_pid);
  if (res < 0) {
    InstallDefaultSignalHandler(SIGINT);
    InstallDefaultSignalHandler(SIGTERM);
    return res;
  }
  global_child_pid.store(child_pid, std::memory_order_relaxed);

  res = WaitForProcess(child_pid);
  global_child_pid.store(0, std::memory_order_relaxed);

  InstallDefaultSignalHandler(SIGINT);
  InstallDefaultSignalHandler(SIGTERM);

  if (res < 0) {
    return res;
  }
  *exit_code = res;
  if (global_interrupted.load(std::memory_order_relaxed)) {
    *exit_code = 128 + SIGINT;
  }
  return 0;
}

int SandwineStart() {
  int res;

  // Open the log file early enough so we don't lose any output.
  if (!opt.debug_path.empty()) {
    if (!OpenLogFile(opt.debug_path.c_str())) {
      return SandwineReport("fopen(%s)", opt.debug_path.c_str());
    }
  }
  global_log_level = opt.quiet ? LOG_LEVEL_WARNING : LOG_LEVEL_DEBUG;
  logSystem();

  if (!opt.dry_run) {
    if ((res = RequireRecentBubblewrap()) < 0) {
      return res;
    }
  }

  ArgvBuilder argv_builder;
  if ((res = SandwineCreateBwrapArgv(opt, argv_builder)) < 0) {
    return res;
  }
  if (!opt.quiet) {
    argv_builder.AnnounceTo(LogSink());
  }

  if (opt.dry_run) {
    return 0;
  }

  global_x11_context = CreateX11Context(opt.x11, opt.x11_display_number,
                                        X11_DEFAULT_WIDTH, X11_DEFAULT_HEIGHT);
  if ((res = global_x11_context->Enter()) < 0) {
    global_x11_context.reset();
    return res;
  }

  int exit_code = 0;
  res = RunSupervised(argv_builder.Flat(), &exit_code);

  global_x11_context->Exit();
  global_x11_context.reset();

  if (res < 0) {
    return res;
  }
  return exit_code;
}

void Cleanup() {
  static bool cleaning_up = false;
  if (cleaning_up) {
    return;
  }
  cleaning_up = true;

  const pid_t child_pid = global_child_pid.exchange(0);
  if (child_pid > 0) {
    KillAndWait(child_pid);
  }
  global_x11_context.reset();

  cleaning_up = false;
}

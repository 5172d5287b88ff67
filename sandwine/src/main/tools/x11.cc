/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/x11.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <thread>

#define X11_STARTUP_TIMEOUT_MS 10000
#define X11_STARTUP_POLL_MS 100


const char* X11ModeName(X11Mode mode) {
  switch (mode) {
    case X11Mode::NONE:
      return "none";
    case X11Mode::AUTO:
      return "auto";
    case X11Mode::HOST:
      return "host";
    case X11Mode::NXAGENT:
      return "nxagent";
    case X11Mode::XEPHYR:
      return "Xephyr";
    case X11Mode::XNEST:
      return "Xnest";
    case X11Mode::XPRA:
      return "Xpra";
    case X11Mode::XVFB:
    default:
      return "Xvfb";
  }
}


std::string X11Display::GetUnixSocket() const {
  return std::string(X11_UNIX_SOCKET_DIR) + "/X" + std::to_string(number_);
}


bool X11Display::Exists() const {
  return PathExists(GetUnixSocket());
}


int X11Display::FindUnused(int minimum) {
  int candidate = minimum;
  while (X11Display(candidate).Exists()) {
    candidate++;
  }
  return candidate;
}


int X11Display::FindUsed(int* number) {
  const char* display = getenv("DISPLAY");
  if (display == nullptr || display[0] == '\0') {
    return SandwineReportError(ErrorCode::DisplayNotSet);
  }

  // [host]:display[.screen]
  std::string value(display);
  const size_t colon = value.rfind(':');
  std::string digits = (colon == std::string::npos) ? value : value.substr(colon + 1);
  const size_t dot = digits.find('.');
  if (dot != std::string::npos) {
    digits.resize(dot);
  }

  if (digits.empty() || digits.size() > 6) {
    return SandwineReportErrorAndMessage(
        "Cannot parse display number from DISPLAY='" + value + "'.",
        ErrorCode::DisplayNotSet);
  }
  for (char c : digits) {
    if (!isdigit(static_cast<unsigned char>(c))) {
      return SandwineReportErrorAndMessage(
          "Cannot parse display number from DISPLAY='" + value + "'.",
          ErrorCode::DisplayNotSet);
    }
  }
  *number = atoi(digits.c_str());
  return 0;
}


int DetectAndRequireNestedX11(X11Mode* mode) {
  static const struct {
    const char* command;
    X11Mode mode;
  } candidates[] = {
      {"nxagent", X11Mode::NXAGENT},
      {"Xephyr", X11Mode::XEPHYR},
      {"Xnest", X11Mode::XNEST},
  };

  for (const auto& candidate : candidates) {
    std::string path;
    if (FindExecutable(candidate.command, path)) {
      PRINT_DEBUG("Found %s at %s", candidate.command, path.c_str());
      *mode = candidate.mode;
      return 0;
    }
  }
  return SandwineReportError(ErrorCode::NoNestedX11Available);
}


std::vector<std::string> X11ServerArgv(X11Mode mode, int display_number,
                                       int width, int height) {
  const std::string display = ":" + std::to_string(display_number);
  const std::string geometry = std::to_string(width) + "x" + std::to_string(height);

  switch (mode) {
    case X11Mode::NXAGENT:
      return {"nxagent", "-nolisten", "tcp", "-ac", "-noshmem", "-R", display};
    case X11Mode::XEPHYR:
      return {"Xephyr", "-nolisten", "tcp", "-screen", geometry, "-resizeable", display};
    case X11Mode::XNEST:
      return {"Xnest", "-nolisten", "tcp", "-geometry", geometry, display};
    case X11Mode::XVFB:
      return {"Xvfb", "-nolisten", "tcp", "-screen", "0", geometry + "x24", display};
    case X11Mode::XPRA:
      return {"xpra", "start", display, "--daemon=no", "--attach=yes",
              "--mdns=no", "--pulseaudio=no", "--notifications=no"};
    case X11Mode::NONE:
    case X11Mode::AUTO:
    case X11Mode::HOST:
    default:
      return {};
  }
}


NestedX11Context::NestedX11Context(const std::vector<std::string>& server_argv,
                                   int display_number)
    : server_argv_(server_argv), display_(display_number) {}


NestedX11Context::~NestedX11Context() {
  Exit();
}


int NestedX11Context::Enter() {
  PRINT_INFO("Starting nested X11 server %s on display :%d...",
             server_argv_[0].c_str(), display_.number());

  int res = SpawnProcess(server_argv_, false, &server_pid_);
  if (res < 0) {
    server_pid_ = -1;
    return res;
  }

  for (int waited = 0; waited < X11_STARTUP_TIMEOUT_MS;
       waited += X11_STARTUP_POLL_MS) {
    if (display_.Exists()) {
      PRINT_DEBUG("Display :%d is up", display_.number());
      return 0;
    }
    int exit_code;
    if (ProcessHasExited(server_pid_, &exit_code)) {
      server_pid_ = -1;
      return SandwineReportErrorAndMessage(
          "X11 server '" + server_argv_[0] + "' exited with code " +
              std::to_string(exit_code) + " before display :" +
              std::to_string(display_.number()) + " came up.",
          ErrorCode::X11ServerFailed);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(X11_STARTUP_POLL_MS));
  }

  KillAndWait(server_pid_);
  server_pid_ = -1;
  return SandwineReportErrorAndMessage(
      "Timed out waiting for " + display_.GetUnixSocket() + " to appear.",
      ErrorCode::X11ServerFailed);
}


void NestedX11Context::Exit() {
  if (server_pid_ <= 0) {
    return;
  }
  PRINT_INFO("Shutting down nested X11 server on display :%d...",
             display_.number());
  StopServer();
  server_pid_ = -1;
}


void NestedX11Context::StopServer() {
  int exit_code;
  if (ProcessHasExited(server_pid_, &exit_code)) {
    return;
  }
  if (kill(server_pid_, SIGTERM) < 0 && errno != ESRCH) {
    PRINT_WARNING("kill(%d, SIGTERM) failed: %s", server_pid_, strerror(errno));
  }
  if (WaitForProcess(server_pid_) < 0) {
    PRINT_WARNING("%s", SandwineGetErrorMsg());
  }
}


XpraX11Context::~XpraX11Context() {
  // The base destructor can no longer dispatch to our StopServer().
  Exit();
}


void XpraX11Context::StopServer() {
  int exit_code = 0;
  if (ProcessHasExited(server_pid_, &exit_code)) {
    return;
  }
  const std::vector<std::string> stop_argv = {
      "xpra", "stop", ":" + std::to_string(display_.number())};
  if (RunAndWait(stop_argv, true, &exit_code) < 0 || exit_code != 0) {
    PRINT_WARNING("xpra stop failed, terminating the server instead");
    NestedX11Context::StopServer();
    return;
  }
  if (WaitForProcess(server_pid_) < 0) {
    PRINT_WARNING("%s", SandwineGetErrorMsg());
  }
}


std::unique_ptr<X11Context> CreateX11Context(X11Mode mode, int display_number,
                                             int width, int height) {
  switch (mode) {
    case X11Mode::XPRA:
      return std::unique_ptr<X11Context>(new XpraX11Context(
          X11ServerArgv(mode, display_number, width, height), display_number));
    case X11Mode::NXAGENT:
    case X11Mode::XEPHYR:
    case X11Mode::XNEST:
    case X11Mode::XVFB:
      return std::unique_ptr<X11Context>(new NestedX11Context(
          X11ServerArgv(mode, display_number, width, height), display_number));
    case X11Mode::NONE:
    case X11Mode::AUTO:
    case X11Mode::HOST:
    default:
      return std::unique_ptr<X11Context>(new NullX11Context());
  }
}

/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_X11_H_
#define SRC_MAIN_TOOLS_X11_H_

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#define X11_UNIX_SOCKET_DIR "/tmp/.X11-unix"

// Xpra warns about displays <= 9.
#define XPRA_MINIMUM_DISPLAY 10

#define X11_DEFAULT_WIDTH 1024
#define X11_DEFAULT_HEIGHT 768

enum class X11Mode { NONE, AUTO, HOST, NXAGENT, XEPHYR, XNEST, XPRA, XVFB };

const char* X11ModeName(X11Mode mode);

class X11Display {
 public:
  explicit X11Display(int number) : number_(number) {}

  int number() const { return number_; }
  std::string GetUnixSocket() const;
  bool Exists() const;

  // Smallest display number >= minimum without a socket.
  static int FindUnused(int minimum);

  // Display number of $DISPLAY. Reports ErrorCode::DisplayNotSet and returns
  // a negative value if it is unset or cannot be parsed.
  static int FindUsed(int* number);

 private:
  int number_;
};

// Picks the first nested X11 server available on $PATH, in the order nxagent,
// Xephyr, Xnest. Reports ErrorCode::NoNestedX11Available if there is none.
int DetectAndRequireNestedX11(X11Mode* mode);

// Command line that starts a nested server of the given kind on display
// `display_number`. Empty for NONE, AUTO and HOST.
std::vector<std::string> X11ServerArgv(X11Mode mode, int display_number,
                                       int width, int height);

// Scope during which an X11 display is available. Enter() brings the display
// up; Exit(), or the destructor, takes it down again.
class X11Context {
 public:
  virtual ~X11Context() = default;

  virtual int Enter() = 0;
  virtual void Exit() = 0;
};

// Used for the host display and when X11 is disabled.
class NullX11Context : public X11Context {
 public:
  int Enter() override { return 0; }
  void Exit() override {}
};

class NestedX11Context : public X11Context {
 public:
  NestedX11Context(const std::vector<std::string>& server_argv,
                   int display_number);
  ~NestedX11Context() override;

  NestedX11Context(const NestedX11Context&) = delete;
  NestedX11Context& operator=(const NestedX11Context&) = delete;

  int Enter() override;
  void Exit() override;

 protected:
  virtual void StopServer();

  std::vector<std::string> server_argv_;
  X11Display display_;
  pid_t server_pid_ = -1;
};

// Xpra detaches its client on SIGTERM but keeps the session; it has to be
// stopped through its own command line.
class XpraX11Context : public NestedX11Context {
 public:
  using NestedX11Context::NestedX11Context;
  ~XpraX11Context() override;

 protected:
  void StopServer() override;
};

std::unique_ptr<X11Context> CreateX11Context(X11Mode mode, int display_number,
                                             int width, int height);

#endif  // SRC_MAIN_TOOLS_X11_H_

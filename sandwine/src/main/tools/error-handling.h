/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef _ERROR_HANDLING_H
#define _ERROR_HANDLING_H

#include <cstdio>
#include <cerrno>
#include <string>
#include <cstring>

#define MAX_ERR_LEN 512

#define EXIT_USAGE 2
#define EXIT_COMMAND_NOT_FOUND 127


enum class Mode {
    CLI,
    Library
};

enum class ErrorCode : int {
  None = 0,
  UsageError = -1,
  InvalidPathAccess = -2,
  PathDoesNotExist = -3,
  BubblewrapTooOld = -4,
  CommandNotFound = -5,
  NoNestedX11Available = -6,
  DisplayNotSet = -7,
  X11ServerFailed = -8,
  GeneralOSError = -100,
  Unknown = -1000
};

inline std::string GetErrorMessage(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "No error";
    case ErrorCode::UsageError:
      return "Invalid command line";
    case ErrorCode::InvalidPathAccess:
      return "Expected a value of the form PATH:{ro,rw}";
    case ErrorCode::PathDoesNotExist:
      return "Path does not exist on the host";
    case ErrorCode::BubblewrapTooOld:
      return "sandwine requires bubblewrap >=0.8.0, aborting.";
    case ErrorCode::CommandNotFound:
      return "Command is not available";
    case ErrorCode::NoNestedX11Available:
      return "Neither nxagent nor Xephyr nor Xnest is available, please install, aborting.";
    case ErrorCode::DisplayNotSet:
      return "Environment variable DISPLAY is not set to a usable display";
    case ErrorCode::X11ServerFailed:
      return "Nested X11 server did not come up";
    case ErrorCode::GeneralOSError:
      return "OS Error";
    case ErrorCode::Unknown:
    default:
      return "Unknown error occurred";
  }
}

// Exit status used by the command line tool for an error of this kind.
inline int GetExitStatus(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return 0;
    case ErrorCode::UsageError:
    case ErrorCode::InvalidPathAccess:
      return EXIT_USAGE;
    case ErrorCode::CommandNotFound:
      return EXIT_COMMAND_NOT_FOUND;
    default:
      return 1;
  }
}

typedef struct {
  char msg[MAX_ERR_LEN];
  ErrorCode code;
} SandwineError;

// In CLI mode every reported error is logged and terminates the process with
// GetExitStatus(code). In Library mode the error is only recorded.
void SandwineSetErrorMode(Mode new_mode);
Mode SandwineGetErrorMode();

// Every report function returns -1 so callers can write
// `return SandwineReportError(...)`.
#define SandwineReportGenericError(msg) \
    SandwineReportGenericError_impl((msg), __FILE__, __LINE__, __func__)

int SandwineReportGenericError_impl(const std::string& err_msg, const char* file, int line, const char* func);

#define SandwineReportError(code) \
    SandwineReportError_impl((code), __FILE__, __LINE__, __func__)

int SandwineReportError_impl(ErrorCode code, const char* file, int line, const char* func);

// `msg` replaces the generic text of `code` in the recorded message.
#define SandwineReportErrorAndMessage(msg, code) \
    SandwineReportErrorAndMessage_impl((msg), (code), __FILE__, __LINE__, __func__)

int SandwineReportErrorAndMessage_impl(const std::string& err_msg, ErrorCode code, const char* file, int line, const char* func);

// printf-style shortcut for GeneralOSError, appends strerror(errno).
int SandwineReport(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

const char* SandwineGetErrorMsg();
int SandwineGetErrorCode();
void SandwineClearError();

#endif

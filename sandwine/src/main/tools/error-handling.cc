/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */


#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/sandwine.h"

#include <cstdarg>
#include <cstdlib>
#include <vector>


static Mode mode = Mode::Library;

static SandwineError sbx_err = {{0}, ErrorCode::None};


void SandwineSetErrorMode(Mode new_mode) {
  mode = new_mode;
}


Mode SandwineGetErrorMode() {
  return mode;
}


static void SandwineSetError(const std::string& err_msg, ErrorCode code,
                             const char* file, int line) {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  strncpy(sbx_err.msg, err_msg.c_str(), MAX_ERR_LEN - 1);
  sbx_err.code = code;

  if (mode == Mode::CLI) {
    LogMessage(LOG_LEVEL_ERROR, file, line, "%s", err_msg.c_str());
    Cleanup();
    CloseLogFile();
    exit(GetExitStatus(code));
  }
  PRINT_DEBUG("[%s:%d] error %d: %s", file, line, static_cast<int>(code),
              err_msg.c_str());
}


int SandwineReportGenericError_impl(const std::string& err_msg, const char* file, int line, const char* func) {
  return SandwineReportErrorAndMessage_impl(err_msg, ErrorCode::GeneralOSError, file, line, func);
}


int SandwineReportError_impl(ErrorCode code, const char* file, int line, const char* func) {
  return SandwineReportErrorAndMessage_impl("", code, file, line, func);
}


int SandwineReportErrorAndMessage_impl(const std::string& err_msg, ErrorCode code, const char* file, int line, const char* func) {
  std::string msg = err_msg.empty() ? GetErrorMessage(code) : err_msg;
  if (code == ErrorCode::GeneralOSError && err_msg.empty()) {
    msg = std::string(func) + ": " + msg;
  }
  SandwineSetError(msg, code, file, line);
  return -1;
}


int SandwineReport(const char* fmt, ...) {
  const int saved_errno = errno;
  va_list args;
  va_start(args, fmt);

  size_t size = std::vsnprintf(nullptr, 0, fmt, args) + 1;
  va_end(args);

  std::vector<char> buffer(size);
  va_start(args, fmt);
  std::vsnprintf(buffer.data(), size, fmt, args);
  va_end(args);

  std::string msg(buffer.data());
  if (saved_errno != 0) {
    msg += ": ";
    msg += strerror(saved_errno);
  }
  return SandwineReportGenericError(msg);
}


const char* SandwineGetErrorMsg() {
  return sbx_err.msg;
}


int SandwineGetErrorCode() {
  return static_cast<int>(sbx_err.code);
}


void SandwineClearError() {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  sbx_err.code = ErrorCode::None;
}

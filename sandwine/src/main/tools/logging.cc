// Copyright 2017 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <gnu/libc-version.h>
#include <stdarg.h>
#include <sys/utsname.h>
#include <time.h>

#include <stdexcept>
#include <string>

FILE *global_debug = nullptr;
int global_log_level = LOG_LEVEL_DEBUG;

#define COLOR_RESET "\033[0m"

static const char *LevelName(int level) {
  switch (level) {
    case LOG_LEVEL_DEBUG:
      return "DEBUG";
    case LOG_LEVEL_INFO:
      return "INFO";
    case LOG_LEVEL_WARNING:
      return "WARNING";
    case LOG_LEVEL_ERROR:
    default:
      return "ERROR";
  }
}

static const char *LevelColor(int level) {
  switch (level) {
    case LOG_LEVEL_DEBUG:
      return "\033[32m";
    case LOG_LEVEL_INFO:
      return "";
    case LOG_LEVEL_WARNING:
      return "\033[33m";
    case LOG_LEVEL_ERROR:
    default:
      return "\033[1;31m";
  }
}

static bool UseColor(FILE *sink) {
  return getenv("NO_COLOR") == nullptr && isatty(fileno(sink));
}

FILE *LogSink() { return global_debug != nullptr ? global_debug : stderr; }

void LogMessage(int level, const char *file, int line, const char *fmt, ...) {
  if (level < global_log_level) {
    return;
  }
  FILE *sink = LogSink();

  char stamp[32] = {0};
  time_t now = time(nullptr);
  struct tm local;
  if (localtime_r(&now, &local) != nullptr) {
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
  }

  const bool color = UseColor(sink);
  fprintf(sink, "%s sandwine[%d] %s%s%s ", stamp, getpid(),
          color ? LevelColor(level) : "", LevelName(level),
          color ? COLOR_RESET : "");
  if (level == LOG_LEVEL_DEBUG) {
    fprintf(sink, "%s:%d: ", file, line);
  }

  va_list ap;
  va_start(ap, fmt);
  if (color) {
    fputs(LevelColor(level), sink);
  }
  vfprintf(sink, fmt, ap);
  if (color) {
    fputs(COLOR_RESET, sink);
  }
  va_end(ap);

  // Some callers terminate their messages already.
  const size_t len = strlen(fmt);
  if (len == 0 || fmt[len - 1] != '\n') {
    fputc('\n', sink);
  }
  fflush(sink);
}

bool OpenLogFile(const char *path) {
  FILE *f = fopen(path, "w");
  if (f == nullptr) {
    return false;
  }
  CloseLogFile();
  global_debug = f;
  return true;
}

void CloseLogFile() {
  if (global_debug != nullptr && global_debug != stderr &&
      global_debug != stdout) {
    fclose(global_debug);
  }
  global_debug = nullptr;
}

void logOSKernel() {
  struct utsname buf;
  bool res = GetKernelInfo(&buf);
  if (res) {
    PRINT_DEBUG("OS: %s", buf.sysname);
    PRINT_DEBUG("Kernel: %s", buf.release);
    PRINT_DEBUG("Version: %s", buf.version);
    PRINT_DEBUG("Machine: %s", buf.machine);
  } else {
    PRINT_DEBUG("uname: %s", strerror(errno));
  }
}

void logLibc() { PRINT_DEBUG("libc: %s", gnu_get_libc_version()); }

void logLibstdcpp() {
#ifdef _GLIBCXX_RELEASE
  PRINT_DEBUG("libstdc++ release: %d", _GLIBCXX_RELEASE);
#endif

#ifdef __GLIBCXX__
  PRINT_DEBUG("__GLIBCXX__: %d", __GLIBCXX__);
#endif
}

void logOSName() {
  try {
    std::string pretty, version;
    const bool ok = GetOSName(pretty, version);

    if (!ok) {
      PRINT_DEBUG("Can't log OS info: /etc/os-release missing or keys not found");
      return;
    }

    if (!pretty.empty()) {
      PRINT_DEBUG("OS NAME: %s", pretty.c_str());
    }
    if (!version.empty()) {
      PRINT_DEBUG("OS VERSION_ID: %s", version.c_str());
    }
  } catch (const std::exception &e) {
    PRINT_DEBUG("Can't log OS info (exception): %s", e.what());
  }
}

void logSystem() {
  if (global_log_level > LOG_LEVEL_DEBUG) {
    return;
  }
  logOSKernel();
  logOSName();
  logLibc();
  logLibstdcpp();
}

// Copyright 2016 The Bazel Authors. All rights reserved.
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

#ifndef SRC_MAIN_TOOLS_LOGGING_H_
#define SRC_MAIN_TOOLS_LOGGING_H_

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

enum LogLevel {
  LOG_LEVEL_DEBUG = 10,
  LOG_LEVEL_INFO = 20,
  LOG_LEVEL_WARNING = 30,
  LOG_LEVEL_ERROR = 40
};

#define S(x) #x
#define S_(x) S(x)
#define S__LINE__ S_(__LINE__)

// Prints the message together with strerror(errno) and exits. Only meant for
// forked children, where there is nobody left to propagate an error code to.
#define DIE(...)                                                               \
  {                                                                            \
    fprintf(stderr, __FILE__ ":" S__LINE__ ": \"" __VA_ARGS__);                \
    fprintf(stderr, "\": ");                                                   \
    perror(nullptr);                                                           \
    exit(EXIT_FAILURE);                                                        \
  }

#define PRINT_DEBUG(fmt, ...)                                                  \
  LogMessage(LOG_LEVEL_DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define PRINT_INFO(fmt, ...)                                                   \
  LogMessage(LOG_LEVEL_INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define PRINT_WARNING(fmt, ...)                                                \
  LogMessage(LOG_LEVEL_WARNING, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define PRINT_ERROR(fmt, ...)                                                  \
  LogMessage(LOG_LEVEL_ERROR, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

// Where log lines go. nullptr means stderr.
extern FILE *global_debug;

// Messages below this level are dropped.
extern int global_log_level;

void LogMessage(int level, const char *file, int line, const char *fmt, ...)
    __attribute__((format(printf, 4, 5)));

// The stream log lines are currently written to.
FILE *LogSink();

// Opens `path` for writing and makes it the log sink. Returns false and leaves
// the sink untouched if the file cannot be opened.
bool OpenLogFile(const char *path);
void CloseLogFile();

// Logs kernel, distribution, libc and libstdc++ versions at debug level.
void logSystem();

#endif  // SRC_MAIN_TOOLS_LOGGING_H_

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

#include "src/main/tools/sandwine-options.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/mount-tasks.h"

#include <errno.h>
#include <getopt.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <vector>

using std::ifstream;
using std::string;
using std::vector;

struct Options opt;

static const char kUsage[] =
    "usage: sandwine [OPTIONS] [--] PROGRAM [ARG ..]\n"
    "   or: sandwine [OPTIONS] --configure\n"
    "   or: sandwine --help\n"
    "   or: sandwine --version\n";

static const char kDescription[] =
    "Command-line tool to run Windows applications with Wine inside a "
    "bubblewrap sandbox\n";

static const char kHelp[] =
    "\n"
    "positional arguments:\n"
    "  PROGRAM               command to run\n"
    "  ARG                   arguments to pass to PROGRAM\n"
    "\n"
    "options:\n"
    "  -h, --help            show this help message and exit\n"
    "  --version             show program's version number and exit\n"
    "\n"
    "X11 arguments:\n"
    "  --x11                 enable nested X11 using X2Go nxagent or Xephyr or Xnest\n"
    "                        but not Xvfb and not Xpra (default: X11 disabled)\n"
    "  --nxagent             enable nested X11 using X2Go nxagent (default: X11 disabled)\n"
    "  --xephyr              enable nested X11 using Xephyr (default: X11 disabled)\n"
    "  --xnest               enable nested X11 using Xnest (default: X11 disabled)\n"
    "  --xpra                enable nested X11 using Xpra (EXPERIMENTAL, CAREFUL!) (default: X11 disabled)\n"
    "  --xvfb                enable nested X11 using Xvfb (default: X11 disabled)\n"
    "  --host-x11-danger-danger\n"
    "                        enable use of host X11 (CAREFUL!) (default: X11 disabled)\n"
    "\n"
    "networking arguments:\n"
    "  --network             enable networking (default: networking disabled)\n"
    "\n"
    "sound arguments:\n"
    "  --pulseaudio          enable sound using PulseAudio (default: sound disabled)\n"
    "\n"
    "mount arguments:\n"
    "  --dotwine PATH:{ro,rw}\n"
    "                        use PATH for ~/.wine/ (default: use tmpfs, empty and non-persistent)\n"
    "  --pass PATH:{ro,rw}   bind mount host PATH on PATH (CAREFUL!)\n"
    "\n"
    "general operation arguments:\n"
    "  --configure           enforce running winecfg before start of PROGRAM (default: run winecfg as needed)\n"
    "  --no-pty              refrain from creating a pseudo-terminal, stop protecting against\n"
    "                        TIOCSTI/TIOCLINUX hijacking (CAREFUL!) (default: create a pseudo-terminal)\n"
    "  --no-wine             run PROGRAM without use of Wine (default: run command \"wine PROGRAM [ARG ..]\")\n"
    "  --retry               on non-zero exit code run PROGRAM a second time; helps to workaround weird\n"
    "                        graphics-related crashes (default: run command once)\n"
    "  --dry-run             print the bubblewrap command line but do not run it\n"
    "\n"
    "logging arguments:\n"
    "  -D, --debug-file FILE write log messages to FILE (default: stderr)\n"
    "  --quiet               only log warnings and errors (default: log everything)\n"
    "\n"
    "  @FILE                 read newline-separated arguments from FILE\n"
    "\n"
    "Credit to Sebastian Pipping <sebastian@pipping.org> for the original sandwine.\n";

enum LongOnlyOption {
  OPT_X11 = 256,
  OPT_NXAGENT,
  OPT_XEPHYR,
  OPT_XNEST,
  OPT_XPRA,
  OPT_XVFB,
  OPT_HOST_X11,
  OPT_NETWORK,
  OPT_PULSEAUDIO,
  OPT_DOTWINE,
  OPT_PASS,
  OPT_CONFIGURE,
  OPT_NO_PTY,
  OPT_NO_WINE,
  OPT_RETRY,
  OPT_QUIET,
  OPT_DRY_RUN,
  OPT_VERSION
};

static const struct option kLongOptions[] = {
    {"x11", no_argument, nullptr, OPT_X11},
    {"nxagent", no_argument, nullptr, OPT_NXAGENT},
    {"xephyr", no_argument, nullptr, OPT_XEPHYR},
    {"xnest", no_argument, nullptr, OPT_XNEST},
    {"xpra", no_argument, nullptr, OPT_XPRA},
    {"xvfb", no_argument, nullptr, OPT_XVFB},
    {"host-x11-danger-danger", no_argument, nullptr, OPT_HOST_X11},
    {"network", no_argument, nullptr, OPT_NETWORK},
    {"pulseaudio", no_argument, nullptr, OPT_PULSEAUDIO},
    {"dotwine", required_argument, nullptr, OPT_DOTWINE},
    {"pass", required_argument, nullptr, OPT_PASS},
    {"configure", no_argument, nullptr, OPT_CONFIGURE},
    {"no-pty", no_argument, nullptr, OPT_NO_PTY},
    {"no-wine", no_argument, nullptr, OPT_NO_WINE},
    {"retry", no_argument, nullptr, OPT_RETRY},
    {"debug-file", required_argument, nullptr, 'D'},
    {"quiet", no_argument, nullptr, OPT_QUIET},
    {"dry-run", no_argument, nullptr, OPT_DRY_RUN},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, OPT_VERSION},
    {nullptr, 0, nullptr, 0}};

// Print out a usage error. fmt is a format string for the error message to
// print. In CLI mode this does not return.
static int Usage(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
static int Usage(const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  size_t size = vsnprintf(nullptr, 0, fmt, ap) + 1;
  va_end(ap);

  vector<char> buffer(size);
  va_start(ap, fmt);
  vsnprintf(buffer.data(), size, fmt, ap);
  va_end(ap);

  if (SandwineGetErrorMode() == Mode::CLI) {
    fprintf(stderr, "%ssandwine: error: %s\n", kUsage, buffer.data());
    CloseLogFile();
    exit(EXIT_USAGE);
  }
  return SandwineReportErrorAndMessage(string(buffer.data()),
                                       ErrorCode::UsageError);
}

static int ValidatePathColonAccess(const char *option, const char *value) {
  string path;
  AccessMode access;
  if (!SplitPathColonAccess(value, path, access)) {
    return Usage("argument %s: %s", option,
                 PathColonAccessError(value).c_str());
  }
  return 0;
}

// Parses command line flags from an argv array and puts the results into the
// global opt struct.
static int ParseCommandLine(const vector<string>& args) {
  vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const string& arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const int argc = static_cast<int>(args.size());

  // Re-initialize getopt, ParseOptions may run more than once per process.
  optind = 0;
  opterr = 0;

  int c;
  // Stop at the first non-option, everything after belongs to PROGRAM.
  while ((c = getopt_long(argc, argv.data(), "+:hD:", kLongOptions,
                          nullptr)) != -1) {
    switch (c) {
      case OPT_X11:
        opt.x11 = X11Mode::AUTO;
        break;
      case OPT_NXAGENT:
        opt.x11 = X11Mode::NXAGENT;
        break;
      case OPT_XEPHYR:
        opt.x11 = X11Mode::XEPHYR;
        break;
      case OPT_XNEST:
        opt.x11 = X11Mode::XNEST;
        break;
      case OPT_XPRA:
        opt.x11 = X11Mode::XPRA;
        break;
      case OPT_XVFB:
        opt.x11 = X11Mode::XVFB;
        break;
      case OPT_HOST_X11:
        opt.x11 = X11Mode::HOST;
        break;
      case OPT_NETWORK:
        opt.network = true;
        break;
      case OPT_PULSEAUDIO:
        opt.pulseaudio = true;
        break;
      case OPT_DOTWINE:
        if (ValidatePathColonAccess("--dotwine", optarg) < 0) {
          return -1;
        }
        opt.dotwine.assign(optarg);
        break;
      case OPT_PASS:
        if (ValidatePathColonAccess("--pass", optarg) < 0) {
          return -1;
        }
        opt.extra_binds.emplace_back(optarg);
        break;
      case OPT_CONFIGURE:
        opt.configure = true;
        break;
      case OPT_NO_PTY:
        opt.with_pty = false;
        break;
      case OPT_NO_WINE:
        opt.with_wine = false;
        break;
      case OPT_RETRY:
        opt.second_try = true;
        break;
      case 'D':
        if (!opt.debug_path.empty()) {
          return Usage("Cannot write debug output to more than one file.");
        }
        opt.debug_path.assign(optarg);
        break;
      case OPT_QUIET:
        opt.quiet = true;
        break;
      case OPT_DRY_RUN:
        opt.dry_run = true;
        break;
      case 'h':
        printf("%s\n%s%s", kUsage, kDescription, kHelp);
        opt.exit_after_parse = true;
        return 0;
      case OPT_VERSION:
        printf("%s\n", SANDWINE_VERSION);
        opt.exit_after_parse = true;
        return 0;
      case ':':
        return Usage("argument %s: expected one argument", args[optind - 1].c_str());
      case '?':
      default:
        // Long options report their val in optopt, e.g. for --network=1.
        if (optopt > 0 && optopt < OPT_X11) {
          return Usage("unrecognized arguments: -%c", optopt);
        }
        return Usage("unrecognized arguments: %s", args[optind - 1].c_str());
    }
  }

  if (optind < argc) {
    opt.argv_0 = args[optind];
    opt.argv_1_plus.assign(args.begin() + optind + 1, args.end());
  }
  return 0;
}

// Expands a single argument, expanding options @filename to read in the content
// of the file and add it to the list of processed arguments.
static int ExpandArgument(vector<string>& expanded, const string& arg,
                          int depth) {
  if (arg.size() > 1 && arg[0] == '@') {
    const string filename = arg.substr(1);  // strip off the '@'.
    if (depth > 16) {
      return Usage("argument file %s nested too deeply", filename.c_str());
    }
    ifstream f(filename);

    if (!f.is_open()) {
      return Usage("opening argument file %s failed: %s", filename.c_str(),
                   strerror(errno));
    }

    for (string line; std::getline(f, line);) {
      if (!line.empty()) {
        if (ExpandArgument(expanded, line, depth + 1) < 0) {
          return -1;
        }
      }
    }

    if (f.bad()) {
      return Usage("error while reading from argument file %s",
                   filename.c_str());
    }
  } else {
    expanded.push_back(arg);
  }

  return 0;
}

// Pre-processes an argument list, expanding options @filename to read in the
// content of the file and add it to the list of arguments. Stops expanding
// arguments once it encounters "--" or the program to run.
static int ExpandArguments(const vector<string>& args, vector<string>& expanded) {
  expanded.reserve(args.size());
  if (args.empty()) {
    return 0;
  }
  expanded.push_back(args.front());

  // Options that take the next argument as their value.
  static const char *const kWithValue[] = {"-D", "--debug-file", "--dotwine",
                                           "--pass"};

  for (auto arg = args.begin() + 1; arg != args.end(); ++arg) {
    if (*arg == "--" || arg->empty() ||
        ((*arg)[0] != '-' && (*arg)[0] != '@')) {
      expanded.insert(expanded.end(), arg, args.end());
      break;
    }
    if (ExpandArgument(expanded, *arg, 0) < 0) {
      return -1;
    }
    for (const char *with_value : kWithValue) {
      if (*arg == with_value && arg + 1 != args.end()) {
        ++arg;
        expanded.push_back(*arg);
        break;
      }
    }
  }
  return 0;
}

int ParseOptions(const vector<string>& args) {
  vector<string> expanded;
  if (ExpandArguments(args, expanded) < 0) {
    return -1;
  }
  if (expanded.empty()) {
    expanded.emplace_back("sandwine");
  }
  return ParseCommandLine(expanded);
}

int ParseOptions(int argc, char *argv[]) {
  vector<string> args(argv, argv + argc);
  return ParseOptions(args);
}

void ResetOptions() {
  opt = Options();
}

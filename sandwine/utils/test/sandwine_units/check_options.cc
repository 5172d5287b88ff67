/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/wait.h>
#include <assert.h>

#include <string>
#include <vector>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/sandwine-options.h"

static int parse(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {"sandwine"};
    argv.insert(argv.end(), args.begin(), args.end());
    ResetOptions();
    SandwineClearError();
    return ParseOptions(argv);
}

// Parses `args` in a child running in CLI mode, the way the sandwine binary
// does. Returns the exit status, `output` gets what was written to `fd`.
static int parse_cli(const std::vector<std::string>& args, int fd,
                     std::string& output) {
    int out_pipe[2];
    assert(pipe(out_pipe) == 0);
    fflush(nullptr);
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(out_pipe[0]);
        dup2(out_pipe[1], fd);
        SandwineSetErrorMode(Mode::CLI);
        parse(args);
        fflush(nullptr);
        _exit(opt.exit_after_parse ? 0 : 42);
    }
    close(out_pipe[1]);
    output.clear();
    char buffer[4096];
    ssize_t n;
    while ((n = read(out_pipe[0], buffer, sizeof(buffer))) > 0) {
        output.append(buffer, n);
    }
    close(out_pipe[0]);
    int status;
    assert(waitpid(pid, &status, 0) == pid);
    assert(WIFEXITED(status));
    return WEXITSTATUS(status);
}

static void expect_usage_error(const std::vector<std::string>& args) {
    int res = parse(args);
    printf("usage error: %s\n", SandwineGetErrorMsg());
    assert(res < 0);
    assert(SandwineGetErrorCode() == static_cast<int>(ErrorCode::UsageError));
}

int main() {
    SandwineSetErrorMode(Mode::Library);

    // Defaults
    assert(parse({"notepad.exe"}) == 0);
    assert(opt.argv_0 == "notepad.exe");
    assert(opt.argv_1_plus.empty());
    assert(opt.x11 == X11Mode::NONE);
    assert(!opt.network && !opt.pulseaudio && !opt.configure);
    assert(opt.with_pty && opt.with_wine && !opt.second_try);
    assert(opt.dotwine.empty() && opt.extra_binds.empty());

    // The last X11 flag wins.
    assert(parse({"--xephyr", "--x11", "notepad.exe", "/x"}) == 0);
    assert(opt.x11 == X11Mode::AUTO);
    assert(opt.argv_1_plus == std::vector<std::string>({"/x"}));
    assert(parse({"--x11", "--host-x11-danger-danger", "notepad.exe"}) == 0);
    assert(opt.x11 == X11Mode::HOST);

    // Everything after PROGRAM belongs to PROGRAM.
    assert(parse({"--network", "prog", "--pulseaudio", "-D", "x"}) == 0);
    assert(opt.network);
    assert(!opt.pulseaudio);
    assert(opt.debug_path.empty());
    assert(opt.argv_1_plus == std::vector<std::string>({"--pulseaudio", "-D", "x"}));

    assert(parse({"--", "--weird-name"}) == 0);
    assert(opt.argv_0 == "--weird-name");

    assert(parse({"--pulseaudio", "--configure", "--no-pty", "--no-wine",
                  "--retry", "--quiet", "--dry-run", "--dotwine", "/tmp/p:rw",
                  "--pass", "/srv:ro", "--pass", "/opt:rw", "prog"}) == 0);
    assert(opt.pulseaudio && opt.configure && opt.second_try);
    assert(!opt.with_pty && !opt.with_wine);
    assert(opt.quiet && opt.dry_run);
    assert(opt.dotwine == "/tmp/p:rw");
    assert(opt.extra_binds == std::vector<std::string>({"/srv:ro", "/opt:rw"}));

    // --configure works without PROGRAM.
    assert(parse({"--configure"}) == 0);
    assert(opt.argv_0.empty());

    assert(parse({"--version"}) == 0);
    assert(opt.exit_after_parse);

    expect_usage_error({"--dotwine", "/tmp/p", "prog"});
    assert(strstr(SandwineGetErrorMsg(), "argument --dotwine") != nullptr);
    expect_usage_error({"--pass", "/tmp/p:xx", "prog"});
    expect_usage_error({"--dotwine"});
    expect_usage_error({"--no-such-option", "prog"});
    expect_usage_error({"-D", "/tmp/a", "-D", "/tmp/b", "prog"});

    // @FILE expansion, up to PROGRAM.
    char arg_file[] = "/tmp/sandwine-args-XXXXXX";
    int fd = mkstemp(arg_file);
    assert(fd >= 0);
    const char content[] = "--network\n--pass\n/tmp:ro\n\n--xvfb\n";
    assert(write(fd, content, sizeof(content) - 1) == sizeof(content) - 1);
    close(fd);

    const std::string at_file = std::string("@") + arg_file;
    assert(parse({at_file, "prog", at_file}) == 0);
    assert(opt.network);
    assert(opt.x11 == X11Mode::XVFB);
    assert(opt.extra_binds == std::vector<std::string>({"/tmp:ro"}));
    assert(opt.argv_0 == "prog");
    assert(opt.argv_1_plus == std::vector<std::string>({at_file}));

    unlink(arg_file);
    expect_usage_error({at_file, "prog"});

    // Command line mode
    std::string output;
    assert(parse_cli({"--help"}, STDOUT_FILENO, output) == 0);
    assert(output.find("usage: sandwine [OPTIONS] [--] PROGRAM [ARG ..]") == 0);
    assert(output.find("--dotwine PATH:{ro,rw}") != std::string::npos);
    assert(output.find("--host-x11-danger-danger") != std::string::npos);

    assert(parse_cli({"--dotwine", "/tmp/p", "prog"}, STDERR_FILENO, output) == EXIT_USAGE);
    printf("%s", output.c_str());
    assert(output.find("usage: sandwine") == 0);
    assert(output.find("sandwine: error: argument --dotwine: Value '/tmp/p' does not "
                       "match pattern \"PATH:{ro,rw}\".") != std::string::npos);

    assert(parse_cli({"--network=1", "prog"}, STDERR_FILENO, output) == EXIT_USAGE);
    printf("%s", output.c_str());
    assert(output.find("unrecognized arguments: --network=1") != std::string::npos);

    assert(parse_cli({"-x", "prog"}, STDERR_FILENO, output) == EXIT_USAGE);
    assert(output.find("unrecognized arguments: -x") != std::string::npos);

    assert(parse_cli({"-D"}, STDERR_FILENO, output) == EXIT_USAGE);
    assert(output.find("argument -D: expected one argument") != std::string::npos);

    printf("option parsing OK\n");
    return 0;
}

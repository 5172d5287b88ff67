/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <assert.h>

#include <algorithm>
#include <string>
#include <vector>

#include "src/main/tools/argv-builder.h"
#include "src/main/tools/bwrap-argv.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/sandwine-options.h"

typedef std::vector<std::string> Group;

static const char kHome[] = "/tmp/sandwine-test-home";

static bool has_group(const ArgvBuilder& argv, const Group& group) {
    const auto& groups = argv.Groups();
    return std::find(groups.begin(), groups.end(), group) != groups.end();
}

static bool has_setenv(const ArgvBuilder& argv, const std::string& name) {
    for (const Group& group : argv.Groups()) {
        if (group.size() == 3 && group[0] == "--setenv" && group[1] == name) {
            return true;
        }
    }
    return false;
}

// Returns false if a required host directory is missing on this machine.
static bool build(Options& config, ArgvBuilder& argv) {
    SandwineClearError();
    int res = CreateBwrapArgv(config, argv);
    if (res < 0) {
        printf("CreateBwrapArgv: %s\n", SandwineGetErrorMsg());
        assert(SandwineGetErrorCode() == static_cast<int>(ErrorCode::PathDoesNotExist));
        return false;
    }
    return true;
}

static Options default_config() {
    Options config;
    config.argv_0 = "notepad.exe";
    config.argv_1_plus = {"C:\\a b.txt"};
    return config;
}

int main() {
    SandwineSetErrorMode(Mode::Library);
    setenv("HOME", kHome, 1);
    setenv("PATH", "/usr/bin:/nonexistent/bin:/bin", 1);
    setenv("TERM", "xterm", 1);
    unsetenv("WINEDEBUG");

    for (const char* dir : {"/bin", "/etc", "/lib", "/lib64", "/sys", "/usr"}) {
        if (!PathExists(dir)) {
            Options config = default_config();
            ArgvBuilder argv;
            assert(!build(config, argv));
            printf("skipping, %s is missing on this host\n", dir);
            return 0;
        }
    }

    // Defaults
    {
        Options config = default_config();
        ArgvBuilder argv;
        assert(build(config, argv));
        argv.AnnounceTo(stdout);

        const std::vector<Group>& groups = argv.Groups();
        assert(groups[0] == Group({"bwrap"}));
        assert(groups[1] == Group({"--disable-userns"}));
        assert(groups[2] == Group({"--die-with-parent"}));
        assert(groups[3].size() == 2 && groups[3][0] == "--hostname");
        const std::string& hostname = groups[3][1];
        assert(hostname.size() == HOSTNAME_LENGTH);
        assert(hostname.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(groups[4] == Group({"--unshare-user", "--unshare-all"}));
        assert(groups[5] == Group({"--tmpfs", "/"}));

        assert(has_group(argv, {"--ro-bind", "/usr", "/usr"}));
        assert(has_group(argv, {"--dev", "/dev"}));
        assert(has_group(argv, {"--proc", "/proc"}));
        assert(has_group(argv, {"--tmpfs", kHome}));
        assert(has_group(argv, {"--tmpfs", std::string(kHome) + "/.wine"}));
        assert(has_group(argv, {"--setenv", "container", "sandwine"}));
        assert(has_group(argv, {"--setenv", "HOSTNAME", hostname}));
        assert(has_group(argv, {"--setenv", "TERM", "xterm"}));
        assert(!has_setenv(argv, "WINEDEBUG"));
        assert(!has_setenv(argv, "DISPLAY"));

        // Directories outside the mount stack are dropped from PATH.
        std::string path;
        for (const Group& group : groups) {
            if (group.size() == 3 && group[0] == "--setenv" && group[1] == "PATH") {
                path = group[2];
            }
        }
        assert(path.find("/nonexistent") == std::string::npos);
        assert(path.find(RealPath("/usr/bin")) != std::string::npos);

        // Mounts come sorted by target, environment sorted by name.
        auto clearenv = std::find(groups.begin(), groups.end(), Group({"--clearenv"}));
        assert(clearenv != groups.end());
        std::string previous_target;
        for (auto it = groups.begin() + 5; it != clearenv; ++it) {
            const std::string& target = it->back();
            assert(previous_target <= target);
            previous_target = target;
        }
        std::string previous_name;
        auto separator = std::find(clearenv, groups.end(), Group({"--"}));
        assert(separator != groups.end());
        for (auto it = clearenv + 1; it != separator; ++it) {
            assert((*it)[0] == "--setenv");
            assert(previous_name < (*it)[1]);
            previous_name = (*it)[1];
        }

        assert(*(separator + 1) == Group({"sh", "-c", WINESERVER_WRAPPER}));
        // No display, no winecfg.
        assert(!has_group(argv, {"sh", "-c", WINECFG_WRAPPER}));
        assert(groups.back() == Group({"script", "-e", "-q", "-c",
                                       "exec wine notepad.exe 'C:\\a b.txt'",
                                       "/dev/null"}));
    }

    // No Wine, no PTY, networking, retry
    {
        Options config = default_config();
        config.with_wine = false;
        config.with_pty = false;
        config.network = true;
        config.second_try = true;
        ArgvBuilder argv;
        assert(build(config, argv));
        assert(argv.Groups()[4] == Group({"--unshare-user", "--unshare-all", "--share-net"}));
        assert(!has_group(argv, {"sh", "-c", WINESERVER_WRAPPER}));
        assert(has_group(argv, {"sh", "-c", RETRY_WRAPPER}));
        assert(argv.Groups().back() == Group({"notepad.exe", "C:\\a b.txt"}));
    }

    // Nothing to run
    {
        Options config;
        config.configure = true;
        ArgvBuilder argv;
        assert(build(config, argv));
        assert(argv.Groups().back() == Group({"true"}));
    }

    // X11 binds the socket of the chosen display even before it exists.
    {
        Options config = default_config();
        config.x11 = X11Mode::XVFB;
        config.x11_display_number = 4711;
        ArgvBuilder argv;
        assert(build(config, argv));
        assert(has_group(argv, {"--bind", "/tmp/.X11-unix/X4711", "/tmp/.X11-unix/X4711"}));
        assert(has_group(argv, {"--setenv", "DISPLAY", ":4711"}));
        assert(has_group(argv, {"sh", "-c", WINECFG_WRAPPER}));
    }

    // X11 without a resolved display is a bug of the caller.
    {
        Options config = default_config();
        config.x11 = X11Mode::XEPHYR;
        ArgvBuilder argv;
        assert(CreateBwrapArgv(config, argv) < 0);
    }

    // Missing --pass paths are fatal.
    {
        Options config = default_config();
        config.extra_binds = {"/nonexistent/sandwine/path:ro"};
        ArgvBuilder argv;
        assert(!build(config, argv));
        assert(strstr(SandwineGetErrorMsg(), "/nonexistent/sandwine/path") != nullptr);
    }

    // --pass and --dotwine
    {
        char prefix_parent[] = "/tmp/sandwine-prefix-XXXXXX";
        assert(mkdtemp(prefix_parent) != nullptr);
        const std::string prefix = std::string(prefix_parent) + "/wine";

        Options config = default_config();
        config.extra_binds = {"/tmp:rw"};
        config.dotwine = prefix + ":rw";
        config.dry_run = true;
        ArgvBuilder argv;
        assert(build(config, argv));
        assert(has_group(argv, {"--bind", "/tmp", "/tmp"}));
        assert(has_group(argv, {"--bind", prefix, std::string(kHome) + "/.wine"}));
        assert(!PathExists(prefix));

        config.dry_run = false;
        ArgvBuilder argv_created;
        assert(build(config, argv_created));
        assert(PathExists(prefix));

        rmdir(prefix.c_str());
        rmdir(prefix_parent);
    }

    // An empty --pass path is the working directory.
    {
        char cwd[4096];
        assert(getcwd(cwd, sizeof(cwd)) != nullptr);
        assert(chdir("/tmp") == 0);
        Options config = default_config();
        config.extra_binds = {":ro"};
        ArgvBuilder argv;
        assert(build(config, argv));
        assert(has_group(argv, {"--ro-bind", "/tmp", "/tmp"}));
        assert(chdir(cwd) == 0);
    }

    // A PROGRAM path gets optional binds for itself and its .exe/.EXE twins,
    // whichever exist.
    {
        char program_dir[] = "/tmp/sandwine-program-XXXXXX";
        assert(mkdtemp(program_dir) != nullptr);
        const std::string program = std::string(program_dir) + "/setup";
        FILE* exe = fopen((program + ".exe").c_str(), "w");
        assert(exe != nullptr);
        fclose(exe);

        Options config = default_config();
        config.argv_0 = program;
        ArgvBuilder argv;
        assert(build(config, argv));
        assert(has_group(argv, {"--ro-bind", program + ".exe", program + ".exe"}));
        assert(!has_group(argv, {"--ro-bind", program, program}));
        assert(!has_group(argv, {"--ro-bind", program + ".EXE", program + ".EXE"}));

        unlink((program + ".exe").c_str());
        rmdir(program_dir);

        // Nothing of it exists: all three are dropped without an error.
        config.argv_0 = "/nonexistent/sandwine/setup";
        ArgvBuilder argv_missing;
        assert(build(config, argv_missing));
        for (const Group& group : argv_missing.Groups()) {
            assert(group.back().find("/nonexistent/sandwine") == std::string::npos ||
                   group[0] == "script");
        }
    }

    // Optional base mounts follow the host.
    {
        Options config = default_config();
        ArgvBuilder argv;
        assert(build(config, argv));
        for (const char* optional : {"/dev/dri", "/lib32"}) {
            const bool bound = has_group(argv, {"--dev-bind", optional, optional}) ||
                               has_group(argv, {"--ro-bind", optional, optional});
            printf("%s: host %d, bound %d\n", optional, PathExists(optional), bound);
            assert(bound == PathExists(optional));
        }
    }

    // --pulseaudio needs the user's PulseAudio socket.
    {
        const std::string socket =
            "/run/user/" + std::to_string(getuid()) + "/pulse/native";
        Options config = default_config();
        config.pulseaudio = true;
        ArgvBuilder argv;
        if (PathExists(socket)) {
            assert(build(config, argv));
            assert(has_group(argv, {"--bind", socket, socket}));
            assert(has_group(argv, {"--setenv", "PULSE_SERVER", "unix:" + socket}));
        } else {
            assert(!build(config, argv));
            assert(strstr(SandwineGetErrorMsg(), socket.c_str()) != nullptr);
        }
    }

    // A freshly created prefix is configured, if there is a display for it.
    {
        char prefix_parent[] = "/tmp/sandwine-prefix-XXXXXX";
        assert(mkdtemp(prefix_parent) != nullptr);
        const std::string prefix = std::string(prefix_parent) + "/wine";

        Options config = default_config();
        config.dotwine = prefix + ":rw";
        ArgvBuilder argv_headless;
        assert(build(config, argv_headless));
        assert(PathExists(prefix));
        assert(!has_group(argv_headless, {"sh", "-c", WINECFG_WRAPPER}));
        rmdir(prefix.c_str());

        config.x11 = X11Mode::XVFB;
        config.x11_display_number = 4711;
        ArgvBuilder argv_fresh;
        assert(build(config, argv_fresh));
        assert(has_group(argv_fresh, {"sh", "-c", WINECFG_WRAPPER}));

        // The prefix exists now.
        ArgvBuilder argv_existing;
        assert(build(config, argv_existing));
        assert(!has_group(argv_existing, {"sh", "-c", WINECFG_WRAPPER}));

        config.configure = true;
        ArgvBuilder argv_configure;
        assert(build(config, argv_configure));
        assert(has_group(argv_configure, {"sh", "-c", WINECFG_WRAPPER}));

        rmdir(prefix.c_str());
        rmdir(prefix_parent);
    }

    printf("bwrap argv OK\n");
    return 0;
}

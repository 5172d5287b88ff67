/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/bwrap-argv.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/x11.h"

#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <map>
#include <random>


namespace {

// Either a fixed value or a variable copied from the host environment.
struct EnvTask {
  bool inherit;
  std::string value;
};

typedef std::map<std::string, EnvTask> EnvTasks;

void InheritEnv(EnvTasks& env_tasks, const std::string& name) {
  env_tasks[name] = EnvTask{true, ""};
}

void SetEnv(EnvTasks& env_tasks, const std::string& name,
            const std::string& value) {
  env_tasks[name] = EnvTask{false, value};
}

int AddWinePrefixMount(const Options& config, const std::string& home_dir,
                       std::vector<MountTask>& mount_tasks,
                       std::vector<std::string>& unchecked_targets,
                       bool& run_winecfg) {
  const std::string dotwine_target = home_dir + "/.wine";

  if (config.dotwine.empty()) {
    mount_tasks.emplace_back(MountMode::TMPFS, dotwine_target);
    return 0;
  }

  std::string dotwine_source;
  AccessMode dotwine_access;
  int res = ParsePathColonAccess(config.dotwine, dotwine_source, dotwine_access);
  if (res < 0) {
    return res;
  }
  dotwine_source = AbsolutePath(dotwine_source);
  mount_tasks.emplace_back(BindModeFor(dotwine_access), dotwine_target,
                           dotwine_source);

  if (!PathExists(dotwine_source)) {
    if (config.dry_run) {
      PRINT_INFO("Would create directory '%s'...", dotwine_source.c_str());
      unchecked_targets.push_back(dotwine_target);
    } else {
      PRINT_INFO("Creating directory '%s'...", dotwine_source.c_str());
      if ((res = CreateDirectories(dotwine_source, 0700)) < 0) {
        return res;
      }
    }
    // A fresh prefix always gets winecfg, except without X11 where winecfg
    // has no display to run on.
    run_winecfg = run_winecfg || config.x11 != X11Mode::NONE;
  }
  return 0;
}

int AddExtraBinds(const Options& config, std::vector<MountTask>& mount_tasks) {
  for (const std::string& bind : config.extra_binds) {
    std::string mount_target;
    AccessMode mount_access;
    int res = ParsePathColonAccess(bind, mount_target, mount_access);
    if (res < 0) {
      return res;
    }
    mount_tasks.emplace_back(BindModeFor(mount_access),
                             AbsolutePath(mount_target));
  }
  return 0;
}

// Emits the sorted mount stack. Sources of `unchecked_targets` need not exist
// yet. Targets of the bind mounts that made it into the command line are
// collected in `bound_targets`.
int EmitMounts(std::vector<MountTask>& mount_tasks,
               const std::vector<std::string>& unchecked_targets,
               ArgvBuilder& argv,
               std::vector<std::string>& bound_targets) {
  SortMountTasks(mount_tasks);

  for (MountTask& mount_task : mount_tasks) {
    switch (mount_task.mode) {
      case MountMode::TMPFS:
        argv.Add({"--tmpfs", mount_task.target});
        continue;
      case MountMode::DEVTMPFS:
        argv.Add({"--dev", mount_task.target});
        continue;
      case MountMode::PROC:
        argv.Add({"--proc", mount_task.target});
        continue;
      case MountMode::BIND_RO:
      case MountMode::BIND_RW:
      case MountMode::BIND_DEV:
        break;
    }

    if (mount_task.source.empty()) {
      mount_task.source = mount_task.target;
    }

    const bool unchecked =
        std::find(unchecked_targets.begin(), unchecked_targets.end(),
                  mount_task.target) != unchecked_targets.end();
    if (!unchecked && !PathExists(mount_task.source)) {
      if (mount_task.required) {
        return SandwineReportErrorAndMessage(
            "Path '" + mount_task.source +
                "' does not exist on the host, aborting.",
            ErrorCode::PathDoesNotExist);
      }
      PRINT_DEBUG("Path '%s' does not exist on the host, dropped %s mount.",
                  mount_task.source.c_str(), MountModeName(mount_task.mode));
      continue;
    }

    if (mount_task.mode == MountMode::BIND_RO) {
      argv.Add({"--ro-bind", mount_task.source, mount_task.target});
    } else if (mount_task.mode == MountMode::BIND_RW) {
      argv.Add({"--bind", mount_task.source, mount_task.target});
    } else {
      argv.Add({"--dev-bind", mount_task.source, mount_task.target});
    }
    bound_targets.push_back(mount_task.target);
  }
  return 0;
}

// Host $PATH reduced to the directories that are visible inside the sandbox.
std::string FilterPath(const std::vector<std::string>& bound_targets) {
  const char* host_path = getenv("PATH");
  std::vector<std::string> candidates;
  if (host_path != nullptr) {
    candidates = SplitString(host_path, ':');
  }
  candidates.emplace_back(WINE_LIBDIR);

  std::string available;
  for (const std::string& candidate : candidates) {
    if (candidate.empty()) {
      continue;
    }
    const std::string real = RealPath(candidate);
    const std::string real_dir = SingleTrailingSep(real);
    for (const std::string& target : bound_targets) {
      if (real_dir.compare(0, SingleTrailingSep(target).size(),
                           SingleTrailingSep(target)) == 0) {
        if (!available.empty()) {
          available += ':';
        }
        available += real;
        break;
      }
    }
  }
  return available;
}

}  // namespace


std::string RandomHostname() {
  static const char kHexDigits[] = "0123456789abcdef";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 15);

  std::string hostname;
  for (int i = 0; i < HOSTNAME_LENGTH; i++) {
    hostname += kHexDigits[dis(gen)];
  }
  return hostname;
}


std::vector<MountTask> BaseMountTasks(const std::string& home_dir) {
  return {
      MountTask(MountMode::TMPFS, "/"),
      MountTask(MountMode::BIND_RO, "/bin"),
      MountTask(MountMode::DEVTMPFS, "/dev"),
      // Not present on machines without a GPU.
      MountTask(MountMode::BIND_DEV, "/dev/dri", "", false),
      MountTask(MountMode::BIND_RO, "/etc"),
      MountTask(MountMode::BIND_RO, "/lib"),
      MountTask(MountMode::BIND_RO, "/lib32", "", false),
      MountTask(MountMode::BIND_RO, "/lib64"),
      MountTask(MountMode::PROC, "/proc"),
      MountTask(MountMode::BIND_RO, "/sys"),
      MountTask(MountMode::TMPFS, "/tmp"),
      MountTask(MountMode::BIND_RO, "/usr"),
      MountTask(MountMode::TMPFS, home_dir),
  };
}


int CreateBwrapArgv(const Options& config, ArgvBuilder& argv) {
  int res = 0;
  const std::string my_home = GetHomeDir();
  std::vector<MountTask> mount_tasks = BaseMountTasks(my_home);

  EnvTasks env_tasks;
  for (const char* name : {"HOME", "TERM", "USER", "WINEDEBUG"}) {
    InheritEnv(env_tasks, name);
  }
  SetEnv(env_tasks, "container", "sandwine");
  std::vector<std::string> unshare_args = {"--unshare-user", "--unshare-all"};

  argv.Add({"bwrap"});
  argv.Add({"--disable-userns"});
  argv.Add({"--die-with-parent"});

  // Hostname
  const std::string hostname = RandomHostname();
  SetEnv(env_tasks, "HOSTNAME", hostname);
  argv.Add({"--hostname", hostname});

  // Networking
  if (config.network) {
    unshare_args.emplace_back("--share-net");
    mount_tasks.emplace_back(MountMode::BIND_RO,
                             "/run/NetworkManager/resolv.conf", "", false);
    mount_tasks.emplace_back(MountMode::BIND_RO,
                             "/run/systemd/resolve/stub-resolv.conf", "", false);
  }

  // Sound
  if (config.pulseaudio) {
    const std::string pulseaudio_socket =
        "/run/user/" + std::to_string(getuid()) + "/pulse/native";
    SetEnv(env_tasks, "PULSE_SERVER", "unix:" + pulseaudio_socket);
    mount_tasks.emplace_back(MountMode::BIND_RW, pulseaudio_socket);
  }

  // X11
  std::vector<std::string> unchecked_targets;
  if (config.x11 != X11Mode::NONE) {
    if (config.x11_display_number < 0) {
      return SandwineReportGenericError("X11 display number not resolved");
    }
    const std::string x11_unix_socket =
        X11Display(config.x11_display_number).GetUnixSocket();
    mount_tasks.emplace_back(MountMode::BIND_RW, x11_unix_socket);
    // The socket only appears once the nested server runs.
    unchecked_targets.push_back(x11_unix_socket);
    SetEnv(env_tasks, "DISPLAY", ":" + std::to_string(config.x11_display_number));
  }

  // Wine
  bool run_winecfg = config.x11 != X11Mode::NONE &&
                     (config.configure || config.dotwine.empty());
  if ((res = AddWinePrefixMount(config, my_home, mount_tasks, unchecked_targets,
                                run_winecfg)) < 0) {
    return res;
  }

  // Extra binds
  if ((res = AddExtraBinds(config, mount_tasks)) < 0) {
    return res;
  }

  // Program
  if (config.argv_0.find('/') != std::string::npos) {
    const std::string real_argv_0 = AbsolutePath(config.argv_0);
    mount_tasks.emplace_back(MountMode::BIND_RO, real_argv_0, "", false);
    mount_tasks.emplace_back(MountMode::BIND_RO, real_argv_0 + ".exe", "", false);
    mount_tasks.emplace_back(MountMode::BIND_RO, real_argv_0 + ".EXE", "", false);
  }

  // Linux Namespaces
  argv.Add(unshare_args);

  // Mount stack
  std::vector<std::string> bound_targets;
  if ((res = EmitMounts(mount_tasks, unchecked_targets, argv, bound_targets)) < 0) {
    return res;
  }

  // Filter ${PATH}
  SetEnv(env_tasks, "PATH", FilterPath(bound_targets));

  // Environment variables, sorted by name
  argv.Add({"--clearenv"});
  for (const auto& env_task : env_tasks) {
    std::string value = env_task.second.value;
    if (env_task.second.inherit) {
      const char* host_value = getenv(env_task.first.c_str());
      if (host_value == nullptr) {
        continue;
      }
      value = host_value;
    }
    argv.Add({"--setenv", env_task.first, value});
  }

  argv.Add({"--"});

  // Wrap with wineserver (for clean shutdown, it defaults to 3 seconds timeout)
  if (config.with_wine) {
    argv.Add({"sh", "-c", WINESERVER_WRAPPER});
  }

  if (run_winecfg && config.with_wine) {
    argv.Add({"sh", "-c", WINECFG_WRAPPER});
  }

  if (config.second_try) {
    argv.Add({"sh", "-c", RETRY_WRAPPER});
  }

  // Wine and PTY
  if (!config.argv_0.empty()) {
    std::vector<std::string> inner_argv;
    if (config.with_wine) {
      inner_argv.emplace_back("wine");
    }
    inner_argv.push_back(config.argv_0);
    inner_argv.insert(inner_argv.end(), config.argv_1_plus.begin(),
                      config.argv_1_plus.end());

    if (config.with_pty) {
      argv.Add({"script", "-e", "-q", "-c", "exec " + ShellJoin(inner_argv),
                "/dev/null"});
    } else {
      argv.Add(inner_argv);
    }
  } else {
    argv.Add({"true"});
  }

  return 0;
}

/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <assert.h>

#include <string>
#include <vector>

#include "src/main/tools/sandwine-api.h"

int main() {
    printf("starting program out of the sandbox\n");

    std::vector<std::string> argv;
    int res = sandwine_parse_arguments({"--dotwine", "/tmp/prefix", "notepad.exe"});
    assert(res < 0);
    printf("error code set to %d\n", sandwine_get_last_error_code());
    printf("%s\n\n", sandwine_get_last_error_msg());
    assert(sandwine_get_last_error_code() < 0);

    sandwine_reset();
    assert(sandwine_get_last_error_code() == 0);

    res = sandwine_parse_arguments({"--quiet", "--dry-run", "--no-wine", "--no-pty",
                                    "sh", "-c", "exit 0"});
    assert(res == 0);
    res = sandwine_create_bwrap_argv(argv);
    if (res < 0) {
        // Hosts without /lib64 cannot build the default mount stack.
        printf("%s\n", sandwine_get_last_error_msg());
        return 0;
    }
    assert(argv.front() == "bwrap");
    assert(argv[argv.size() - 3] == "sh");
    assert(argv.back() == "exit 0");

    // --dry-run only prints the command line.
    assert(sandwine_start() == 0);

    sandwine_reset();
    printf("library client OK\n");
    return 0;
}

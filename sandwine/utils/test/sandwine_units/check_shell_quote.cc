/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <assert.h>

#include <string>

#include "src/main/tools/argv-builder.h"

int main() {
    assert(ShellQuote("") == "''");
    assert(ShellQuote("notepad.exe") == "notepad.exe");
    assert(ShellQuote("/usr/lib/wine:rw") == "/usr/lib/wine:rw");
    assert(ShellQuote("a b") == "'a b'");
    assert(ShellQuote("$HOME") == "'$HOME'");
    assert(ShellQuote("it's") == "'it'\"'\"'s'");

    assert(ShellJoin({"wine", "C:\\Program Files\\x.exe", "-v"}) ==
           "wine 'C:\\Program Files\\x.exe' -v");

    ArgvBuilder argv;
    argv.Add({"bwrap"});
    argv.Add(std::vector<std::string>());
    argv.Add({"--tmpfs", "/"});
    argv.Add(std::vector<std::string>{"sh", "-c", "exit 0"});
    assert(argv.Groups().size() == 3);

    std::vector<std::string> flat = argv.Flat();
    assert(flat.size() == 6);
    assert(flat[0] == "bwrap");
    assert(flat[5] == "exit 0");

    char* buffer = nullptr;
    size_t size = 0;
    FILE* stream = open_memstream(&buffer, &size);
    assert(stream != nullptr);
    argv.AnnounceTo(stream);
    fclose(stream);

    const std::string expected =
        "# bwrap \\\n"
        "    --tmpfs / \\\n"
        "    sh -c 'exit 0'\n";
    printf("%s", buffer);
    assert(std::string(buffer, size) == expected);
    free(buffer);

    printf("shell quoting OK\n");
    return 0;
}

/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "src/main/tools/sandwine-api.h"


namespace py = pybind11;
PYBIND11_MODULE(pysandwine, m) {
    m.doc() = "Python bindings for libsandwine";
    m.def("sandwine_parse_arguments", &sandwine_parse_arguments, py::arg("args"), "Parse sandwine command line arguments");
    m.def("sandwine_create_bwrap_argv", []() -> py::object {
        std::vector<std::string> argv;
        if (sandwine_create_bwrap_argv(argv) < 0) {
            return py::none();
        }
        return py::cast(argv);
    }, "Return the bubblewrap command line, or None on error");
    m.def("sandwine_start", &sandwine_start, "Run the sandbox and return the exit code");
    m.def("sandwine_reset", &sandwine_reset, "Forget the parsed configuration and the last error");

    m.def("sandwine_get_last_error_code", &sandwine_get_last_error_code);
    m.def("sandwine_get_last_error_msg", []() -> std::string { return std::string(sandwine_get_last_error_msg()); });
}

#pragma once

// Declarations for the test runner.
//
// Each test file defines its own local TEMPEST_ASSERT macro and one
// `int test_xxx()` entry point returning non-zero on failure.

#include <iostream>

int test_ode();
int test_ecology();
int test_network();
int test_hazards();
int test_simulation();
int test_network_io();
int test_scenario();
int test_history_export();
int test_json_errors();
int test_file_io();
int test_log();

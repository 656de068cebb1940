// tests/test_framework/test_entrypoint.h
#pragma once

#include "ct_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Registration point for worker scenario dispatchers.
 */

// Path of the running test executable; workers are spawned from it.
extern std::string g_self_exe_path;

/**
 * @brief A worker dispatcher: receives main()'s arguments, returns the worker's exit
 *        code, or -1 when argv[1] names a scenario it does not own.
 */
using WorkerDispatchFn = int (*)(int argc, char **argv);

void register_worker_dispatcher(WorkerDispatchFn fn);

// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief main() for every calltrace test executable.
 *
 * 1. **Worker mode**: started as `<exe> module.scenario [args...]`, the registered
 *    dispatchers are tried in order and the first one that owns the scenario runs it.
 *    Each worker installs its own TraceConfig before its first log record, so the
 *    once-per-process sinks point at the directory the parent test chose.
 *
 * 2. **Test runner mode**: runs GoogleTest. Tests in this mode share one set of log
 *    sinks; unless the environment already says otherwise they go to a temporary
 *    directory instead of the working directory.
 */
#include "test_entrypoint.h"
#include "ct_base.hpp"

#include <cstdlib>
#include <filesystem>
#include <vector>

std::string g_self_exe_path;

namespace fs = std::filesystem;

static std::vector<WorkerDispatchFn> &worker_dispatchers()
{
    static std::vector<WorkerDispatchFn> list;
    return list;
}

void register_worker_dispatcher(WorkerDispatchFn fn)
{
    worker_dispatchers().push_back(fn);
}

int main(int argc, char **argv)
{
    g_self_exe_path = (argc >= 1) ? argv[0] : "";

    if (argc > 1)
    {
        std::string mode_str = argv[1];
        if (mode_str.find('.') != std::string::npos && mode_str.rfind("--", 0) != 0)
        {
            for (auto fn : worker_dispatchers())
            {
                int r = fn(argc, argv);
                if (r != -1)
                    return r;
            }
        }
    }

    if (std::getenv("CALLTRACE_LOG_FILE_PATH") == nullptr)
    {
        const auto dir = fs::temp_directory_path() /
                         fmt::format("calltrace_tests_{}", calltrace::platform::get_pid());
        ::setenv("CALLTRACE_LOG_FILE_PATH", dir.c_str(), 0);
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

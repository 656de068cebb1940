/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the few OS queries the logger needs.
 *
 * Process and thread ids stamp every LogMessage; the machine architecture is the
 * default host label printed at the start of every log line.
 */
#include "ct_base.hpp"

#include <functional>
#include <thread>

#if defined(CALLTRACE_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace calltrace::platform
{

uint64_t get_pid() noexcept
{
#if defined(CALLTRACE_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(CALLTRACE_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(CALLTRACE_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(CALLTRACE_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_machine_arch() noexcept
{
    try
    {
#if defined(CALLTRACE_PLATFORM_WIN64)
        SYSTEM_INFO info{};
        GetNativeSystemInfo(&info);
        switch (info.wProcessorArchitecture)
        {
        case PROCESSOR_ARCHITECTURE_AMD64:
            return "x86_64";
        case PROCESSOR_ARCHITECTURE_ARM64:
            return "aarch64";
        case PROCESSOR_ARCHITECTURE_INTEL:
            return "x86";
        default:
            return "unknown";
        }
#elif defined(CALLTRACE_IS_POSIX)
        struct utsname uts
        {
        };
        if (::uname(&uts) != 0)
            return "unknown";
        return std::string(uts.machine);
#else
        return "unknown";
#endif
    }
    catch (const std::exception &)
    {
        return "unknown";
    }
}

} // namespace calltrace::platform

#pragma once
/**
 * @file ct_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (CALLTRACE_PLATFORM_LINUX, CALLTRACE_IS_POSIX, ...)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_LINUX) && !defined(PLATFORM_APPLE) &&           \
                                !defined(PLATFORM_FREEBSD) && defined(_WIN64))
#define CALLTRACE_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define CALLTRACE_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define CALLTRACE_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define CALLTRACE_PLATFORM_LINUX 1
#else
#define CALLTRACE_PLATFORM_UNKNOWN 1
#endif

// Convenience booleans for source code usage:
#if defined(CALLTRACE_PLATFORM_WIN64)
#define CALLTRACE_IS_WINDOWS 1
#elif defined(CALLTRACE_PLATFORM_APPLE) || defined(CALLTRACE_PLATFORM_FREEBSD) ||                 \
    defined(CALLTRACE_PLATFORM_LINUX)
#define CALLTRACE_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location and __VA_OPT__ are used throughout.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "calltrace_export.h"

namespace calltrace::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
CALLTRACE_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
CALLTRACE_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the machine architecture label of the host (e.g. "x86_64", "aarch64").
 * @details POSIX uses `uname(2)`; Windows maps `GetNativeSystemInfo()`.
 * @return The architecture label, or "unknown" when it cannot be determined.
 */
CALLTRACE_EXPORT std::string get_machine_arch() noexcept;

} // namespace calltrace::platform

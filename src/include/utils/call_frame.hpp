#pragma once

/*******************************************************************************
 * @file call_frame.hpp
 * @brief A thread-local, RAII-maintained stack of function names.
 *
 * This is the restricted frame walk the Logger uses to find its caller's caller:
 * traced calls push their own name, and test or application code can push one with
 * CALLTRACE_FRAME(). Uses a fixed-capacity thread-local buffer, no heap allocation.
 * Frames pushed past the capacity are counted but not recorded; while the stack is
 * that deep, top() and caller_of() report nothing.
 ******************************************************************************/
#include "utils/format_tools.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <source_location>
#include <string_view>

namespace calltrace::basics
{

// Configurable at compile time via CMake option CALLTRACE_CALL_FRAME_MAX_DEPTH (default 256).
#ifndef CALLTRACE_CALL_FRAME_MAX_DEPTH
#define CALLTRACE_CALL_FRAME_MAX_DEPTH 256
#endif

constexpr size_t kMaxCallFrameDepth = CALLTRACE_CALL_FRAME_MAX_DEPTH;

struct CallFrameStack
{
    std::array<std::string_view, kMaxCallFrameDepth> names{};
    /// Logical depth; may exceed kMaxCallFrameDepth.
    size_t size = 0;

    [[nodiscard]] bool overflowed() const noexcept { return size > kMaxCallFrameDepth; }
};

inline CallFrameStack &get_call_frame_stack() noexcept
{
    static thread_local CallFrameStack g_call_frames;
    return g_call_frames;
}

/**
 * @class CallFrameGuard
 * @brief Pushes a function name onto the calling thread's frame stack for its lifetime.
 *
 * @warning The characters behind @p name must outlive the guard. Names taken from
 *          `std::source_location` or from a CallableDescriptor held by the running
 *          traced call satisfy this.
 */
class CallFrameGuard
{
  public:
    explicit CallFrameGuard(std::string_view name) noexcept : active_(true)
    {
        auto &st = get_call_frame_stack();
        if (st.size < kMaxCallFrameDepth)
            st.names[st.size] = name;
        ++st.size;
    }

    ~CallFrameGuard() noexcept
    {
        if (!active_)
            return;
        auto &st = get_call_frame_stack();
        if (st.size > 0)
            --st.size;
    }

    CallFrameGuard(const CallFrameGuard &) = delete;
    CallFrameGuard &operator=(const CallFrameGuard &) = delete;
    CallFrameGuard &operator=(CallFrameGuard &&) = delete;
    CallFrameGuard(CallFrameGuard &&other) noexcept : active_(other.active_)
    {
        other.active_ = false;
    }

    [[nodiscard]] static size_t depth() noexcept { return get_call_frame_stack().size; }

    [[nodiscard]] static std::optional<std::string_view> top() noexcept
    {
        const auto &st = get_call_frame_stack();
        if (st.size == 0 || st.overflowed())
            return std::nullopt;
        return st.names[st.size - 1];
    }

    /**
     * @brief Returns the frame that called @p caller.
     *
     * When the innermost frame is @p caller itself the frame below it is returned.
     * When @p caller never pushed a frame the innermost frame is its caller.
     * Returns std::nullopt when the stack does not reach that far, or when it is
     * deeper than kMaxCallFrameDepth.
     */
    [[nodiscard]] static std::optional<std::string_view>
    caller_of(std::string_view caller) noexcept
    {
        const auto &st = get_call_frame_stack();
        if (st.size == 0 || st.overflowed())
            return std::nullopt;
        if (st.names[st.size - 1] != caller)
            return st.names[st.size - 1];
        if (st.size < 2)
            return std::nullopt;
        return st.names[st.size - 2];
    }

  private:
    bool active_;
};

} // namespace calltrace::basics

#define CALLTRACE_CONCAT_INNER(a, b) a##b
#define CALLTRACE_CONCAT(a, b) CALLTRACE_CONCAT_INNER(a, b)

/**
 * @brief Pushes the enclosing function's bare name onto the frame stack until scope exit.
 */
#define CALLTRACE_FRAME()                                                                          \
    ::calltrace::basics::CallFrameGuard CALLTRACE_CONCAT(calltrace_frame_, __LINE__)(             \
        ::calltrace::format_tools::bare_function_name(                                             \
            std::source_location::current().function_name()))

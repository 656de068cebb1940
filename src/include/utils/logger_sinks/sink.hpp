#pragma once

#include "ct_base.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace calltrace::utils
{

// Represents a single log record on its way to the sinks.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Logger::Level value; int keeps this header free of logger.hpp.
    std::string_view host_label;
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination.
class CALLTRACE_EXPORT Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    // Records below this level are not passed to write().
    void set_min_level(int lvl) noexcept { min_level_ = lvl; }
    int min_level() const noexcept { return min_level_; }
    bool accepts(int lvl) const noexcept { return lvl >= min_level_; }

    static const char *level_to_string_internal(int lvl);

    // "<host>: <MM/DD HH:MM:SS> | <LEVEL> | <message>\n"
    static std::string format_logmsg(const LogMessage &msg);

  private:
    int min_level_ = 0;
};

} // namespace calltrace::utils

#pragma once

#include "sink.hpp"

#include <cstdio>
#include <mutex>
#include <string>

namespace calltrace::utils
{

/**
 * @class ConsoleSink
 * @brief Writes records to `stderr`, optionally with ANSI colors.
 *
 * Colored output paints the host label red and the timestamp bright yellow. INFO,
 * ERROR and DEBUG records paint the level and the message in bold white, red and
 * blue respectively, with a leading `[name]` prefix in bold green. Other levels
 * are left uncolored.
 */
class CALLTRACE_EXPORT ConsoleSink : public Sink
{
  public:
    explicit ConsoleSink(bool use_color = true, std::FILE *stream = stderr);

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override { return "Console"; }

    /** @brief Builds the colored line for @p msg; exposed for tests. */
    static std::string format_colored(const LogMessage &msg);

  private:
    bool use_color_;
    std::FILE *stream_;
    std::mutex mutex_;
};

} // namespace calltrace::utils

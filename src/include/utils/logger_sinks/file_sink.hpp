#pragma once

#include "sink.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace calltrace::utils
{

class BaseFileSink;

// Plain-text log file. Opened once; truncated on open when requested.
class CALLTRACE_EXPORT FileSink : public Sink
{
  public:
    FileSink(const std::filesystem::path &path, bool truncate);

    ~FileSink() override;

    void write(const LogMessage &msg) override;

    void flush() override;

    std::string description() const override;

  private:
    class Handle;
    std::unique_ptr<Handle> handle_;
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace calltrace::utils

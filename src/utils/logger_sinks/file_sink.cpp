#include "ct_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include "../base_file_sink.hpp"

#include <stdexcept>
#include <system_error>

namespace calltrace::utils
{

// Opens up BaseFileSink's protected file operations to FileSink.
class FileSink::Handle : public BaseFileSink
{
  public:
    using BaseFileSink::append;
    using BaseFileSink::open;
    using BaseFileSink::OpenMode;
    using BaseFileSink::sync;
};

FileSink::FileSink(const std::filesystem::path &path, bool truncate)
    : handle_(std::make_unique<Handle>()), path_(path)
{
    try
    {
        handle_->open(path, truncate ? Handle::OpenMode::Truncate : Handle::OpenMode::Append);
    }
    catch (const std::system_error &e)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path.string(), e.what()));
    }
}

FileSink::~FileSink() = default;

void FileSink::write(const LogMessage &msg)
{
    auto strmsg = format_logmsg(msg);
    std::lock_guard<std::mutex> lock(mutex_);
    handle_->append(strmsg);
}

void FileSink::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    handle_->sync();
}

std::string FileSink::description() const
{
    return "File: " + path_.string();
}

} // namespace calltrace::utils

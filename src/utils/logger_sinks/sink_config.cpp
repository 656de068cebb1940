#include "ct_base.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink_config.hpp"
#include "utils/trace_config.hpp"

#include <stdexcept>
#include <system_error>

namespace calltrace::utils
{

namespace fs = std::filesystem;

SinkConfig::SinkConfig(const TraceConfig &cfg)
    : root_level_(static_cast<int>(Logger::parse_level(cfg.log_level))),
      host_label_(make_host_label(cfg.sys_arch, cfg.host_ip))
{
    log_dir_ = cfg.log_file_path / "logs";
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec)
    {
        throw std::runtime_error(fmt::format("Failed to create log directory '{}': {}",
                                             log_dir_.string(), ec.message()));
    }

    const auto today = format_tools::date_stamp(std::chrono::system_clock::now());
    debug_path_ = log_dir_ / fmt::format("{}_debug.log", today);
    error_path_ = log_dir_ / fmt::format("{}_error.log", today);

    auto debug_file = std::make_unique<FileSink>(debug_path_, /*truncate=*/true);
    debug_file->set_min_level(static_cast<int>(Logger::Level::L_DEBUG));
    auto error_file = std::make_unique<FileSink>(error_path_, /*truncate=*/true);
    error_file->set_min_level(static_cast<int>(Logger::Level::L_ERROR));
    auto console = std::make_unique<ConsoleSink>(cfg.console_color);
    console->set_min_level(root_level_);

    sinks_.push_back(std::move(debug_file));
    sinks_.push_back(std::move(error_file));
    sinks_.push_back(std::move(console));
}

SinkConfig::~SinkConfig()
{
    flush();
}

std::string SinkConfig::make_host_label(std::string_view sys_arch, std::string_view host_ip)
{
    if (auto suffix = format_tools::extract_ip_suffix(host_ip))
        return fmt::format("{}-{}", sys_arch, *suffix);
    return std::string(sys_arch);
}

void SinkConfig::dispatch(int level, std::string_view body) noexcept
{
    if (level < root_level_)
        return;

    try
    {
        LogMessage msg;
        msg.timestamp = std::chrono::system_clock::now();
        msg.process_id = platform::get_pid();
        msg.thread_id = platform::get_native_thread_id();
        msg.level = level;
        msg.host_label = host_label_;
        msg.body.append(body.data(), body.data() + body.size());

        for (auto &sink : sinks_)
        {
            if (!sink->accepts(level))
                continue;
            try
            {
                sink->write(msg);
            }
            catch (const std::exception &e)
            {
                CALLTRACE_DEBUG("Sink '{}' failed to write: {}", sink->description(), e.what());
            }
        }
    }
    catch (const std::exception &e)
    {
        CALLTRACE_DEBUG("Failed to build log record: {}", e.what());
    }
}

void SinkConfig::flush() noexcept
{
    for (auto &sink : sinks_)
    {
        try
        {
            sink->flush();
        }
        catch (const std::exception &e)
        {
            CALLTRACE_DEBUG("Sink '{}' failed to flush: {}", sink->description(), e.what());
        }
    }
}

std::vector<std::string> SinkConfig::descriptions() const
{
    std::vector<std::string> out;
    out.reserve(sinks_.size());
    for (const auto &sink : sinks_)
        out.push_back(sink->description());
    return out;
}

} // namespace calltrace::utils

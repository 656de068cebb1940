#pragma once
/**
 * @file sink_config.hpp
 * @brief The process-wide set of log destinations built from a TraceConfig.
 *
 * Construction creates `<LOG_FILE_PATH>/logs/`, truncates `<date>_debug.log` and
 * `<date>_error.log` and attaches a console sink. Records below the root level
 * (LOG_LEVEL) are dropped before any sink sees them; after that the console takes
 * LOG_LEVEL and above, the debug file DEBUG and above and the error file ERROR and above.
 *
 * The Logger obtains its SinkConfig through `InstanceCache<SinkConfig>` keyed on the
 * configured level and keeps it for the lifetime of the process.
 */
#include "sink.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace calltrace
{
struct TraceConfig;
}

namespace calltrace::utils
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

class CALLTRACE_EXPORT SinkConfig
{
  public:
    /**
     * @throws std::invalid_argument if cfg.log_level is not a known level name.
     * @throws std::runtime_error if the log directory or a log file cannot be created.
     */
    explicit SinkConfig(const TraceConfig &cfg);
    ~SinkConfig();

    SinkConfig(const SinkConfig &) = delete;
    SinkConfig &operator=(const SinkConfig &) = delete;

    /** @brief Formats @p body into a record at @p level and hands it to every accepting sink. */
    void dispatch(int level, std::string_view body) noexcept;

    void flush() noexcept;

    [[nodiscard]] int root_level() const noexcept { return root_level_; }
    [[nodiscard]] const std::string &host_label() const noexcept { return host_label_; }
    [[nodiscard]] const std::filesystem::path &log_dir() const noexcept { return log_dir_; }
    [[nodiscard]] const std::filesystem::path &debug_log_path() const noexcept { return debug_path_; }
    [[nodiscard]] const std::filesystem::path &error_log_path() const noexcept { return error_path_; }
    [[nodiscard]] std::vector<std::string> descriptions() const;

    /** @brief "<arch>" or "<arch>-<last octet of host_ip>". */
    static std::string make_host_label(std::string_view sys_arch, std::string_view host_ip);

  private:
    int root_level_;
    std::string host_label_;
    std::filesystem::path log_dir_;
    std::filesystem::path debug_path_;
    std::filesystem::path error_path_;
    std::vector<std::unique_ptr<Sink>> sinks_;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace calltrace::utils

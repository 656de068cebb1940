#pragma once

/**
 * @file trace_config.hpp
 * @brief TraceConfig: the configuration consumed by the instrumentor and the logger.
 *
 * ## Config loading: layered (priority low → high)
 *
 *  1. Built-in defaults (the member initialisers below)
 *  2. A JSON file: `CALLTRACE_CONFIG_FILE` if set, else `./calltrace.json` when present.
 *     Keys use the upper-case names listed next to each field; unknown keys are ignored.
 *  3. `CALLTRACE_LOG_LEVEL` / `CALLTRACE_LOG_FILE_PATH` / `CALLTRACE_HOST_IP` /
 *     `CALLTRACE_SYS_ARCH` environment overrides applied after file loading
 *
 * The process-wide snapshot returned by current() is loaded on first use. install()
 * replaces it; the log sinks read it once, on the first log call.
 */

#include "ct_base.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace calltrace
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct CALLTRACE_EXPORT TraceConfig
{
    /// CLASS_NAME_STARTSWITH: declaring class name prefixes selected for tracing.
    std::vector<std::string> class_name_startswith{"Assert"};
    /// CLASS_NAME_ENDSWITH
    std::vector<std::string> class_name_endswith{"Widget", "Page", "Method", "Element"};
    /// CLASS_NAME_CONTAIN
    std::vector<std::string> class_name_contain{"ShortCut"};

    /// LOG_LEVEL: DEBUG, INFO, WARNING, ERROR or CRITICAL (case-insensitive).
    std::string log_level{"DEBUG"};
    /// LOG_FILE_PATH: log files go to `<log_file_path>/logs/`. Defaults to the working directory.
    std::filesystem::path log_file_path;
    /// HOST_IP: only the last octet is printed.
    std::string host_ip;
    /// SYS_ARCH: defaults to the machine architecture.
    std::string sys_arch;

    /// TEST_FUNCTION_PREFIXES: a caller whose name starts with one of these is a test function.
    std::vector<std::string> test_function_prefixes{"test_", "TestBody"};
    /// CONSOLE_COLOR: ANSI colors on the console sink.
    bool console_color{true};

    /** @brief Built-in defaults with the working directory and machine arch resolved. */
    static TraceConfig defaults();

    /**
     * @brief Applies the recognised keys of @p j on top of @p base.
     * @throws std::invalid_argument if @p j is not an object or a key has the wrong JSON type.
     */
    static TraceConfig from_json(const nlohmann::json &j, TraceConfig base = defaults());

    /**
     * @brief Loads defaults overlaid with @p path (if it exists) and the environment.
     * @throws std::runtime_error if the file exists but is not valid JSON.
     */
    static TraceConfig load_file(const std::filesystem::path &path);

    /** @brief Runs the full layered load described in the file comment. */
    static TraceConfig load();

    /** @brief Applies the CALLTRACE_* environment overrides in place. */
    void apply_env_overrides();

    [[nodiscard]] nlohmann::json to_json() const;

    /** @brief The process-wide configuration snapshot, loading it on first use. */
    static std::shared_ptr<const TraceConfig> current();

    /** @brief Replaces the process-wide configuration snapshot. */
    static void install(TraceConfig cfg);
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace calltrace

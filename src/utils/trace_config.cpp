/**
 * @file trace_config.cpp
 * @brief TraceConfig loading.
 *
 * Config loading strategy (priority low → high):
 *  1. Built-in defaults
 *  2. CALLTRACE_CONFIG_FILE, else ./calltrace.json
 *  3. CALLTRACE_LOG_LEVEL / CALLTRACE_LOG_FILE_PATH / CALLTRACE_HOST_IP / CALLTRACE_SYS_ARCH
 */
#include "ct_base.hpp"
#include "utils/trace_config.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace calltrace
{

namespace fs = std::filesystem;

static std::mutex g_config_mu;
static std::shared_ptr<const TraceConfig> g_current_config;

namespace
{

constexpr const char *kDefaultConfigFile = "calltrace.json";

/// Returns the value of an environment variable, or an empty string when unset.
std::string env_or_empty(const char *name)
{
    const char *v = std::getenv(name);
    return v ? std::string(v) : std::string{};
}

/// Reads a JSON file from disk. Returns null JSON if the file does not exist.
nlohmann::json read_json_file(const fs::path &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        return nlohmann::json{};

    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error(fmt::format("TraceConfig: cannot open '{}'", path.string()));
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("TraceConfig: '{}' is not valid JSON: {}", path.string(), e.what()));
    }
}

template <typename T> void read_key(const nlohmann::json &j, const char *key, T &out)
{
    auto it = j.find(key);
    if (it == j.end())
        return;
    try
    {
        out = it->template get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::invalid_argument(fmt::format("TraceConfig: key '{}': {}", key, e.what()));
    }
}

} // anonymous namespace

TraceConfig TraceConfig::defaults()
{
    TraceConfig cfg;
    std::error_code ec;
    cfg.log_file_path = fs::current_path(ec);
    if (ec)
        cfg.log_file_path = ".";
    cfg.sys_arch = platform::get_machine_arch();
    return cfg;
}

TraceConfig TraceConfig::from_json(const nlohmann::json &j, TraceConfig base)
{
    if (j.is_null())
        return base;
    if (!j.is_object())
        throw std::invalid_argument("TraceConfig: top-level JSON value must be an object");

    read_key(j, "CLASS_NAME_STARTSWITH", base.class_name_startswith);
    read_key(j, "CLASS_NAME_ENDSWITH", base.class_name_endswith);
    read_key(j, "CLASS_NAME_CONTAIN", base.class_name_contain);
    read_key(j, "LOG_LEVEL", base.log_level);
    read_key(j, "HOST_IP", base.host_ip);
    read_key(j, "SYS_ARCH", base.sys_arch);
    read_key(j, "TEST_FUNCTION_PREFIXES", base.test_function_prefixes);
    read_key(j, "CONSOLE_COLOR", base.console_color);

    std::string path;
    read_key(j, "LOG_FILE_PATH", path);
    if (!path.empty())
        base.log_file_path = path;
    return base;
}

void TraceConfig::apply_env_overrides()
{
    if (auto v = env_or_empty("CALLTRACE_LOG_LEVEL"); !v.empty())
        log_level = v;
    if (auto v = env_or_empty("CALLTRACE_LOG_FILE_PATH"); !v.empty())
        log_file_path = v;
    if (auto v = env_or_empty("CALLTRACE_HOST_IP"); !v.empty())
        host_ip = v;
    if (auto v = env_or_empty("CALLTRACE_SYS_ARCH"); !v.empty())
        sys_arch = v;
}

TraceConfig TraceConfig::load_file(const fs::path &path)
{
    TraceConfig cfg = from_json(read_json_file(path));
    cfg.apply_env_overrides();
    return cfg;
}

TraceConfig TraceConfig::load()
{
    if (auto explicit_file = env_or_empty("CALLTRACE_CONFIG_FILE"); !explicit_file.empty())
        return load_file(explicit_file);
    return load_file(kDefaultConfigFile);
}

nlohmann::json TraceConfig::to_json() const
{
    return nlohmann::json{
        {"CLASS_NAME_STARTSWITH", class_name_startswith},
        {"CLASS_NAME_ENDSWITH", class_name_endswith},
        {"CLASS_NAME_CONTAIN", class_name_contain},
        {"LOG_LEVEL", log_level},
        {"LOG_FILE_PATH", log_file_path.string()},
        {"HOST_IP", host_ip},
        {"SYS_ARCH", sys_arch},
        {"TEST_FUNCTION_PREFIXES", test_function_prefixes},
        {"CONSOLE_COLOR", console_color},
    };
}

std::shared_ptr<const TraceConfig> TraceConfig::current()
{
    std::lock_guard<std::mutex> lock(g_config_mu);
    if (!g_current_config)
        g_current_config = std::make_shared<const TraceConfig>(load());
    return g_current_config;
}

void TraceConfig::install(TraceConfig cfg)
{
    auto snapshot = std::make_shared<const TraceConfig>(std::move(cfg));
    std::lock_guard<std::mutex> lock(g_config_mu);
    g_current_config = std::move(snapshot);
}

} // namespace calltrace

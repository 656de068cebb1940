#pragma once

#include <filesystem>
#include <string_view>

namespace calltrace::utils
{

/**
 * @class BaseFileSink
 * @brief Owns the descriptor behind one daily log file.
 *
 * Not a Sink itself. Each record is handed to append() as one complete line and
 * goes out through O_APPEND writes, so a line is never split by another writer.
 */
class BaseFileSink
{
  public:
    enum class OpenMode
    {
        Truncate, ///< Start the file empty (first open in a process).
        Append,
    };

    BaseFileSink() = default;
    virtual ~BaseFileSink();

    BaseFileSink(const BaseFileSink &) = delete;
    BaseFileSink &operator=(const BaseFileSink &) = delete;

  protected:
    /**
     * @brief Opens @p path for writing, creating the file but not its directory.
     * @throws std::system_error when the file cannot be opened.
     */
    void open(const std::filesystem::path &path, OpenMode mode);

    void close() noexcept;

    /**
     * @brief Writes all of @p line, retrying short and interrupted writes.
     * @throws std::system_error when the descriptor refuses the data.
     */
    void append(std::string_view line);

    /** @brief Pushes written data to the device; errors are ignored. */
    void sync() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return m_fd != -1; }

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    std::filesystem::path m_path;
    int m_fd = -1;
};

} // namespace calltrace::utils

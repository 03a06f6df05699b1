/**
 * @file Logger.hpp
 * @brief Process-wide log for transfer jobs
 *
 * One line per record:
 * `2026-01-22T14:32:45.123Z [WARN ] [TransferEngine] Job 3: short write at 65536`.
 * The CLI and the D-Bus helper each keep their own file; worker threads
 * share the singleton of their process.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk and retry detail
    INFO,     ///< Job lifecycle
    WARNING,  ///< Recoverable problems (short writes, failed unmount)
    ERROR     ///< Job failures
};

/**
 * @brief Parse a level name as written in the config file
 * @param name One of "debug", "info", "warning"/"warn", "error" (any case)
 * @return Level, or nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief When to rotate and how many old files to keep
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;
    int max_files = 7;
};

/**
 * @class RotatingLogFile
 * @brief `<dir>/<name>.log` plus numbered generations `<name>.1.log` (newest)
 *        up to `<name>.<max_files>.log`
 *
 * Not thread-safe; Logger serializes access.
 */
class RotatingLogFile {
public:
    RotatingLogFile(std::filesystem::path dir, std::string name, LogRotationPolicy policy);

    RotatingLogFile(const RotatingLogFile&) = delete;
    RotatingLogFile& operator=(const RotatingLogFile&) = delete;

    /**
     * @brief Create the directory and open the current file for appending
     * @return Empty string on success, otherwise why it failed
     */
    [[nodiscard]] auto open() -> std::string;

    void append(std::string_view line);
    void flush();
    void close();

    [[nodiscard]] auto path() const -> std::filesystem::path;

private:
    [[nodiscard]] auto generation(int index) const -> std::filesystem::path;
    void rotate();

    std::filesystem::path dir_;
    std::string name_;
    LogRotationPolicy policy_;
    std::ofstream out_;
    size_t size_ = 0;
};

/**
 * @class Logger
 * @brief Severity-filtered log with an optional stderr mirror
 *
 * @code
 * util::Logger::instance().initialize(log_dir, "floppyforge-cli");
 * LOG_INFO("TransferService", std::format("Job {} started", id));
 * @endcode
 *
 * Records made before initialize() only reach stderr, and only when
 * console output is enabled.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Start writing to `<log_dir>/<app_name>.log`
     * @return true if the file is open; on false only the console mirror works
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {}) -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);
    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    void set_console_output(bool enable);

    /// Empty until initialize() succeeds
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto format_line(LogLevel level, std::string_view component,
                                          std::string_view message) -> std::string;

    mutable std::mutex mutex_;
    std::optional<RotatingLogFile> file_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_output_ = false;
};

}  // namespace util

#define LOG_DEBUG(component, msg) ::util::Logger::instance().log(::util::LogLevel::DEBUG, component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().log(::util::LogLevel::INFO, component, msg)
#define LOG_WARNING(component, msg) \
    ::util::Logger::instance().log(::util::LogLevel::WARNING, component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().log(::util::LogLevel::ERROR, component, msg)

/**
 * @file Logger.cpp
 * @brief Rotating log file and the process logger
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <format>
#include <iostream>
#include <utility>

namespace util {

namespace {

struct LevelName {
    std::string_view name;
    LogLevel level;
};

constexpr std::array LEVEL_NAMES{
    LevelName{"debug", LogLevel::DEBUG},     LevelName{"info", LogLevel::INFO},
    LevelName{"warning", LogLevel::WARNING}, LevelName{"warn", LogLevel::WARNING},
    LevelName{"error", LogLevel::ERROR},
};

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto it = std::ranges::find(LEVEL_NAMES, std::string_view{lower}, &LevelName::name);
    if (it == LEVEL_NAMES.end()) {
        return std::nullopt;
    }
    return it->level;
}

// --- RotatingLogFile --------------------------------------------------------

RotatingLogFile::RotatingLogFile(std::filesystem::path dir, std::string name,
                                 LogRotationPolicy policy)
    : dir_(std::move(dir)), name_(std::move(name)), policy_(policy) {}

auto RotatingLogFile::path() const -> std::filesystem::path {
    return dir_ / (name_ + ".log");
}

auto RotatingLogFile::generation(int index) const -> std::filesystem::path {
    return dir_ / std::format("{}.{}.log", name_, index);
}

auto RotatingLogFile::open() -> std::string {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return std::format("cannot create {}: {}", dir_.string(), ec.message());
    }

    out_.open(path(), std::ios::app);
    if (!out_.is_open()) {
        return std::format("cannot open {}", path().string());
    }

    const auto existing = std::filesystem::file_size(path(), ec);
    size_ = ec ? 0 : static_cast<size_t>(existing);
    return {};
}

void RotatingLogFile::append(std::string_view line) {
    if (size_ > 0 && size_ + line.size() > policy_.max_file_size_bytes) {
        rotate();
    }
    if (!out_.is_open()) {
        return;
    }
    out_ << line;
    // Keep the tail on disk if a transfer takes the process down
    out_.flush();
    size_ += line.size();
}

void RotatingLogFile::rotate() {
    out_.close();

    std::error_code ec;
    std::filesystem::remove(generation(policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(generation(i), generation(i + 1), ec);
    }
    std::filesystem::rename(path(), generation(1), ec);

    size_ = 0;
    out_.open(path(), std::ios::trunc);
}

void RotatingLogFile::flush() {
    if (out_.is_open()) {
        out_.flush();
    }
}

void RotatingLogFile::close() {
    if (out_.is_open()) {
        out_.close();
    }
}

// --- Logger -----------------------------------------------------------------

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_) {
        file_->close();
        file_.reset();
    }
    min_level_ = min_level;

    RotatingLogFile& file = file_.emplace(log_dir, app_name, policy);
    if (auto problem = file.open(); !problem.empty()) {
        std::cerr << "Logger: " << problem << std::endl;
        file_.reset();
        return false;
    }

    file.append(format_line(LogLevel::INFO, "Logger",
                            std::format("{} logging at level {}", app_name,
                                        level_to_string(min_level))));
    return true;
}

auto Logger::format_line(LogLevel level, std::string_view component, std::string_view message)
    -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z [{}] [{}] {}\n", now, level_to_string(level), component, message);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);
    if (level < min_level_) {
        return;
    }
    if (!file_ && !console_output_) {
        return;
    }

    const auto line = format_line(level, component, message);
    if (file_) {
        file_->append(line);
    }
    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_) {
        file_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    return file_ ? file_->path() : std::filesystem::path{};
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (!file_) {
        return;
    }
    file_->append(format_line(LogLevel::INFO, "Logger", "log closed"));
    file_->close();
    file_.reset();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

}  // namespace util

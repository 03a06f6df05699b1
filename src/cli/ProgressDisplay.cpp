/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include "util/ByteFormat.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <iostream>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto YELLOW = "\033[33m";
constexpr auto CYAN = "\033[36m";

auto severity_tag(LogSeverity severity) -> std::string_view {
    switch (severity) {
        case LogSeverity::INFO:
            return "[INFO]";
        case LogSeverity::WARNING:
            return "[WARN]";
        case LogSeverity::ERROR:
            return "[ERR ]";
        case LogSeverity::OK:
            return "[ OK ]";
    }
    return "[    ]";
}

auto severity_color(LogSeverity severity) -> const char* {
    switch (severity) {
        case LogSeverity::INFO:
            return CYAN;
        case LogSeverity::WARNING:
            return YELLOW;
        case LogSeverity::ERROR:
            return RED;
        case LogSeverity::OK:
            return GREEN;
    }
    return RESET;
}

}  // namespace

ProgressDisplay::ProgressDisplay(std::string device_path, std::string source_description)
    : device_path_(std::move(device_path)), source_description_(std::move(source_description)) {
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::started(const StartedEvent& event) {
    mode_ = event.mode;

    std::cout << "\n";
    if (color_enabled_) {
        std::cout << BOLD;
    }
    switch (event.mode) {
        case TransferMode::WRITE:
            std::cout << "Writing " << source_description_ << " to " << device_path_;
            break;
        case TransferMode::ZERO_FILL:
            std::cout << "Zero-filling " << device_path_;
            break;
        case TransferMode::VERIFY:
            std::cout << "Comparing " << source_description_ << " with " << device_path_;
            break;
    }
    std::cout << " (" << util::format_bytes(event.bytes_total) << ")\n";
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << std::flush;
}

auto ProgressDisplay::format_status(const ProgressEvent& event) -> std::string {
    auto line = std::format("{:9} {:5.1f}%", event.verifying ? "Verifying" : "Writing",
                            event.percentage);

    if (event.rate_bps > 0) {
        line += "  |  " + util::format_rate(event.rate_bps);
    }
    if (event.eta_seconds > 0) {
        line += "  |  ETA: " + util::format_duration(event.eta_seconds);
    }
    return line;
}

void ProgressDisplay::update(const ProgressEvent& event) {
    const auto status = format_status(event);
    // Keep the label, put the bar between it and the percentage
    const auto bar = generate_progress_bar(event.percentage);

    clear_line();
    std::cout << status.substr(0, 9) << " " << bar << status.substr(9) << std::flush;
    line_active_ = true;
}

void ProgressDisplay::log(const LogLineEvent& event) {
    if (line_active_) {
        clear_line();
        line_active_ = false;
    }

    if (color_enabled_) {
        std::cout << severity_color(event.severity);
    }
    std::cout << severity_tag(event.severity);
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << " " << event.text << "\n" << std::flush;
}

auto ProgressDisplay::describe_result(const FinishedEvent& event) -> std::string {
    const auto& result = event.result;
    const auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(event.elapsed).count();

    switch (result.status) {
        case JobResult::Status::SUCCESS:
            return std::format("Done: {} in {} ({})", util::format_bytes(result.bytes_done),
                               util::format_duration(seconds),
                               util::format_rate(event.average_rate_bps));
        case JobResult::Status::CANCELLED:
            return std::format("Cancelled after {} of {}; the medium is partially written",
                               util::format_bytes(result.bytes_done),
                               util::format_bytes(event.bytes_total));
        case JobResult::Status::FAILED:
            if (result.error) {
                return std::format("{} at offset {}: {}", to_string(result.error->kind),
                                   result.error->offset, result.error->message);
            }
            return "Failed";
    }
    return "Unknown result";
}

void ProgressDisplay::complete(const FinishedEvent& event) {
    if (line_active_) {
        clear_line();
        line_active_ = false;
    }

    const char* color = event.result.is_success()     ? GREEN
                        : event.result.is_cancelled() ? YELLOW
                                                      : RED;
    const char* tag = event.result.is_success()     ? "[OK] "
                      : event.result.is_cancelled() ? "[CANCELLED] "
                                                    : "[FAILED] ";

    if (color_enabled_) {
        std::cout << color << BOLD;
    }
    std::cout << tag << describe_result(event);
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << "\n" << std::endl;
}

auto ProgressDisplay::generate_progress_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";
    if (color_enabled_) {
        bar += GREEN;
    }
    for (int i = 0; i < filled; ++i) {
        bar += "█";
    }
    if (color_enabled_) {
        bar += RESET;
    }
    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "░";
    }
    bar += "]";
    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        std::cout << "\r\033[K";
    } else if (line_active_) {
        std::cout << "\n";
    }
}

}  // namespace cli

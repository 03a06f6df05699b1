/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI transfer jobs
 */

#pragma once

#include "models/TransferTypes.hpp"

#include <cstdint>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Shows a progress bar with percentage, rate and ETA, and prints job log
 * lines above it. Colors are only used when stdout is a terminal.
 */
class ProgressDisplay {
public:
    /**
     * @param device_path Target device (for the header)
     * @param source_description What is being written or compared
     */
    ProgressDisplay(std::string device_path, std::string source_description);

    void started(const StartedEvent& event);
    void update(const ProgressEvent& event);
    void log(const LogLineEvent& event);

    /**
     * @brief Print the final status line
     */
    void complete(const FinishedEvent& event);

    void set_color_enabled(bool enable);

    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Status line without the bar, e.g. "Writing  45.2%  |  28.13 KB/s  |  ETA: 00:31"
     */
    [[nodiscard]] static auto format_status(const ProgressEvent& event) -> std::string;

    /**
     * @brief One-line summary of a terminal result
     */
    [[nodiscard]] static auto describe_result(const FinishedEvent& event) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) const -> std::string;

    void clear_line();

    std::string device_path_;
    std::string source_description_;
    TransferMode mode_ = TransferMode::WRITE;
    bool color_enabled_ = true;
    bool line_active_ = false;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli

/**
 * @file CliApplication.hpp
 * @brief Command-line front end: write images, format and verify floppies
 */

#pragma once

#include "models/TransferTypes.hpp"
#include "services/AppConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>

class ITransferService;

namespace cli {

enum class Command { NONE, WRITE, FORMAT, VERIFY };

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    Command command = Command::NONE;
    std::string image_path;
    std::string device_path;
    std::optional<char> drive_letter;
    bool verify = false;
    bool no_confirm = false;
    bool allow_regular_files = false;
    std::optional<uint64_t> chunk_size;
    std::optional<unsigned> max_retries;
    std::optional<std::string> format_size;
    std::optional<std::string> log_level;
    std::optional<std::string> config_path;
    std::string parse_error;  ///< Non-empty when the command line is invalid
};

/**
 * @brief Exit codes of floppyforge-cli
 */
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_FAILED = 1,
    EXIT_USAGE = 2,
    EXIT_CANCELLED = 130,
};

/**
 * @class CliApplication
 * @brief Runs one job in-process and renders its events
 */
class CliApplication {
public:
    CliApplication() = default;
    ~CliApplication() = default;

    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Process exit code, see ExitCode
     */
    auto run(int argc, char* argv[]) -> int;

    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Overlay command line values onto the loaded configuration
     */
    [[nodiscard]] static auto apply_overrides(const CliOptions& options, AppConfig config)
        -> std::expected<AppConfig, util::Error>;

    /**
     * @brief Exit code for a terminal job result
     */
    [[nodiscard]] static auto exit_code_for(const JobResult& result) -> int;

    static void print_help();
    static void print_version();

private:
    [[nodiscard]] static auto resolve_device(const CliOptions& options)
        -> std::expected<std::string, TransferError>;

    [[nodiscard]] static auto confirm_destruction(const CliOptions& options,
                                                  const std::string& device_path) -> bool;

    /**
     * @brief Pump events until the job finishes, forwarding Ctrl-C as cancel
     */
    auto run_job(ITransferService& service, uint64_t job_id, const std::string& device_path,
                 const std::string& source_description) -> int;
};

}  // namespace cli

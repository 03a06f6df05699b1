/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "devices/DevicePolicy.hpp"
#include "services/TransferService.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <unistd.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <string_view>

#include <getopt.h>

namespace cli {

namespace {

std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
    constexpr std::string_view message = "\nCancellation requested, stopping after this chunk...\n";
    [[maybe_unused]] auto n = ::write(STDERR_FILENO, message.data(), message.size());
}

constexpr auto APP_NAME = "floppyforge-cli";

constexpr auto EVENT_POLL_INTERVAL = std::chrono::milliseconds{100};

const struct option long_options[] = {
    {          "help",       no_argument, nullptr, 'h'},
    {       "version",       no_argument, nullptr, 'V'},
    {         "write", required_argument, nullptr, 'w'},
    {        "format",       no_argument, nullptr, 'F'},
    {   "verify-only", required_argument, nullptr, 'c'},
    {        "device", required_argument, nullptr, 'd'},
    {         "drive", required_argument, nullptr, 'D'},
    {        "verify",       no_argument, nullptr, 'v'},
    {    "chunk-size", required_argument, nullptr, 's'},
    {       "retries", required_argument, nullptr, 'r'},
    {   "format-size", required_argument, nullptr, 'S'},
    {        "config", required_argument, nullptr, 'k'},
    {    "allow-file",       no_argument, nullptr, 'A'},
    {     "log-level", required_argument, nullptr, 'L'},
    {           "yes",       no_argument, nullptr, 'y'},
    {         nullptr,                 0, nullptr,   0}
};

template <typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void set_command(CliOptions& options, Command command) {
    if (options.command != Command::NONE && options.command != command) {
        options.parse_error = "Only one of --write, --format and --verify-only may be given";
    }
    options.command = command;
}

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (options.show_help) {
        print_help();
        return EXIT_OK;
    }
    if (options.show_version) {
        print_version();
        return EXIT_OK;
    }
    if (!options.parse_error.empty()) {
        std::cerr << "Error: " << options.parse_error << "\n"
                  << "Run with --help for usage.\n";
        return EXIT_USAGE;
    }
    if (options.command == Command::NONE) {
        print_help();
        return EXIT_USAGE;
    }

    std::optional<std::filesystem::path> config_path;
    if (options.config_path) {
        config_path = *options.config_path;
    }
    auto config = AppConfig::load(config_path).and_then(
        [&options](AppConfig loaded) { return apply_overrides(options, std::move(loaded)); });
    if (!config) {
        std::cerr << "Error: " << config.error().message << "\n";
        return EXIT_USAGE;
    }

    auto log_dir = config->log_directory.empty()
                       ? std::filesystem::path(g_get_user_data_dir()) / "floppyforge" / "logs"
                       : config->log_directory;
    auto& logger = util::Logger::instance();
    logger.set_console_output(config->log_to_console);
    if (!logger.initialize(log_dir, APP_NAME, config->log_level)) {
        std::cerr << "Warning: cannot write log files to " << log_dir.string() << "\n";
    }

    auto device = resolve_device(options);
    if (!device) {
        LOG_ERROR("CLI", device.error().message);
        std::cerr << "Error: " << device.error().message << "\n";
        return EXIT_USAGE;
    }

    if (options.command != Command::VERIFY && !options.no_confirm &&
        !confirm_destruction(options, *device)) {
        std::cout << "Aborted.\n";
        return EXIT_FAILED;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    TransferService service(config->service);

    std::expected<uint64_t, TransferError> job;
    std::string description;
    switch (options.command) {
        case Command::WRITE:
            job = service.start_write(options.image_path, *device);
            description = std::filesystem::path(options.image_path).filename().string();
            break;
        case Command::FORMAT:
            job = service.start_format(*device);
            description = "zeros";
            break;
        case Command::VERIFY:
            job = service.start_verify(options.image_path, *device);
            description = std::filesystem::path(options.image_path).filename().string();
            break;
        case Command::NONE:
            return EXIT_USAGE;
    }

    if (!job) {
        std::cerr << "Error: " << job.error().message << " (" << to_string(job.error().kind)
                  << ")\n";
        return EXIT_FAILED;
    }

    return run_job(service, *job, *device, description);
}

auto CliApplication::run_job(ITransferService& service, uint64_t job_id,
                             const std::string& device_path, const std::string& source_description)
    -> int {
    ProgressDisplay display(device_path, source_description);
    bool cancel_sent = false;

    while (true) {
        if (g_cancel_requested.load() && !cancel_sent) {
            service.cancel(job_id);
            cancel_sent = true;
        }

        auto event = service.events().wait_for(EVENT_POLL_INTERVAL);
        if (!event) {
            continue;
        }

        if (const auto* started = std::get_if<StartedEvent>(&*event)) {
            display.started(*started);
        } else if (const auto* progress = std::get_if<ProgressEvent>(&*event)) {
            display.update(*progress);
        } else if (const auto* line = std::get_if<LogLineEvent>(&*event)) {
            display.log(*line);
        } else if (const auto* finished = std::get_if<FinishedEvent>(&*event)) {
            if (finished->job_id != job_id) {
                continue;
            }
            display.complete(*finished);
            return exit_code_for(finished->result);
        }
    }
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    optind = 0;  // rescan from scratch on every call
    int opt;
    while ((opt = getopt_long(argc, argv, "hVw:Fc:d:D:vs:r:S:k:AL:y", long_options, nullptr)) !=
           -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'w':
                set_command(options, Command::WRITE);
                options.image_path = optarg;
                break;
            case 'F':
                set_command(options, Command::FORMAT);
                break;
            case 'c':
                set_command(options, Command::VERIFY);
                options.image_path = optarg;
                break;
            case 'd':
                options.device_path = optarg;
                break;
            case 'D': {
                std::string_view letter{optarg};
                if (letter.ends_with(':')) {
                    letter.remove_suffix(1);
                }
                if (letter.size() != 1) {
                    options.parse_error = std::format("Invalid drive '{}'", optarg);
                } else {
                    options.drive_letter = letter.front();
                }
                break;
            }
            case 'v':
                options.verify = true;
                break;
            case 's':
                options.chunk_size = parse_number<uint64_t>(optarg);
                if (!options.chunk_size) {
                    options.parse_error = std::format("Invalid chunk size '{}'", optarg);
                }
                break;
            case 'r':
                options.max_retries = parse_number<unsigned>(optarg);
                if (!options.max_retries) {
                    options.parse_error = std::format("Invalid retry count '{}'", optarg);
                }
                break;
            case 'S':
                options.format_size = optarg;
                break;
            case 'k':
                options.config_path = optarg;
                break;
            case 'A':
                options.allow_regular_files = true;
                break;
            case 'L':
                options.log_level = optarg;
                break;
            case 'y':
                options.no_confirm = true;
                break;
            default:
                options.show_help = true;
                break;
        }
    }

    if (optind < argc && options.parse_error.empty()) {
        options.parse_error = std::format("Unexpected argument '{}'", argv[optind]);
    }
    if (options.parse_error.empty() && options.command != Command::NONE &&
        options.device_path.empty() && !options.drive_letter) {
        options.parse_error = "A target is required: --device <path> or --drive <A|B>";
    }
    if (options.parse_error.empty() && !options.device_path.empty() && options.drive_letter) {
        options.parse_error = "--device and --drive are mutually exclusive";
    }

    return options;
}

auto CliApplication::apply_overrides(const CliOptions& options, AppConfig config)
    -> std::expected<AppConfig, util::Error> {
    auto& service = config.service;

    if (options.chunk_size) {
        auto chunk = validate_chunk_size(*options.chunk_size);
        if (!chunk) {
            return std::unexpected(chunk.error());
        }
        service.transfer.chunk_size = *chunk;
    }
    if (options.max_retries) {
        service.transfer.max_write_retries = *options.max_retries;
    }
    if (options.verify) {
        service.transfer.verify_after_write = true;
    }
    if (options.format_size) {
        auto policy = parse_format_size(*options.format_size);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        service.format_size = *policy;
    }
    if (options.allow_regular_files) {
        service.allow_regular_files = true;
    }
    if (options.log_level) {
        auto level = util::parse_log_level(*options.log_level);
        if (!level) {
            return std::unexpected(
                util::Error{std::format("Unknown log level '{}'", *options.log_level)});
        }
        config.log_level = *level;
    }
    return config;
}

auto CliApplication::exit_code_for(const JobResult& result) -> int {
    switch (result.status) {
        case JobResult::Status::SUCCESS:
            return EXIT_OK;
        case JobResult::Status::CANCELLED:
            return EXIT_CANCELLED;
        case JobResult::Status::FAILED:
            return EXIT_FAILED;
    }
    return EXIT_FAILED;
}

auto CliApplication::resolve_device(const CliOptions& options)
    -> std::expected<std::string, TransferError> {
    if (options.drive_letter) {
        return device_policy::resolve_drive_letter(*options.drive_letter);
    }
    return options.device_path;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS] COMMAND\n\n"
              << "Write raw floppy images and zero-fill floppy disks\n\n"
              << "Commands:\n"
              << "  -w, --write <image>       Write a raw image (.img, .ima, .adf) to the target\n"
              << "  -F, --format              Overwrite the whole target with zeros\n"
              << "  -c, --verify-only <image> Compare an image with the target\n\n"
              << "Target:\n"
              << "  -d, --device <path>       Device node, e.g. /dev/fd0 or /dev/sdb\n"
              << "  -D, --drive <A|B>         Floppy drive letter\n\n"
              << "Options:\n"
              << "  -v, --verify              Read back and compare after writing\n"
              << "  -s, --chunk-size <bytes>  Transfer chunk size (default 65536)\n"
              << "  -r, --retries <n>         Short-write retries per chunk (default 3)\n"
              << "  -S, --format-size <size>  capacity, 720K, 880K, 1440K, 1760K, 2880K or bytes\n"
              << "  -k, --config <file>       Read settings from this file only\n"
              << "  -A, --allow-file          Allow a regular file as the target\n"
              << "  -L, --log-level <level>   debug, info, warning or error\n"
              << "  -y, --yes                 Skip confirmation prompt\n"
              << "  -h, --help                Show this help message\n"
              << "  -V, --version             Show version information\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --write dos622.img --drive A --verify\n"
              << "  " << APP_NAME << " --write workbench.adf --device /dev/sdb\n"
              << "  " << APP_NAME << " --format --device /dev/fd0 --format-size 1440K\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of FloppyForge - raw floppy image writer\n";
}

auto CliApplication::confirm_destruction(const CliOptions& options, const std::string& device_path)
    -> bool {
    std::cout << "\n";
    std::cout << "\033[1;31mWARNING: This will OVERWRITE all data on " << device_path
              << "!\033[0m\n";
    if (options.command == Command::WRITE) {
        std::cout << "Image: " << options.image_path << "\n\n";
    } else {
        std::cout << "Operation: zero fill\n\n";
    }
    std::cout << "Type 'yes' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);

    return input == "yes";
}

}  // namespace cli

/**
 * @file AppConfig.hpp
 * @brief Settings read from floppyforge.conf
 *
 * Example:
 * @code
 * [transfer]
 * chunk_size=65536
 * max_write_retries=3
 * verify_after_write=true
 * format_size=1440K
 *
 * [logging]
 * level=debug
 * @endcode
 */

#pragma once

#include "services/TransferService.hpp"
#include "util/Logger.hpp"
#include "util/Result.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct AppConfig {
    ServiceOptions service;

    util::LogLevel log_level = util::LogLevel::INFO;
    std::filesystem::path log_directory;  ///< Empty: front end default
    bool log_to_console = false;

    /**
     * @brief System file, then the user's file; later files override earlier ones
     */
    [[nodiscard]] static auto default_search_paths() -> std::vector<std::filesystem::path>;

    /**
     * @brief Load configuration
     * @param explicit_path Only this file (which must exist) when set,
     *        otherwise every existing file from default_search_paths()
     * @return Defaults overlaid with file values, or the first malformed value
     */
    [[nodiscard]] static auto load(const std::optional<std::filesystem::path>& explicit_path = {})
        -> std::expected<AppConfig, util::Error>;

    /**
     * @brief Overlay the values present in one key file onto @p base
     * @param path Key file
     * @param base Values to keep for keys the file does not set
     * @param must_exist Report a missing file as an error
     */
    [[nodiscard]] static auto load_file(const std::filesystem::path& path, AppConfig base,
                                        bool must_exist = false)
        -> std::expected<AppConfig, util::Error>;

    /**
     * @brief Same as load_file() for in-memory key file data
     */
    [[nodiscard]] static auto load_data(std::string_view data, AppConfig base)
        -> std::expected<AppConfig, util::Error>;
};

/**
 * @brief Parse "capacity", a standard size name ("1440K") or a byte count
 */
[[nodiscard]] auto parse_format_size(std::string_view text)
    -> std::expected<FormatSizePolicy, util::Error>;

/**
 * @brief Validate a chunk size given on the command line or in a file
 * @return Error unless positive and a multiple of 512
 */
[[nodiscard]] auto validate_chunk_size(uint64_t chunk_size) -> std::expected<size_t, util::Error>;

#include "services/AppConfig.hpp"

#include "models/FloppyGeometry.hpp"

#include <glib.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <memory>

namespace {

constexpr auto CONFIG_FILE_NAME = "floppyforge.conf";
constexpr auto SYSTEM_CONFIG_DIR = "/etc/floppyforge";

constexpr auto GROUP_TRANSFER = "transfer";
constexpr auto GROUP_LOGGING = "logging";

struct KeyFileDeleter {
    void operator()(GKeyFile* key_file) const { g_key_file_free(key_file); }
};
using KeyFilePtr = std::unique_ptr<GKeyFile, KeyFileDeleter>;

struct GFreeDeleter {
    void operator()(gchar* str) const { g_free(str); }
};
using GStringPtr = std::unique_ptr<gchar, GFreeDeleter>;

auto take_error(GError* error, std::string_view context) -> util::Error {
    util::Error result{std::format("{}: {}", context, error ? error->message : "unknown error"),
                       error ? error->code : 0};
    g_clear_error(&error);
    return result;
}

auto get_string(GKeyFile* kf, const char* group, const char* key)
    -> std::expected<std::optional<std::string>, util::Error> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return std::nullopt;
    }
    GError* error = nullptr;
    GStringPtr value{g_key_file_get_string(kf, group, key, &error)};
    if (!value) {
        return std::unexpected(take_error(error, std::format("[{}] {}", group, key)));
    }
    std::string text{value.get()};
    text.erase(text.find_last_not_of(" \t") + 1);
    return text;
}

auto get_uint64(GKeyFile* kf, const char* group, const char* key)
    -> std::expected<std::optional<uint64_t>, util::Error> {
    auto text = get_string(kf, group, key);
    if (!text) {
        return std::unexpected(text.error());
    }
    if (!*text) {
        return std::nullopt;
    }
    const auto& s = **text;
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(
            util::Error{std::format("[{}] {}: '{}' is not a non-negative integer", group, key, s)});
    }
    return value;
}

auto get_bool(GKeyFile* kf, const char* group, const char* key)
    -> std::expected<std::optional<bool>, util::Error> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return std::nullopt;
    }
    GError* error = nullptr;
    const gboolean value = g_key_file_get_boolean(kf, group, key, &error);
    if (error) {
        return std::unexpected(take_error(error, std::format("[{}] {}", group, key)));
    }
    return value != FALSE;
}

auto apply(GKeyFile* kf, AppConfig config) -> std::expected<AppConfig, util::Error> {
    auto& service = config.service;

    if (auto v = get_uint64(kf, GROUP_TRANSFER, "chunk_size"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        auto chunk = validate_chunk_size(**v);
        if (!chunk) {
            return std::unexpected(chunk.error());
        }
        service.transfer.chunk_size = *chunk;
    }

    if (auto v = get_uint64(kf, GROUP_TRANSFER, "max_write_retries"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        if (**v > 100) {
            return std::unexpected(
                util::Error{std::format("[transfer] max_write_retries: {} is too large", **v)});
        }
        service.transfer.max_write_retries = static_cast<unsigned>(**v);
    }

    if (auto v = get_bool(kf, GROUP_TRANSFER, "verify_after_write"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        service.transfer.verify_after_write = **v;
    }

    if (auto v = get_string(kf, GROUP_TRANSFER, "format_size"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        auto policy = parse_format_size(**v);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        service.format_size = *policy;
    }

    if (auto v = get_bool(kf, GROUP_TRANSFER, "allow_regular_files"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        service.allow_regular_files = **v;
    }

    if (auto v = get_bool(kf, GROUP_TRANSFER, "unmount_before_write"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        service.unmount_before_write = **v;
    }

    if (auto v = get_string(kf, GROUP_LOGGING, "level"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        auto level = util::parse_log_level(**v);
        if (!level) {
            return std::unexpected(
                util::Error{std::format("[logging] level: unknown level '{}'", **v)});
        }
        config.log_level = *level;
    }

    if (auto v = get_string(kf, GROUP_LOGGING, "directory"); !v) {
        return std::unexpected(v.error());
    } else if (*v && !(*v)->empty()) {
        config.log_directory = **v;
    }

    if (auto v = get_bool(kf, GROUP_LOGGING, "console"); !v) {
        return std::unexpected(v.error());
    } else if (*v) {
        config.log_to_console = **v;
    }

    return config;
}

}  // namespace

auto validate_chunk_size(uint64_t chunk_size) -> std::expected<size_t, util::Error> {
    if (chunk_size == 0 || chunk_size % floppy::SECTOR_BYTES != 0) {
        return std::unexpected(util::Error{std::format(
            "Chunk size {} must be a positive multiple of {}", chunk_size, floppy::SECTOR_BYTES)});
    }
    if (chunk_size > 64 * 1024 * 1024) {
        return std::unexpected(util::Error{std::format("Chunk size {} is too large", chunk_size)});
    }
    return static_cast<size_t>(chunk_size);
}

auto parse_format_size(std::string_view text) -> std::expected<FormatSizePolicy, util::Error> {
    std::string lowered{text};
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "capacity" || lowered == "auto") {
        return FormatSizePolicy::device_capacity();
    }
    if (auto named = floppy::size_from_name(lowered)) {
        return FormatSizePolicy::fixed(*named);
    }
    if (lowered == "1.44m") {
        return FormatSizePolicy::fixed(floppy::PC_1440K);
    }
    if (lowered == "2.88m") {
        return FormatSizePolicy::fixed(floppy::PC_2880K);
    }

    uint64_t bytes = 0;
    auto [ptr, ec] = std::from_chars(lowered.data(), lowered.data() + lowered.size(), bytes);
    if (ec != std::errc{} || ptr != lowered.data() + lowered.size() || bytes == 0) {
        return std::unexpected(util::Error{std::format(
            "Format size '{}' is not 'capacity', a floppy size (720K, 880K, 1440K, 1760K, "
            "2880K) or a byte count",
            text)});
    }
    if (bytes % floppy::SECTOR_BYTES != 0) {
        return std::unexpected(util::Error{
            std::format("Format size {} is not a multiple of {}", bytes, floppy::SECTOR_BYTES)});
    }
    return FormatSizePolicy::fixed(bytes);
}

auto AppConfig::default_search_paths() -> std::vector<std::filesystem::path> {
    return {
        std::filesystem::path{SYSTEM_CONFIG_DIR} / CONFIG_FILE_NAME,
        std::filesystem::path{g_get_user_config_dir()} / "floppyforge" / CONFIG_FILE_NAME,
    };
}

auto AppConfig::load_file(const std::filesystem::path& path, AppConfig base, bool must_exist)
    -> std::expected<AppConfig, util::Error> {
    KeyFilePtr kf{g_key_file_new()};
    GError* error = nullptr;

    if (!g_key_file_load_from_file(kf.get(), path.c_str(), G_KEY_FILE_NONE, &error)) {
        if (!must_exist && g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT)) {
            g_clear_error(&error);
            return base;
        }
        return std::unexpected(take_error(error, std::format("Cannot load {}", path.string())));
    }

    auto config = apply(kf.get(), std::move(base));
    if (!config) {
        return std::unexpected(
            util::Error{std::format("{}: {}", path.string(), config.error().message)});
    }
    LOG_DEBUG("AppConfig", std::format("Loaded {}", path.string()));
    return config;
}

auto AppConfig::load_data(std::string_view data, AppConfig base)
    -> std::expected<AppConfig, util::Error> {
    KeyFilePtr kf{g_key_file_new()};
    GError* error = nullptr;

    if (!g_key_file_load_from_data(kf.get(), data.data(), data.size(), G_KEY_FILE_NONE, &error)) {
        return std::unexpected(take_error(error, "Cannot parse configuration"));
    }
    return apply(kf.get(), std::move(base));
}

auto AppConfig::load(const std::optional<std::filesystem::path>& explicit_path)
    -> std::expected<AppConfig, util::Error> {
    if (explicit_path) {
        return load_file(*explicit_path, AppConfig{}, true);
    }

    AppConfig config;
    for (const auto& path : default_search_paths()) {
        auto loaded = load_file(path, std::move(config));
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    return config;
}

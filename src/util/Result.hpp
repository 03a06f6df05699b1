/**
 * @file Result.hpp
 * @brief Error value shared by utility code
 *
 * Utility functions report failures as std::expected<T, util::Error>.
 * Transfer-level failures use TransferError (see models/TransferTypes.hpp).
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <expected>
#include <string>
#include <utility>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message and optional errno-style code
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    /**
     * @brief Build an error from the current errno value
     * @param context Prefix describing the failed operation
     * @return Error whose message ends with strerror(errno)
     */
    [[nodiscard]] static auto from_errno(const std::string& context) -> Error {
        const int saved = errno;
        return Error{context + ": " + std::strerror(saved), saved};
    }

    auto operator==(const Error&) const -> bool = default;
};

/// Result of an operation that produces no value
using Status = std::expected<void, Error>;

}  // namespace util

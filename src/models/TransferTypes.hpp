/**
 * @file TransferTypes.hpp
 * @brief Data types shared by the transfer engine, its services and front ends
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

/**
 * @enum TransferMode
 * @brief What a job does to the target device
 */
enum class TransferMode {
    WRITE,      ///< Copy an image onto the device
    ZERO_FILL,  ///< Overwrite the device with 0x00 ("format")
    VERIFY      ///< Compare an image against the device without writing
};

/**
 * @enum JobState
 * @brief Engine state machine: IDLE -> RUNNING -> {COMPLETED, CANCELLED, FAILED}
 */
enum class JobState { IDLE, RUNNING, COMPLETED, CANCELLED, FAILED };

[[nodiscard]] constexpr auto is_terminal(JobState state) -> bool {
    return state == JobState::COMPLETED || state == JobState::CANCELLED ||
           state == JobState::FAILED;
}

/**
 * @enum ErrorKind
 * @brief Reason a job was rejected or failed
 */
enum class ErrorKind {
    INVALID_ARGUMENT,   ///< Bad path, empty image, bad chunk size
    DEVICE_NOT_FOUND,   ///< Target does not exist or has no medium
    DEVICE_BUSY,        ///< Target locked by another job or mounted
    PERMISSION_DENIED,  ///< Not allowed to open the target
    CAPACITY_MISMATCH,  ///< Source larger than the device
    SHORT_SOURCE,       ///< Image ended before its declared size
    SOURCE_READ_ERROR,  ///< I/O error reading the image
    READ_ERROR,         ///< I/O error reading the device
    WRITE_ERROR,        ///< Write failed or short write not recovered
    FLUSH_ERROR,        ///< Final flush to the medium failed
    VERIFY_MISMATCH     ///< Read-back differs from the source
};

/**
 * @enum ErrorCategory
 * @brief Coarse grouping used to decide how a failure is presented
 */
enum class ErrorCategory {
    VALIDATION,    ///< Rejected before anything was written
    DEVICE,        ///< Hardware or OS refused the operation
    SOURCE,        ///< The image itself is unusable
    VERIFICATION   ///< Data on the medium does not match
};

[[nodiscard]] constexpr auto error_category(ErrorKind kind) -> ErrorCategory {
    switch (kind) {
        case ErrorKind::INVALID_ARGUMENT:
        case ErrorKind::DEVICE_NOT_FOUND:
        case ErrorKind::CAPACITY_MISMATCH:
            return ErrorCategory::VALIDATION;
        case ErrorKind::SHORT_SOURCE:
        case ErrorKind::SOURCE_READ_ERROR:
            return ErrorCategory::SOURCE;
        case ErrorKind::VERIFY_MISMATCH:
            return ErrorCategory::VERIFICATION;
        case ErrorKind::DEVICE_BUSY:
        case ErrorKind::PERMISSION_DENIED:
        case ErrorKind::READ_ERROR:
        case ErrorKind::WRITE_ERROR:
        case ErrorKind::FLUSH_ERROR:
            return ErrorCategory::DEVICE;
    }
    return ErrorCategory::DEVICE;
}

[[nodiscard]] constexpr auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::INVALID_ARGUMENT:
            return "InvalidArgument";
        case ErrorKind::DEVICE_NOT_FOUND:
            return "DeviceNotFound";
        case ErrorKind::DEVICE_BUSY:
            return "DeviceBusy";
        case ErrorKind::PERMISSION_DENIED:
            return "PermissionDenied";
        case ErrorKind::CAPACITY_MISMATCH:
            return "CapacityMismatch";
        case ErrorKind::SHORT_SOURCE:
            return "ShortSource";
        case ErrorKind::SOURCE_READ_ERROR:
            return "SourceReadError";
        case ErrorKind::READ_ERROR:
            return "ReadError";
        case ErrorKind::WRITE_ERROR:
            return "WriteError";
        case ErrorKind::FLUSH_ERROR:
            return "FlushError";
        case ErrorKind::VERIFY_MISMATCH:
            return "VerifyMismatch";
    }
    return "Unknown";
}

[[nodiscard]] constexpr auto to_string(JobState state) -> std::string_view {
    switch (state) {
        case JobState::IDLE:
            return "idle";
        case JobState::RUNNING:
            return "running";
        case JobState::COMPLETED:
            return "completed";
        case JobState::CANCELLED:
            return "cancelled";
        case JobState::FAILED:
            return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(TransferMode mode) -> std::string_view {
    switch (mode) {
        case TransferMode::WRITE:
            return "write";
        case TransferMode::ZERO_FILL:
            return "zero-fill";
        case TransferMode::VERIFY:
            return "verify";
    }
    return "unknown";
}

/**
 * @struct TransferError
 * @brief A failure together with the device offset at which it happened
 */
struct TransferError {
    ErrorKind kind = ErrorKind::INVALID_ARGUMENT;
    uint64_t offset = 0;  ///< Device byte offset of the failed operation
    std::string message;
    int os_error = 0;     ///< errno, when the failure came from a system call

    [[nodiscard]] auto category() const -> ErrorCategory { return error_category(kind); }

    auto operator==(const TransferError&) const -> bool = default;
};

/**
 * @struct JobResult
 * @brief Terminal outcome of a job, written exactly once
 */
struct JobResult {
    enum class Status { SUCCESS, CANCELLED, FAILED };

    Status status = Status::SUCCESS;
    std::optional<TransferError> error;  ///< Set only for FAILED
    uint64_t bytes_done = 0;

    [[nodiscard]] static auto success(uint64_t bytes_done) -> JobResult {
        return {.status = Status::SUCCESS, .error = std::nullopt, .bytes_done = bytes_done};
    }

    [[nodiscard]] static auto cancelled(uint64_t bytes_done) -> JobResult {
        return {.status = Status::CANCELLED, .error = std::nullopt, .bytes_done = bytes_done};
    }

    [[nodiscard]] static auto failed(TransferError error, uint64_t bytes_done) -> JobResult {
        return {.status = Status::FAILED, .error = std::move(error), .bytes_done = bytes_done};
    }

    [[nodiscard]] auto is_success() const -> bool { return status == Status::SUCCESS; }
    [[nodiscard]] auto is_cancelled() const -> bool { return status == Status::CANCELLED; }
    [[nodiscard]] auto is_failed() const -> bool { return status == Status::FAILED; }

    auto operator==(const JobResult&) const -> bool = default;
};

[[nodiscard]] constexpr auto to_string(JobResult::Status status) -> std::string_view {
    switch (status) {
        case JobResult::Status::SUCCESS:
            return "success";
        case JobResult::Status::CANCELLED:
            return "cancelled";
        case JobResult::Status::FAILED:
            return "failed";
    }
    return "unknown";
}

/**
 * @struct ProgressSnapshot
 * @brief Raw engine counters taken at a chunk boundary
 */
struct ProgressSnapshot {
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    std::chrono::nanoseconds elapsed{0};
    uint64_t instantaneous_rate_bps = 0;  ///< Rate over the last chunk only

    auto operator==(const ProgressSnapshot&) const -> bool = default;
};

/// Sent once when the job passes validation and begins transferring
struct StartedEvent {
    uint64_t job_id = 0;
    TransferMode mode = TransferMode::WRITE;
    uint64_t bytes_total = 0;

    auto operator==(const StartedEvent&) const -> bool = default;
};

/// Sent at every chunk boundary
/// rate_bps, eta_seconds and percentage describe the current pass (write or read-back)
struct ProgressEvent {
    uint64_t job_id = 0;
    uint64_t bytes_done = 0;          ///< Never decreases within a job
    uint64_t bytes_total = 0;
    uint64_t rate_bps = 0;            ///< Smoothed over the reporter window
    int64_t eta_seconds = -1;         ///< -1 while the rate is unknown
    double percentage = 0.0;
    bool verifying = false;           ///< true during the read-back pass
    uint64_t bytes_verified = 0;      ///< Read-back progress, 0 outside the verify pass

    auto operator==(const ProgressEvent&) const -> bool = default;
};

enum class LogSeverity { INFO, WARNING, ERROR, OK };

/// Human-readable line for the UI log pane
struct LogLineEvent {
    uint64_t job_id = 0;
    LogSeverity severity = LogSeverity::INFO;
    std::string text;

    auto operator==(const LogLineEvent&) const -> bool = default;
};

/// Sent exactly once per job, last
struct FinishedEvent {
    uint64_t job_id = 0;
    JobResult result;
    uint64_t bytes_total = 0;
    std::chrono::nanoseconds elapsed{0};
    uint64_t average_rate_bps = 0;

    auto operator==(const FinishedEvent&) const -> bool = default;
};

using TransferEvent = std::variant<StartedEvent, ProgressEvent, LogLineEvent, FinishedEvent>;

/**
 * @brief Receives events on the worker thread that produced them
 */
using EventCallback = std::function<void(const TransferEvent&)>;

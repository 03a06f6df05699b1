/**
 * @file TransferEngine.hpp
 * @brief Chunked source-to-device transfer with cancellation and verification
 */

#pragma once

#include "engine/ProgressReporter.hpp"
#include "engine/TransferJob.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <span>

/**
 * @class TransferEngine
 * @brief Runs one TransferJob to a terminal state on the calling thread
 *
 * State machine: IDLE -> RUNNING -> {COMPLETED, CANCELLED, FAILED}. A job
 * rejected during validation goes from IDLE straight to FAILED without a
 * Started event and without touching the device.
 *
 * Events are delivered synchronously to the callback on the thread that
 * called run(). Exactly one FinishedEvent is emitted per run, and it is
 * always the last event.
 *
 * request_cancel() and the state/counter accessors may be called from any
 * thread while run() is in progress.
 */
class TransferEngine {
public:
    TransferEngine(TransferJob job, EventCallback on_event);
    ~TransferEngine() = default;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    TransferEngine(TransferEngine&&) = delete;
    TransferEngine& operator=(TransferEngine&&) = delete;

    /**
     * @brief Execute the job
     * @return Terminal result, or an error if the engine already ran
     */
    [[nodiscard]] auto run() -> std::expected<JobResult, util::Error>;

    /**
     * @brief Ask the job to stop at the next chunk boundary
     */
    void request_cancel() noexcept { cancel_requested_.store(true); }

    [[nodiscard]] auto cancel_requested() const noexcept -> bool {
        return cancel_requested_.load();
    }

    [[nodiscard]] auto state() const noexcept -> JobState { return state_.load(); }
    [[nodiscard]] auto bytes_done() const noexcept -> uint64_t { return bytes_done_.load(); }
    [[nodiscard]] auto bytes_total() const noexcept -> uint64_t { return bytes_total_; }

    /// Zero bytes appended to reach sector alignment, not part of bytes_done()
    [[nodiscard]] auto padded_bytes() const noexcept -> uint64_t { return padded_bytes_.load(); }

    [[nodiscard]] auto job_id() const noexcept -> uint64_t { return job_.id; }
    [[nodiscard]] auto mode() const noexcept -> TransferMode { return job_.mode; }

    [[nodiscard]] auto result() const -> std::optional<JobResult>;

private:
    [[nodiscard]] auto validate() const -> std::optional<TransferError>;

    /// Write loop; returns a terminal result on failure or cancel
    [[nodiscard]] auto transfer_chunks() -> std::optional<JobResult>;
    [[nodiscard]] auto write_chunk(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, TransferError>;
    [[nodiscard]] auto stop_cancelled() -> JobResult;
    [[nodiscard]] auto run_verification() -> std::optional<JobResult>;

    auto finish(JobResult result) -> JobResult;

    void report_progress(uint64_t bytes_done, bool verifying);
    void emit(const TransferEvent& event);
    void log_line(LogSeverity severity, std::string text);

    [[nodiscard]] auto elapsed() const -> std::chrono::nanoseconds;

    TransferJob job_;
    EventCallback on_event_;
    ProgressReporter reporter_;

    std::atomic<JobState> state_{JobState::IDLE};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<uint64_t> bytes_done_{0};
    std::atomic<uint64_t> padded_bytes_{0};
    const uint64_t bytes_total_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::nanoseconds last_snapshot_time_{0};
    uint64_t last_snapshot_bytes_ = 0;

    mutable std::mutex result_mutex_;
    std::optional<JobResult> result_;
};

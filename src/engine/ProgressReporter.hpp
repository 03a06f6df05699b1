/**
 * @file ProgressReporter.hpp
 * @brief Turns engine counters into Progress and Finished events
 */

#pragma once

#include "models/TransferTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>

/**
 * @class ProgressReporter
 * @brief Sliding-window rate and ETA calculation
 *
 * The rate is the byte delta divided by the time delta between the oldest
 * and newest snapshot in the window, which smooths the jitter of single
 * chunks on slow floppy media.
 *
 * @note Not thread-safe. Owned by the engine and used only on its worker
 *       thread.
 */
class ProgressReporter {
public:
    static constexpr size_t DEFAULT_WINDOW = 8;

    explicit ProgressReporter(size_t window = DEFAULT_WINDOW);

    /**
     * @brief Forget all samples and start a new window at @p origin
     *
     * Called at job start and again when the verification pass begins.
     */
    void reset(const ProgressSnapshot& origin = {});

    /**
     * @brief Add a snapshot and build the event for it
     * @param job_id Job the snapshot belongs to
     * @param snapshot Counters at a chunk boundary
     * @param verifying true during the read-back pass
     */
    [[nodiscard]] auto on_snapshot(uint64_t job_id, const ProgressSnapshot& snapshot,
                                   bool verifying = false) -> ProgressEvent;

    /// Smoothed rate over the current window, 0 until two samples exist
    [[nodiscard]] auto rate_bps() const -> uint64_t;

    [[nodiscard]] auto sample_count() const -> size_t { return samples_.size(); }

    /**
     * @brief Seconds left at @p rate_bps, rounded up
     * @return 0 when nothing remains, -1 when the rate is unknown
     */
    [[nodiscard]] static auto eta_seconds(uint64_t bytes_done, uint64_t bytes_total,
                                          uint64_t rate_bps) -> int64_t;

    [[nodiscard]] static auto percentage(uint64_t bytes_done, uint64_t bytes_total) -> double;

    /**
     * @brief Terminal event with the whole-job average rate
     */
    [[nodiscard]] static auto make_finished_event(uint64_t job_id, const JobResult& result,
                                                  uint64_t bytes_total,
                                                  std::chrono::nanoseconds elapsed)
        -> FinishedEvent;

private:
    size_t window_;
    std::deque<ProgressSnapshot> samples_;
};

#include "engine/ProgressReporter.hpp"

#include <algorithm>

namespace {

auto to_seconds(std::chrono::nanoseconds d) -> double {
    return std::chrono::duration<double>(d).count();
}

}  // namespace

ProgressReporter::ProgressReporter(size_t window) : window_(std::max<size_t>(window, 2)) {
    reset();
}

void ProgressReporter::reset(const ProgressSnapshot& origin) {
    samples_.clear();
    samples_.push_back(origin);
}

auto ProgressReporter::on_snapshot(uint64_t job_id, const ProgressSnapshot& snapshot,
                                   bool verifying) -> ProgressEvent {
    samples_.push_back(snapshot);
    while (samples_.size() > window_) {
        samples_.pop_front();
    }

    const auto rate = rate_bps();
    return ProgressEvent{
        .job_id = job_id,
        .bytes_done = snapshot.bytes_done,
        .bytes_total = snapshot.bytes_total,
        .rate_bps = rate,
        .eta_seconds = eta_seconds(snapshot.bytes_done, snapshot.bytes_total, rate),
        .percentage = percentage(snapshot.bytes_done, snapshot.bytes_total),
        .verifying = verifying,
    };
}

auto ProgressReporter::rate_bps() const -> uint64_t {
    if (samples_.size() < 2) {
        return 0;
    }

    const auto& oldest = samples_.front();
    const auto& newest = samples_.back();
    if (newest.bytes_done <= oldest.bytes_done) {
        return 0;
    }

    const double seconds = to_seconds(newest.elapsed - oldest.elapsed);
    if (seconds <= 0.0) {
        return 0;
    }
    return static_cast<uint64_t>(static_cast<double>(newest.bytes_done - oldest.bytes_done) /
                                 seconds);
}

auto ProgressReporter::eta_seconds(uint64_t bytes_done, uint64_t bytes_total, uint64_t rate_bps)
    -> int64_t {
    if (bytes_done >= bytes_total) {
        return 0;
    }
    if (rate_bps == 0) {
        return -1;
    }
    const uint64_t remaining = bytes_total - bytes_done;
    return static_cast<int64_t>((remaining + rate_bps - 1) / rate_bps);
}

auto ProgressReporter::percentage(uint64_t bytes_done, uint64_t bytes_total) -> double {
    if (bytes_total == 0) {
        return 0.0;
    }
    return static_cast<double>(bytes_done) * 100.0 / static_cast<double>(bytes_total);
}

auto ProgressReporter::make_finished_event(uint64_t job_id, const JobResult& result,
                                           uint64_t bytes_total, std::chrono::nanoseconds elapsed)
    -> FinishedEvent {
    const double seconds = to_seconds(elapsed);
    const uint64_t average =
        seconds > 0.0 ? static_cast<uint64_t>(static_cast<double>(result.bytes_done) / seconds)
                      : 0;
    return FinishedEvent{
        .job_id = job_id,
        .result = result,
        .bytes_total = bytes_total,
        .elapsed = elapsed,
        .average_rate_bps = average,
    };
}

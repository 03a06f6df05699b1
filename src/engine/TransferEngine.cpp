#include "engine/TransferEngine.hpp"

#include "engine/ChunkIo.hpp"
#include "engine/Verifier.hpp"
#include "util/ByteFormat.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

namespace {

auto state_for(const JobResult& result) -> JobState {
    switch (result.status) {
        case JobResult::Status::SUCCESS:
            return JobState::COMPLETED;
        case JobResult::Status::CANCELLED:
            return JobState::CANCELLED;
        case JobResult::Status::FAILED:
            return JobState::FAILED;
    }
    return JobState::FAILED;
}

}  // namespace

TransferEngine::TransferEngine(TransferJob job, EventCallback on_event)
    : job_(std::move(job)), on_event_(std::move(on_event)),
      bytes_total_(job_.source ? job_.source->size() : 0) {}

auto TransferEngine::result() const -> std::optional<JobResult> {
    std::lock_guard lock(result_mutex_);
    return result_;
}

auto TransferEngine::elapsed() const -> std::chrono::nanoseconds {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() -
                                                                start_time_);
}

void TransferEngine::emit(const TransferEvent& event) {
    if (on_event_) {
        on_event_(event);
    }
}

void TransferEngine::log_line(LogSeverity severity, std::string text) {
    switch (severity) {
        case LogSeverity::WARNING:
            LOG_WARNING("TransferEngine", std::format("[job {}] {}", job_.id, text));
            break;
        case LogSeverity::ERROR:
            LOG_ERROR("TransferEngine", std::format("[job {}] {}", job_.id, text));
            break;
        case LogSeverity::INFO:
        case LogSeverity::OK:
            LOG_INFO("TransferEngine", std::format("[job {}] {}", job_.id, text));
            break;
    }
    emit(LogLineEvent{.job_id = job_.id, .severity = severity, .text = std::move(text)});
}

auto TransferEngine::validate() const -> std::optional<TransferError> {
    if (!job_.source || !job_.target) {
        return TransferError{.kind = ErrorKind::INVALID_ARGUMENT,
                             .message = "Job has no source or no target"};
    }

    const uint32_t sector = job_.target->sector_size();
    if (sector == 0) {
        return TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("{} reports a sector size of 0", job_.target->path())};
    }

    const size_t chunk = job_.options.chunk_size;
    if (chunk == 0 || chunk % sector != 0) {
        return TransferError{
            .kind = ErrorKind::INVALID_ARGUMENT,
            .message = std::format("Chunk size {} is not a positive multiple of the {} byte "
                                   "sector size",
                                   chunk, sector)};
    }

    if (bytes_total_ == 0) {
        return TransferError{.kind = ErrorKind::INVALID_ARGUMENT,
                             .message = std::format("{} is empty", job_.source->describe())};
    }

    const uint64_t capacity = job_.target->capacity();
    const uint64_t padded_total = chunk_io::round_up(bytes_total_, sector);
    if (bytes_total_ > capacity || padded_total > capacity) {
        return TransferError{
            .kind = ErrorKind::CAPACITY_MISMATCH,
            .message = std::format("{} needs {} but {} holds only {}", job_.source->describe(),
                                   util::format_bytes(padded_total), job_.target->path(),
                                   util::format_bytes(capacity))};
    }

    return std::nullopt;
}

auto TransferEngine::run() -> std::expected<JobResult, util::Error> {
    if (state_.load() != JobState::IDLE) {
        return std::unexpected(util::Error{std::format("Job {} has already run", job_.id)});
    }

    start_time_ = std::chrono::steady_clock::now();
    reporter_.reset(ProgressSnapshot{.bytes_total = bytes_total_});

    if (auto error = validate()) {
        LOG_ERROR("TransferEngine",
                  std::format("[job {}] Rejected: {} ({})", job_.id, error->message,
                              to_string(error->kind)));
        return finish(JobResult::failed(std::move(*error), 0));
    }

    state_.store(JobState::RUNNING);
    emit(StartedEvent{.job_id = job_.id, .mode = job_.mode, .bytes_total = bytes_total_});

    auto& source = *job_.source;
    auto& target = *job_.target;

    if (job_.mode == TransferMode::VERIFY) {
        log_line(LogSeverity::INFO, std::format("Comparing {} ({}) with {}", source.describe(),
                                                util::format_bytes(bytes_total_), target.path()));
    } else {
        log_line(LogSeverity::INFO, std::format("Writing {} ({}) to {}", source.describe(),
                                                util::format_bytes(bytes_total_), target.path()));

        if (auto opened = source.open(); !opened) {
            log_line(LogSeverity::ERROR, opened.error().message);
            return finish(JobResult::failed(opened.error(), 0));
        }

        auto stopped = transfer_chunks();
        source.close();
        if (stopped) {
            return finish(std::move(*stopped));
        }

        if (auto flushed = target.flush(); !flushed) {
            return finish(JobResult::failed(flushed.error(), bytes_done_.load()));
        }
        log_line(LogSeverity::OK, std::format("Wrote {} to {}", util::format_bytes(bytes_done_.load()),
                                              target.path()));
    }

    if (job_.mode == TransferMode::VERIFY || job_.options.verify_after_write) {
        if (auto stopped = run_verification()) {
            return finish(std::move(*stopped));
        }
    }

    return finish(JobResult::success(bytes_done_.load()));
}

auto TransferEngine::transfer_chunks() -> std::optional<JobResult> {
    auto& source = *job_.source;
    const uint32_t sector = job_.target->sector_size();
    const size_t chunk_size = job_.options.chunk_size;

    std::vector<uint8_t> buffer(chunk_size);
    uint64_t offset = 0;

    while (offset < bytes_total_) {
        if (cancel_requested_.load()) {
            return stop_cancelled();
        }

        const auto length = static_cast<size_t>(std::min<uint64_t>(chunk_size, bytes_total_ - offset));
        if (auto r = chunk_io::read_exact(source, std::span(buffer).first(length), offset); !r) {
            log_line(LogSeverity::ERROR, r.error().message);
            return JobResult::failed(r.error(), offset);
        }

        // The final chunk is zero-padded so no sub-sector write is ever issued
        const auto aligned = static_cast<size_t>(chunk_io::round_up(length, sector));
        std::fill(buffer.begin() + static_cast<std::ptrdiff_t>(length),
                  buffer.begin() + static_cast<std::ptrdiff_t>(aligned), 0);

        if (auto w = write_chunk(offset, std::span(buffer).first(aligned)); !w) {
            log_line(LogSeverity::ERROR, w.error().message);
            return JobResult::failed(w.error(), offset);
        }

        offset += length;
        padded_bytes_.fetch_add(aligned - length);
        bytes_done_.store(offset);
        report_progress(offset, false);
    }

    return std::nullopt;
}

auto TransferEngine::write_chunk(uint64_t offset, std::span<const uint8_t> data)
    -> std::expected<void, TransferError> {
    auto& target = *job_.target;
    const uint32_t sector = target.sector_size();
    size_t written = 0;
    unsigned retries = 0;

    while (written < data.size()) {
        auto n = target.write_at(offset + written, data.subspan(written));
        if (!n) {
            return std::unexpected(n.error());
        }
        const size_t accepted = std::min(*n, data.size() - written);
        if (written + accepted == data.size()) {
            break;
        }
        // Resend the sector the device only partly took, so every retry stays aligned
        written = static_cast<size_t>(chunk_io::round_down(written + accepted, sector));

        if (++retries > job_.options.max_write_retries) {
            return std::unexpected(TransferError{
                .kind = ErrorKind::WRITE_ERROR,
                .offset = offset + written,
                .message = std::format("Short write at offset {} not recovered after {} retries",
                                       offset + written, job_.options.max_write_retries)});
        }
        log_line(LogSeverity::WARNING,
                 std::format("Short write at offset {} ({} of {} bytes), retry {}/{}",
                             offset + written, written, data.size(), retries,
                             job_.options.max_write_retries));
    }
    return {};
}

auto TransferEngine::stop_cancelled() -> JobResult {
    const auto done = bytes_done_.load();
    if (auto flushed = job_.target->flush(); !flushed) {
        LOG_WARNING("TransferEngine",
                    std::format("[job {}] Flush after cancel failed: {}", job_.id,
                                flushed.error().message));
    }
    log_line(LogSeverity::WARNING,
             std::format("Cancelled after {}; the medium is partially written",
                         util::format_bytes(done)));
    return JobResult::cancelled(done);
}

auto TransferEngine::run_verification() -> std::optional<JobResult> {
    auto& target = *job_.target;
    log_line(LogSeverity::INFO, std::format("Verifying {}", target.path()));

    reporter_.reset(ProgressSnapshot{.bytes_total = bytes_total_, .elapsed = elapsed()});
    last_snapshot_time_ = elapsed();
    last_snapshot_bytes_ = 0;

    const bool verify_only = job_.mode == TransferMode::VERIFY;
    Verifier verifier(job_.options.chunk_size, [this, verify_only](uint64_t verified) {
        if (verify_only) {
            bytes_done_.store(verified);
        }
        report_progress(verified, true);
    });

    auto outcome = verifier.verify(*job_.source, target, cancel_requested_);
    switch (outcome.status) {
        case VerifyStatus::MATCH:
            log_line(LogSeverity::OK, "Verification passed");
            return std::nullopt;
        case VerifyStatus::CANCELLED:
            log_line(LogSeverity::WARNING, "Verification cancelled");
            return JobResult::cancelled(bytes_done_.load());
        case VerifyStatus::MISMATCH: {
            TransferError error{
                .kind = ErrorKind::VERIFY_MISMATCH,
                .offset = outcome.offset,
                .message = std::format("Verification failed: first difference at offset {}",
                                       outcome.offset)};
            log_line(LogSeverity::ERROR, error.message);
            return JobResult::failed(std::move(error), bytes_done_.load());
        }
        case VerifyStatus::IO_ERROR: {
            auto error = outcome.error.value_or(TransferError{
                .kind = ErrorKind::READ_ERROR, .message = "Verification read failed"});
            log_line(LogSeverity::ERROR, error.message);
            return JobResult::failed(std::move(error), bytes_done_.load());
        }
    }
    return std::nullopt;
}

void TransferEngine::report_progress(uint64_t bytes_done, bool verifying) {
    const auto now = elapsed();
    const auto chunk_time = now - last_snapshot_time_;
    const uint64_t chunk_bytes = bytes_done - last_snapshot_bytes_;
    const uint64_t instantaneous =
        chunk_time.count() > 0
            ? static_cast<uint64_t>(static_cast<double>(chunk_bytes) /
                                    std::chrono::duration<double>(chunk_time).count())
            : 0;

    last_snapshot_time_ = now;
    last_snapshot_bytes_ = bytes_done;

    auto event = reporter_.on_snapshot(job_.id,
                                       ProgressSnapshot{.bytes_done = bytes_done,
                                                        .bytes_total = bytes_total_,
                                                        .elapsed = now,
                                                        .instantaneous_rate_bps = instantaneous},
                                       verifying);
    if (verifying) {
        // bytes_done stays at the job's count; the read-back pass has its own counter
        event.bytes_verified = bytes_done;
        event.bytes_done = bytes_done_.load();
    }
    emit(std::move(event));
}

auto TransferEngine::finish(JobResult result) -> JobResult {
    if (job_.target) {
        job_.target->close();
    }

    state_.store(state_for(result));
    {
        std::lock_guard lock(result_mutex_);
        result_ = result;
    }

    switch (result.status) {
        case JobResult::Status::SUCCESS:
            LOG_INFO("TransferEngine", std::format("[job {}] Completed", job_.id));
            break;
        case JobResult::Status::CANCELLED:
            LOG_INFO("TransferEngine", std::format("[job {}] Cancelled at {} bytes", job_.id,
                                                   result.bytes_done));
            break;
        case JobResult::Status::FAILED:
            LOG_ERROR("TransferEngine",
                      std::format("[job {}] Failed: {} at offset {}", job_.id,
                                  result.error ? result.error->message : "unknown error",
                                  result.error ? result.error->offset : 0));
            break;
    }

    emit(ProgressReporter::make_finished_event(job_.id, result, bytes_total_, elapsed()));
    return result;
}

#include "services/TransferService.hpp"

#include "devices/DevicePolicy.hpp"
#include "devices/PosixBlockDevice.hpp"
#include "engine/ProgressReporter.hpp"
#include "engine/TransferEngine.hpp"
#include "models/FloppyGeometry.hpp"
#include "sources/SourceFactory.hpp"
#include "sources/ZeroFillSource.hpp"
#include "util/ByteFormat.hpp"
#include "util/Logger.hpp"

#include <format>
#include <utility>
#include <vector>

TransferService::TransferService(ServiceOptions options, BlockDeviceOpener opener,
                                 std::shared_ptr<DeviceService> device_service)
    : options_(std::move(options)), opener_(std::move(opener)),
      device_service_(std::move(device_service)), events_(options_.buffer_events) {
    if (!opener_) {
        opener_ = PosixBlockDevice::opener({.allow_regular_files = options_.allow_regular_files});
    }
    if (!device_service_) {
        device_service_ = std::make_shared<DeviceService>();
    }
}

TransferService::~TransferService() {
    std::vector<std::shared_ptr<JobRecord>> records;
    {
        std::lock_guard lock(jobs_mutex_);
        for (const auto& [id, record] : jobs_) {
            records.push_back(record);
        }
    }

    for (const auto& record : records) {
        cancel(record->id);
    }
    for (const auto& record : records) {
        if (record->worker.joinable()) {
            LOG_DEBUG("TransferService", std::format("Joining worker of job {}", record->id));
            record->worker.join();
        }
    }
    events_.close();
}

auto TransferService::start_write(const std::string& image_path, const std::string& device_path)
    -> std::expected<uint64_t, TransferError> {
    auto source = sources::open_image(image_path);
    if (!source) {
        LOG_ERROR("TransferService", source.error().message);
        return std::unexpected(source.error());
    }
    return start_job(TransferMode::WRITE, device_path, std::move(*source));
}

auto TransferService::start_format(const std::string& device_path)
    -> std::expected<uint64_t, TransferError> {
    // The zero source is sized on the worker once the device capacity is known
    return start_job(TransferMode::ZERO_FILL, device_path, nullptr);
}

auto TransferService::start_verify(const std::string& image_path, const std::string& device_path)
    -> std::expected<uint64_t, TransferError> {
    auto source = sources::open_image(image_path);
    if (!source) {
        LOG_ERROR("TransferService", source.error().message);
        return std::unexpected(source.error());
    }
    return start_job(TransferMode::VERIFY, device_path, std::move(*source));
}

auto TransferService::start_job(TransferMode mode, const std::string& device_path,
                                std::unique_ptr<IByteSource> source)
    -> std::expected<uint64_t, TransferError> {
    if (auto valid = device_policy::validate_target_path(device_path, options_.allow_regular_files);
        !valid) {
        LOG_ERROR("TransferService", valid.error().message);
        return std::unexpected(valid.error());
    }

    auto lease = locks_.try_acquire(device_path);
    if (!lease) {
        return std::unexpected(lease.error());
    }

    reap_finished_workers();

    auto record = std::make_shared<JobRecord>();
    record->mode = mode;
    record->device_path = device_path;
    record->lease = std::move(*lease);

    std::lock_guard lock(jobs_mutex_);
    record->id = next_job_id_++;
    jobs_[record->id] = record;

    LOG_INFO("TransferService", std::format("Job {}: {} on {}", record->id, to_string(mode),
                                            device_path));

    record->worker = std::thread([this, record, source = std::move(source)]() mutable {
        run_job(record, std::move(source));
    });
    return record->id;
}

void TransferService::prepare_target(const JobRecord& record) {
    if (!options_.unmount_before_write) {
        return;
    }
    // Best effort: the exclusive open below decides whether the device is usable
    if (auto unmounted = device_service_->unmount_device(record.device_path); !unmounted) {
        LOG_WARNING("TransferService", std::format("Job {}: {}", record.id, unmounted.error().message));
        events_.publish(LogLineEvent{.job_id = record.id,
                                     .severity = LogSeverity::WARNING,
                                     .text = unmounted.error().message});
    }
}

void TransferService::run_job(const std::shared_ptr<JobRecord>& record,
                              std::unique_ptr<IByteSource> source) {
    try {
        const bool verify_only = record->mode == TransferMode::VERIFY;
        if (!verify_only) {
            prepare_target(*record);
        }

        auto device = opener_(record->device_path,
                              verify_only ? DeviceAccess::READ_ONLY : DeviceAccess::READ_WRITE);
        if (!device) {
            fail_before_start(record, device.error());
            return;
        }

        if (record->mode == TransferMode::ZERO_FILL) {
            auto size = options_.format_size.resolve((*device)->capacity());
            if (!size) {
                fail_before_start(record, size.error());
                return;
            }
            source = std::make_unique<ZeroFillSource>(*size);
        } else if (!floppy::is_standard_size(source->size())) {
            const auto text = std::format("{} is {}, not a standard floppy size", source->describe(),
                                          util::format_bytes(source->size()));
            LOG_WARNING("TransferService", text);
            events_.publish(
                LogLineEvent{.job_id = record->id, .severity = LogSeverity::WARNING, .text = text});
        }

        TransferEngine engine(
            TransferJob{.id = record->id,
                        .mode = record->mode,
                        .source = std::move(source),
                        .target = std::move(*device),
                        .options = options_.transfer},
            [this, &record = *record](const TransferEvent& event) { on_engine_event(record, event); });

        // Unpublishes the engine before it is destroyed, also when run() throws
        struct EngineRegistration {
            JobRecord& record;
            EngineRegistration(JobRecord& r, TransferEngine& engine) : record(r) {
                std::lock_guard lock(record.mutex);
                record.engine = &engine;
                if (record.cancel_requested.load()) {
                    engine.request_cancel();
                }
            }
            ~EngineRegistration() {
                std::lock_guard lock(record.mutex);
                record.engine = nullptr;
            }
            EngineRegistration(const EngineRegistration&) = delete;
            EngineRegistration& operator=(const EngineRegistration&) = delete;
        };

        std::expected<JobResult, util::Error> result;
        {
            EngineRegistration registration(*record, engine);
            result = engine.run();
        }

        if (!result) {
            // Only reachable if the engine was run twice
            fail_before_start(record, TransferError{.kind = ErrorKind::INVALID_ARGUMENT,
                                                    .message = result.error().message});
        }
    } catch (const std::exception& e) {
        LOG_ERROR("TransferService", std::format("Job {} aborted: {}", record->id, e.what()));
        {
            std::lock_guard lock(record->mutex);
            if (record->result) {
                return;
            }
        }
        fail_before_start(record, TransferError{.kind = ErrorKind::WRITE_ERROR,
                                                .message = std::format("Internal error: {}",
                                                                       e.what())});
    }
}

void TransferService::fail_before_start(const std::shared_ptr<JobRecord>& record,
                                        TransferError error) {
    LOG_ERROR("TransferService", std::format("Job {} failed: {}", record->id, error.message));
    auto result = JobResult::failed(std::move(error), 0);
    on_engine_event(*record, ProgressReporter::make_finished_event(record->id, result, 0,
                                                                   std::chrono::nanoseconds{0}));
}

void TransferService::on_engine_event(JobRecord& record, const TransferEvent& event) {
    const auto* finished = std::get_if<FinishedEvent>(&event);
    if (!finished) {
        events_.publish(event);
        return;
    }

    // Free the device before anyone can observe the end of the job
    record.lease.release();
    events_.publish(event);
    complete(record, finished->result);
}

void TransferService::complete(JobRecord& record, JobResult result) {
    {
        std::lock_guard lock(record.mutex);
        record.result = std::move(result);
    }
    record.finished_cv.notify_all();
}

auto TransferService::cancel(uint64_t job_id) -> bool {
    auto record = find(job_id);
    if (!record) {
        return false;
    }

    std::lock_guard lock(record->mutex);
    if (record->result) {
        return false;
    }
    record->cancel_requested.store(true);
    if (record->engine) {
        record->engine->request_cancel();
    }
    LOG_INFO("TransferService", std::format("Cancel requested for job {}", job_id));
    return true;
}

auto TransferService::job_state(uint64_t job_id) const -> std::optional<JobState> {
    auto record = find(job_id);
    if (!record) {
        return std::nullopt;
    }

    std::lock_guard lock(record->mutex);
    if (record->result) {
        switch (record->result->status) {
            case JobResult::Status::SUCCESS:
                return JobState::COMPLETED;
            case JobResult::Status::CANCELLED:
                return JobState::CANCELLED;
            case JobResult::Status::FAILED:
                return JobState::FAILED;
        }
    }
    if (record->engine) {
        return record->engine->state();
    }
    return JobState::IDLE;
}

auto TransferService::wait(uint64_t job_id) -> std::optional<JobResult> {
    auto record = find(job_id);
    if (!record) {
        return std::nullopt;
    }

    std::unique_lock lock(record->mutex);
    record->finished_cv.wait(lock, [&record] { return record->result.has_value(); });
    return record->result;
}

auto TransferService::find(uint64_t job_id) const -> std::shared_ptr<JobRecord> {
    std::lock_guard lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    return it != jobs_.end() ? it->second : nullptr;
}

void TransferService::reap_finished_workers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard lock(jobs_mutex_);
        for (const auto& [id, record] : jobs_) {
            std::lock_guard record_lock(record->mutex);
            if (record->result && record->worker.joinable()) {
                finished.push_back(std::move(record->worker));
            }
        }
    }
    for (auto& worker : finished) {
        worker.join();
    }

    // Forget the oldest finished jobs once the history is full
    std::lock_guard lock(jobs_mutex_);
    size_t reaped = 0;
    for (const auto& [id, record] : jobs_) {
        std::lock_guard record_lock(record->mutex);
        reaped += record->result && !record->worker.joinable() ? 1 : 0;
    }
    for (auto it = jobs_.begin(); it != jobs_.end() && reaped > options_.finished_job_history;) {
        bool erase = false;
        {
            std::lock_guard record_lock(it->second->mutex);
            erase = it->second->result && !it->second->worker.joinable();
        }
        if (erase) {
            LOG_DEBUG("TransferService", std::format("Dropping record of job {}", it->first));
            it = jobs_.erase(it);
            --reaped;
        } else {
            ++it;
        }
    }
}

#pragma once

#include "devices/DeviceLockRegistry.hpp"
#include "devices/DeviceService.hpp"
#include "devices/IBlockDevice.hpp"
#include "engine/TransferJob.hpp"
#include "services/ITransferService.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

class TransferEngine;

struct ServiceOptions {
    TransferOptions transfer;
    FormatSizePolicy format_size;
    bool allow_regular_files = false;   ///< Accept plain files as targets
    bool unmount_before_write = true;   ///< Detach auto-mounted media first
    bool buffer_events = true;          ///< Queue events for polling; off for push-only consumers
    size_t finished_job_history = 16;   ///< Finished jobs still answered by job_state() and wait()
};

/**
 * @class TransferService
 * @brief Runs transfer jobs on worker threads, one job per device
 *
 * The request is validated and the device lock taken on the caller's
 * thread, so a second job against a busy device fails immediately with
 * DEVICE_BUSY. Unmounting, opening the device and the transfer itself
 * happen on the job's worker thread. Verify jobs skip the unmount and open
 * the device read-only.
 *
 * Records of finished jobs are dropped oldest first once more than
 * finished_job_history of them are kept; a dropped job is unknown to
 * job_state(), wait() and cancel().
 *
 * The destructor cancels every running job and joins its worker. It never
 * detaches: a detached writer could still be issuing writes when the
 * process exits.
 */
class TransferService : public ITransferService {
public:
    /**
     * @param options Transfer and target policy
     * @param opener Device opener; PosixBlockDevice when empty
     * @param device_service Mount handling; a default DeviceService when null
     */
    explicit TransferService(ServiceOptions options, BlockDeviceOpener opener = {},
                             std::shared_ptr<DeviceService> device_service = nullptr);
    ~TransferService() override;

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    auto start_write(const std::string& image_path, const std::string& device_path)
        -> std::expected<uint64_t, TransferError> override;
    auto start_format(const std::string& device_path)
        -> std::expected<uint64_t, TransferError> override;
    auto start_verify(const std::string& image_path, const std::string& device_path)
        -> std::expected<uint64_t, TransferError> override;

    auto cancel(uint64_t job_id) -> bool override;
    [[nodiscard]] auto job_state(uint64_t job_id) const -> std::optional<JobState> override;
    auto wait(uint64_t job_id) -> std::optional<JobResult> override;
    [[nodiscard]] auto events() -> EventChannel& override { return events_; }

    [[nodiscard]] auto options() const -> const ServiceOptions& { return options_; }

private:
    struct JobRecord {
        uint64_t id = 0;
        TransferMode mode = TransferMode::WRITE;
        std::string device_path;
        DeviceLockRegistry::Lease lease;

        std::atomic<bool> cancel_requested{false};

        mutable std::mutex mutex;
        std::condition_variable finished_cv;
        TransferEngine* engine = nullptr;  ///< Set while the engine runs
        std::optional<JobResult> result;

        std::thread worker;
    };

    [[nodiscard]] auto start_job(TransferMode mode, const std::string& device_path,
                                 std::unique_ptr<IByteSource> source)
        -> std::expected<uint64_t, TransferError>;

    void run_job(const std::shared_ptr<JobRecord>& record, std::unique_ptr<IByteSource> source);
    void prepare_target(const JobRecord& record);
    void fail_before_start(const std::shared_ptr<JobRecord>& record, TransferError error);
    void on_engine_event(JobRecord& record, const TransferEvent& event);
    void complete(JobRecord& record, JobResult result);
    void reap_finished_workers();

    [[nodiscard]] auto find(uint64_t job_id) const -> std::shared_ptr<JobRecord>;

    ServiceOptions options_;
    BlockDeviceOpener opener_;
    std::shared_ptr<DeviceService> device_service_;

    // Declared before jobs_ so that leases are returned before the registry dies
    DeviceLockRegistry locks_;
    EventChannel events_;

    mutable std::mutex jobs_mutex_;
    std::map<uint64_t, std::shared_ptr<JobRecord>> jobs_;
    uint64_t next_job_id_ = 1;
};

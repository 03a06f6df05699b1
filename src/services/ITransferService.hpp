#pragma once

#include "models/TransferTypes.hpp"
#include "services/EventChannel.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

/**
 * @class ITransferService
 * @brief Command surface shared by the CLI and the D-Bus helper
 *
 * Every start_* call either rejects the request synchronously (invalid
 * path, unreadable image, device already in use) or returns a job id and
 * runs the job on its own worker thread. Progress and the result arrive
 * through events().
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Write a raw image to a device
     * @param image_path Image file (.img, .ima, .adf, ...)
     * @param device_path Target device node
     * @return Job id, or the reason the job could not start
     */
    [[nodiscard]] virtual auto start_write(const std::string& image_path,
                                           const std::string& device_path)
        -> std::expected<uint64_t, TransferError> = 0;

    /**
     * @brief Zero-fill a device
     *
     * The length comes from the service's FormatSizePolicy, the full device
     * capacity unless configured otherwise.
     */
    [[nodiscard]] virtual auto start_format(const std::string& device_path)
        -> std::expected<uint64_t, TransferError> = 0;

    /**
     * @brief Compare an image with a device without writing
     */
    [[nodiscard]] virtual auto start_verify(const std::string& image_path,
                                            const std::string& device_path)
        -> std::expected<uint64_t, TransferError> = 0;

    /**
     * @brief Request cancellation at the next chunk boundary
     * @return false if the job is unknown or already finished
     */
    virtual auto cancel(uint64_t job_id) -> bool = 0;

    [[nodiscard]] virtual auto job_state(uint64_t job_id) const -> std::optional<JobState> = 0;

    /**
     * @brief Block until the job reaches a terminal state
     * @return Its result, or std::nullopt for an unknown job id
     */
    virtual auto wait(uint64_t job_id) -> std::optional<JobResult> = 0;

    [[nodiscard]] virtual auto events() -> EventChannel& = 0;
};

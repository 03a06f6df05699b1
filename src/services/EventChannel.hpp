/**
 * @file EventChannel.hpp
 * @brief Hand-off of transfer events from worker threads to the front end
 */

#pragma once

#include "models/TransferTypes.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

/**
 * @class EventChannel
 * @brief Multi-producer queue with optional push subscribers
 *
 * Front ends either poll the queue (the CLI) or subscribe (the D-Bus
 * helper, which re-posts each event onto its main loop). Subscribers run on
 * the publishing worker thread and must not block.
 */
class EventChannel {
public:
    using SubscriptionId = size_t;

    /**
     * @param buffered Keep published events for poll()/wait_for()
     */
    explicit EventChannel(bool buffered = true) : buffered_(buffered) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void publish(const TransferEvent& event);

    /// Next queued event, if any, without waiting
    [[nodiscard]] auto poll() -> std::optional<TransferEvent>;

    /**
     * @brief Next queued event, waiting up to @p timeout
     * @return std::nullopt on timeout or once the channel is closed and drained
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> std::optional<TransferEvent>;

    auto subscribe(EventCallback callback) -> SubscriptionId;
    void unsubscribe(SubscriptionId id);

    /// Wake all waiters; later publish() calls are dropped
    void close();

    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto pending() const -> size_t;

private:
    const bool buffered_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferEvent> queue_;
    bool closed_ = false;

    std::mutex subscribers_mutex_;
    std::unordered_map<SubscriptionId, EventCallback> subscribers_;
    SubscriptionId next_subscription_id_ = 1;
};

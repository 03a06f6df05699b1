#include "services/EventChannel.hpp"

#include <vector>

void EventChannel::publish(const TransferEvent& event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        if (buffered_) {
            queue_.push_back(event);
        }
    }
    cv_.notify_all();

    // Copy so that callbacks may unsubscribe without deadlocking
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard lock(subscribers_mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
    }
    for (const auto& callback : callbacks) {
        callback(event);
    }
}

auto EventChannel::poll() -> std::optional<TransferEvent> {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto EventChannel::wait_for(std::chrono::milliseconds timeout) -> std::optional<TransferEvent> {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto EventChannel::subscribe(EventCallback callback) -> SubscriptionId {
    std::lock_guard lock(subscribers_mutex_);
    auto id = next_subscription_id_++;
    subscribers_[id] = std::move(callback);
    return id;
}

void EventChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(subscribers_mutex_);
    subscribers_.erase(id);
}

void EventChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto EventChannel::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto EventChannel::pending() const -> size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

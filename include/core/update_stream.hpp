#pragma once

#include "core/broadcaster.hpp"
#include "core/subscription.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace streamingcore {
namespace core {

/**
 * Lazy, per-consumer sequence of the values a Broadcaster publishes after
 * the stream was created. Values are queued in publish order until the
 * consumer pulls them. Not a replay log: nothing published before
 * construction is ever seen.
 *
 * With the default capacity of 0 the queue is unbounded, so a stream that is
 * never drained grows for as long as its source publishes. A positive
 * capacity keeps only the newest values and counts the rest in dropped().
 */
template <typename T>
class UpdateStream {
public:
    explicit UpdateStream(Broadcaster<T>& source, size_t capacity = 0)
        : channel_(std::make_shared<Channel>()) {
        channel_->capacity = capacity;
        auto channel = channel_;
        subscription_ = source.subscribe(
            [channel](const T& value) {
                {
                    std::lock_guard<std::mutex> lock(channel->mutex);
                    if (channel->finished) {
                        return;
                    }
                    channel->values.push_back(value);
                    if (channel->capacity > 0 && channel->values.size() > channel->capacity) {
                        channel->values.pop_front();
                        channel->dropped++;
                    }
                }
                channel->condition.notify_one();
            },
            [channel]() {
                {
                    std::lock_guard<std::mutex> lock(channel->mutex);
                    channel->finished = true;
                }
                channel->condition.notify_all();
            });
    }

    ~UpdateStream() {
        close();
    }

    // Non-copyable, non-movable
    UpdateStream(const UpdateStream&) = delete;
    UpdateStream& operator=(const UpdateStream&) = delete;
    UpdateStream(UpdateStream&&) = delete;
    UpdateStream& operator=(UpdateStream&&) = delete;

    /**
     * Get the next value (blocks until one arrives)
     * Returns nullopt once the source finished and the queue is drained
     */
    std::optional<T> next() {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->condition.wait(lock, [this] {
            return !channel_->values.empty() || channel_->finished;
        });
        return popLocked();
    }

    /**
     * Get the next value, waiting at most timeout
     */
    template <typename Rep, typename Period>
    std::optional<T> nextFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->condition.wait_for(lock, timeout, [this] {
            return !channel_->values.empty() || channel_->finished;
        });
        return popLocked();
    }

    /**
     * Get the next value without blocking
     */
    std::optional<T> tryNext() {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        return popLocked();
    }

    /**
     * Stop receiving values and drop anything still queued. Wakes blocked
     * readers.
     */
    void close() {
        subscription_.unsubscribe();
        {
            std::lock_guard<std::mutex> lock(channel_->mutex);
            channel_->finished = true;
            channel_->values.clear();
        }
        channel_->condition.notify_all();
    }

    bool isFinished() const {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        return channel_->finished && channel_->values.empty();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        return channel_->values.size();
    }

    /// Values discarded because the queue was full
    size_t dropped() const {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        return channel_->dropped;
    }

    size_t capacity() const { return channel_->capacity; }

private:
    struct Channel {
        mutable std::mutex mutex;
        std::condition_variable condition;
        std::deque<T> values;
        size_t capacity = 0;
        size_t dropped = 0;
        bool finished = false;
    };

    std::optional<T> popLocked() {
        if (channel_->values.empty()) {
            return std::nullopt;
        }
        T value = channel_->values.front();
        channel_->values.pop_front();
        return value;
    }

    std::shared_ptr<Channel> channel_;
    Subscription subscription_;
};

} // namespace core
} // namespace streamingcore

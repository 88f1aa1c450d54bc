#pragma once

#include "core/subscription.hpp"
#include "utils/logging.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace streamingcore {
namespace core {

/**
 * Multi-subscriber fan-out of values of type T.
 *
 * Subscribers only see values published after they subscribed. Delivery to
 * all subscribers of one broadcaster is serialized, so every subscriber sees
 * values in publish order. A subscriber may unsubscribe, or subscribe others,
 * from inside its own callback.
 */
template <typename T>
class Broadcaster {
public:
    using ValueCallback = std::function<void(const T&)>;
    using FinishCallback = std::function<void()>;

    explicit Broadcaster(std::string name = "broadcaster")
        : state_(std::make_shared<State>())
        , name_(std::move(name)) {}

    ~Broadcaster() {
        finish();
    }

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    /**
     * Register a subscriber
     * @param onValue Called for every future value
     * @param onFinish Called once when the broadcaster finishes
     * @return handle that unsubscribes on destruction
     */
    Subscription subscribe(ValueCallback onValue, FinishCallback onFinish = nullptr) {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);

        if (state_->finished) {
            if (onFinish) {
                onFinish();
            }
            return Subscription();
        }

        uint64_t id = state_->nextId++;
        auto subscriber = std::make_shared<Subscriber>();
        subscriber->onValue = std::move(onValue);
        subscriber->onFinish = std::move(onFinish);
        state_->subscribers[id] = subscriber;

        std::weak_ptr<State> weakState = state_;
        return Subscription([weakState, id]() {
            if (auto state = weakState.lock()) {
                std::lock_guard<std::recursive_mutex> guard(state->mutex);
                state->subscribers.erase(id);
            }
        });
    }

    /**
     * Deliver a value to every current subscriber
     */
    void publish(const T& value) {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        if (state_->finished) {
            return;
        }

        auto snapshot = state_->subscribers;
        for (const auto& entry : snapshot) {
            // Skip subscribers removed by an earlier callback in this round
            if (state_->subscribers.find(entry.first) == state_->subscribers.end()) {
                continue;
            }
            if (!entry.second->onValue) {
                continue;
            }
            try {
                entry.second->onValue(value);
            } catch (const std::exception& e) {
                utils::Logger::error(name_ + " subscriber callback error: " + std::string(e.what()));
            }
        }
    }

    /**
     * End the broadcast. Every subscriber's finish callback runs once and
     * all subscriptions are dropped.
     */
    void finish() {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        if (state_->finished) {
            return;
        }
        state_->finished = true;

        auto subscribers = std::move(state_->subscribers);
        state_->subscribers.clear();
        for (const auto& entry : subscribers) {
            if (!entry.second->onFinish) {
                continue;
            }
            try {
                entry.second->onFinish();
            } catch (const std::exception& e) {
                utils::Logger::error(name_ + " finish callback error: " + std::string(e.what()));
            }
        }
    }

    size_t subscriberCount() const {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        return state_->subscribers.size();
    }

    bool isFinished() const {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        return state_->finished;
    }

    const std::string& getName() const { return name_; }

private:
    struct Subscriber {
        ValueCallback onValue;
        FinishCallback onFinish;
    };

    // Shared with Subscription handles so they stay valid past our lifetime
    struct State {
        mutable std::recursive_mutex mutex;
        std::map<uint64_t, std::shared_ptr<Subscriber>> subscribers;
        uint64_t nextId = 1;
        bool finished = false;
    };

    std::shared_ptr<State> state_;
    std::string name_;
};

} // namespace core
} // namespace streamingcore

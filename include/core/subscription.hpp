#pragma once

#include <functional>

namespace streamingcore {
namespace core {

/**
 * Handle returned by every subscribe() call. Unsubscribes when destroyed or
 * when unsubscribe() is called, whichever comes first. Once unsubscribe()
 * returns, the subscribed callback is never invoked again.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void unsubscribe();
    bool isActive() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

} // namespace core
} // namespace streamingcore

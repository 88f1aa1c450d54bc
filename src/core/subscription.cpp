#include "core/subscription.hpp"
#include <utility>

namespace streamingcore {
namespace core {

Subscription::Subscription(std::function<void()> cancel)
    : cancel_(std::move(cancel)) {
}

Subscription::~Subscription() {
    unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : cancel_(std::move(other.cancel_)) {
    other.cancel_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        cancel_ = std::move(other.cancel_);
        other.cancel_ = nullptr;
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (cancel_) {
        auto cancel = std::move(cancel_);
        cancel_ = nullptr;
        cancel();
    }
}

} // namespace core
} // namespace streamingcore

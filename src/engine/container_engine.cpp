/**
 * @file container_engine.cpp
 * @brief Event subscription channels shared by all engine bindings
 *
 * @date 2025
 */

#include "eggshell/engine/container_engine.hpp"

namespace eggshell {
namespace engine {

SubscriptionSignal EventSubscription::Next(const utils::CancellationToken& token,
                                           ContainerEvent& event, std::string& error) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (!events_.empty()) {
            event = std::move(events_.front());
            events_.pop_front();
            return SubscriptionSignal::EVENT;
        }
        if (!errors_.empty()) {
            error = std::move(errors_.front());
            errors_.pop_front();
            return SubscriptionSignal::ERROR;
        }
        if (token.IsCancelled()) {
            return SubscriptionSignal::CANCELLED;
        }
        if (cancelled_) {
            error = "event subscription was cancelled";
            return SubscriptionSignal::ERROR;
        }

        // Token state is not observable through the condition variable
        cv_.wait_for(lock, utils::kCancellationPollInterval);
    }
}

void EventSubscription::Cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool EventSubscription::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void EventSubscription::PublishEvent(ContainerEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void EventSubscription::PublishError(std::string error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        errors_.push_back(std::move(error));
    }
    cv_.notify_all();
}

} // namespace engine
} // namespace eggshell

/**
 * @file cancellation.cpp
 * @brief Implementation of the shared cancellation token
 *
 * @date 2025
 */

#include "eggshell/utils/cancellation.hpp"

namespace eggshell {
namespace utils {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

CancellationToken CancellationToken::WithTimeout(std::chrono::steady_clock::duration timeout) {
    CancellationToken token;
    token.state_->deadline = std::chrono::steady_clock::now() + timeout;
    return token;
}

void CancellationToken::Cancel() noexcept {
    state_->cancelled.store(true);
}

bool CancellationToken::IsCancelled() const noexcept {
    if (state_->cancelled.load()) {
        return true;
    }
    return state_->deadline.has_value() &&
           std::chrono::steady_clock::now() >= *state_->deadline;
}

std::optional<std::chrono::steady_clock::time_point> CancellationToken::Deadline() const {
    return state_->deadline;
}

} // namespace utils
} // namespace eggshell

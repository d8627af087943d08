/**
 * @file cancellation.hpp
 * @brief Caller-owned cancellation signal for blocking sandbox operations
 *
 * A CancellationToken is a cheap, copyable handle onto shared state. Copies
 * observe the same flag, so a caller can keep one copy and hand another to
 * Executor::Execute, then call Cancel() from any thread. A token may also
 * carry a deadline, after which it reports itself as cancelled.
 *
 * Blocking waits inside eggshell poll the token every kCancellationPollInterval.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace eggshell {
namespace utils {

/// Interval at which blocking waits re-check their cancellation token
constexpr std::chrono::milliseconds kCancellationPollInterval{50};

/**
 * @class CancellationToken
 * @brief Shared, thread-safe cancellation flag with optional deadline
 *
 * **Usage Example**:
 * @code
 * auto token = CancellationToken::WithTimeout(std::chrono::minutes(2));
 * std::thread watchdog([token]() mutable { WaitForCtrlC(); token.Cancel(); });
 * executor.Execute(token);
 * @endcode
 */
class CancellationToken {
public:
    /**
     * @brief Create a token that is cancelled only through Cancel()
     */
    CancellationToken();

    /**
     * @brief Create a token that also cancels itself after @p timeout
     * @param timeout Time from now until the token reports cancellation
     */
    static CancellationToken WithTimeout(std::chrono::steady_clock::duration timeout);

    /**
     * @brief Signal cancellation to every copy of this token
     */
    void Cancel() noexcept;

    /**
     * @brief Check whether Cancel() was called or the deadline has passed
     */
    bool IsCancelled() const noexcept;

    /**
     * @brief Deadline of this token, if it has one
     */
    std::optional<std::chrono::steady_clock::time_point> Deadline() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

    std::shared_ptr<State> state_;
};

} // namespace utils
} // namespace eggshell

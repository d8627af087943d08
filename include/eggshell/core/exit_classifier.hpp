/**
 * @file exit_classifier.hpp
 * @brief Decides how a run ended from the container's lifecycle events
 *
 * **Resolution**:
 * ```
 * die event, exitCode 137  → TimeoutError
 * die event, other code    → ExitStatus (completion, even when non-zero)
 * die event, no exitCode   → EngineError
 * error channel            → EngineError
 * token fired              → CancelledError
 * ```
 * The subscription is cancelled as soon as one of them is observed. The
 * first three rows all mean the container has exited, which exit_observed()
 * reports even when Await throws.
 *
 * @date 2025
 */

#pragma once

#include "eggshell/engine/container_engine.hpp"

#include <string>

namespace eggshell {
namespace core {

/// Exit code of a process killed by SIGKILL, which is how a stop timeout ends a run
constexpr int kTimeoutExitCode = 128 + 9;

/**
 * @struct ExitStatus
 * @brief A run that completed on its own
 */
struct ExitStatus {
    int exit_code{0};
};

/**
 * @class ExitClassifier
 * @brief Waits for the terminal signal of one run
 */
class ExitClassifier {
public:
    ExitClassifier(std::string command, std::string container_id, std::string image_tag);

    /**
     * @brief Block until the run resolves
     * @param subscription Subscription filtered to this run's die event
     * @param token Caller's cancellation token
     *
     * @throws TimeoutError, EngineError or CancelledError
     */
    ExitStatus Await(engine::EventSubscription& subscription,
                     const utils::CancellationToken& token);

    /// True once a die event arrived, whatever its exit code
    bool exit_observed() const { return exit_observed_; }

    /// Whether @p exit_code means the container was killed at its deadline
    static bool IsTimeoutExit(int exit_code) { return exit_code == kTimeoutExitCode; }

private:
    std::string command_;
    std::string container_id_;
    std::string image_tag_;
    bool exit_observed_{false};

    int ParseExitCode(const engine::ContainerEvent& event) const;
};

} // namespace core
} // namespace eggshell

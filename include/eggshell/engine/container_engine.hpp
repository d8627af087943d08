/**
 * @file container_engine.hpp
 * @brief Abstract container engine used by the executor
 *
 * Covers exactly the engine operations one sandboxed run needs: image build
 * and removal, container create/start/stop/remove, a following log stream
 * and a filtered lifecycle-event subscription. Every blocking call takes a
 * CancellationToken and throws core::CancelledError when it fires.
 *
 * **Run Sequence**:
 * ```
 * BuildImage → CreateContainer → StartContainer → OpenLogStream
 *            → StopContainer → SubscribeEvents → (die) → RemoveContainer
 *            → RemoveImage
 * ```
 *
 * @date 2025
 */

#pragma once

#include "eggshell/utils/cancellation.hpp"
#include "eggshell/utils/subprocess.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace eggshell {
namespace engine {

using utils::OutputStream;

/**
 * @struct ContainerSpec
 * @brief Everything needed to create one container
 */
struct ContainerSpec {
    std::string name;                          ///< Container name (also its id for later calls)
    std::string image;                         ///< Image tag to run
    std::string runtime;                       ///< OCI runtime; empty selects the engine default
    std::string network_mode;                  ///< Engine network mode identifier
    std::vector<std::string> security_opts;    ///< e.g. "seccomp=<profile name>"
    std::map<std::string, std::string> context_files;  ///< Documents referenced by security_opts
    std::chrono::seconds stop_timeout{-1};     ///< Grace period for stop; -1 waits forever
    std::vector<std::string> command;          ///< Entrypoint argv
    bool attach_stdout{true};                  ///< Capture standard output
    bool attach_stderr{true};                  ///< Capture standard error
};

/**
 * @struct LogChunk
 * @brief One demultiplexed piece of container output
 */
struct LogChunk {
    OutputStream stream{OutputStream::STDOUT};
    std::string data;
};

/**
 * @class LogStream
 * @brief A following stream of a container's output
 */
class LogStream {
public:
    virtual ~LogStream() = default;

    /**
     * @brief Block until the next chunk is available
     * @param chunk Receives the chunk
     * @return false once the container's output has ended or Close() was called
     *
     * @throws eggshell::core::EngineError if the stream fails
     */
    virtual bool Next(LogChunk& chunk) = 0;

    /// Abort the stream; a blocked Next() returns false. Safe from any thread.
    virtual void Close() noexcept = 0;
};

/**
 * @struct EventFilter
 * @brief Selection of lifecycle events to subscribe to
 */
struct EventFilter {
    std::chrono::system_clock::time_point since;  ///< Replay events from this instant
    std::string container;                        ///< Container name
    std::string image;                            ///< Image tag
    std::string event;                            ///< Event action, e.g. "die"
};

/**
 * @struct ContainerEvent
 * @brief One lifecycle event as reported by the engine
 */
struct ContainerEvent {
    std::string action;                              ///< e.g. "die", "start"
    std::string actor_id;                            ///< Container id
    std::map<std::string, std::string> attributes;   ///< Actor attributes (exitCode, image, name...)
    std::chrono::system_clock::time_point time;      ///< When it happened
};

/// What a subscription produced
enum class SubscriptionSignal {
    EVENT,      ///< An event was delivered
    ERROR,      ///< The error channel produced an error
    CANCELLED   ///< The caller's token fired
};

/**
 * @class EventSubscription
 * @brief Event channel and error channel of one engine event subscription
 *
 * Engine bindings push into the two channels with PublishEvent() and
 * PublishError(); consumers race them with Next(). When both channels hold
 * something, the event is delivered first.
 */
class EventSubscription {
public:
    virtual ~EventSubscription() = default;

    /**
     * @brief Wait for the next event, error or cancellation
     * @param token Caller's cancellation token
     * @param event Receives the event on SubscriptionSignal::EVENT
     * @param error Receives the error text on SubscriptionSignal::ERROR
     */
    SubscriptionSignal Next(const utils::CancellationToken& token,
                            ContainerEvent& event, std::string& error);

    /// Stop delivering; releases engine-side resources. Idempotent.
    virtual void Cancel() noexcept;

    bool cancelled() const;

protected:
    void PublishEvent(ContainerEvent event);
    void PublishError(std::string error);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ContainerEvent> events_;
    std::deque<std::string> errors_;
    bool cancelled_{false};
};

/**
 * @class ContainerEngine
 * @brief Operations the executor needs from a container engine
 *
 * All methods throw core::EngineError with the engine's diagnostic text on
 * failure and core::CancelledError when @p token fires.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /**
     * @brief Build an image from a tar build context
     * @param context Tar archive, read to the end
     * @param tag Tag for the resulting image
     */
    virtual void BuildImage(std::istream& context, const std::string& tag,
                            const utils::CancellationToken& token) = 0;

    virtual void RemoveImage(const std::string& tag, bool force,
                             const utils::CancellationToken& token) = 0;

    /**
     * @brief Create (but do not start) a container
     * @return Id to use for subsequent calls
     */
    virtual std::string CreateContainer(const ContainerSpec& spec,
                                        const utils::CancellationToken& token) = 0;

    virtual void StartContainer(const std::string& id,
                                const utils::CancellationToken& token) = 0;

    /**
     * @brief Request a stop; blocks until the container has stopped
     * @param grace Override of the container's stop timeout
     *
     * A container that is already stopped or gone is not an error.
     */
    virtual void StopContainer(const std::string& id,
                               std::optional<std::chrono::seconds> grace,
                               const utils::CancellationToken& token) = 0;

    virtual void RemoveContainer(const std::string& id, bool force,
                                 const utils::CancellationToken& token) = 0;

    /// Follow stdout and stderr of a started container until it exits
    virtual std::unique_ptr<LogStream> OpenLogStream(const std::string& id,
                                                     const utils::CancellationToken& token) = 0;

    virtual std::unique_ptr<EventSubscription> SubscribeEvents(
        const EventFilter& filter, const utils::CancellationToken& token) = 0;
};

} // namespace engine
} // namespace eggshell

/**
 * @file fake_engine.hpp
 * @brief Scripted in-process container engine for executor tests
 *
 * @date 2025
 */

#pragma once

#include <eggshell/core/errors.hpp>
#include <eggshell/engine/container_engine.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace eggshell_test {

using eggshell::engine::ContainerEvent;
using eggshell::engine::LogChunk;
using eggshell::utils::CancellationToken;

inline ContainerEvent DieEvent(const std::string& exit_code) {
    ContainerEvent event;
    event.action = "die";
    event.actor_id = "container";
    event.attributes["exitCode"] = exit_code;
    event.time = std::chrono::system_clock::now();
    return event;
}

/// Subscription whose channels the test fills directly
class ScriptedSubscription : public eggshell::engine::EventSubscription {
public:
    explicit ScriptedSubscription(std::atomic<int>* cancels = nullptr) : cancels_(cancels) {}

    using EventSubscription::PublishEvent;
    using EventSubscription::PublishError;

    void Cancel() noexcept override {
        if (cancels_) {
            ++*cancels_;
        }
        EventSubscription::Cancel();
    }

private:
    std::atomic<int>* cancels_;
};

/// Replays a fixed list of chunks
class FakeLogStream : public eggshell::engine::LogStream {
public:
    explicit FakeLogStream(std::vector<LogChunk> chunks,
                           std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : chunks_(std::move(chunks)), delay_(delay) {}

    bool Next(LogChunk& chunk) override {
        if (delay_.count() > 0 && next_ < chunks_.size()) {
            std::this_thread::sleep_for(delay_);
        }
        if (closed_ || next_ >= chunks_.size()) {
            return false;
        }
        chunk = chunks_[next_++];
        return true;
    }

    void Close() noexcept override { closed_ = true; }

private:
    std::vector<LogChunk> chunks_;
    std::chrono::milliseconds delay_;
    std::size_t next_{0};
    std::atomic<bool> closed_{false};
};

/// Blocks in Next() until closed
class BlockingLogStream : public eggshell::engine::LogStream {
public:
    bool Next(LogChunk&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return closed_; });
        return false;
    }

    void Close() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_{false};
};

/**
 * Records every call by verb ("build", "rmi", "create", "start", "stop",
 * "rm", "logs", "subscribe") and fails the ones given an error text.
 */
class FakeContainerEngine : public eggshell::engine::ContainerEngine {
public:
    // Script
    std::optional<std::string> build_error;
    std::optional<std::string> create_error;
    std::optional<std::string> start_error;
    std::optional<std::string> stop_error;
    std::optional<std::string> logs_error;
    std::optional<std::string> subscribe_error;
    std::vector<LogChunk> log_chunks;
    /// Pause before each chunk, so output can still be arriving at exit
    std::chrono::milliseconds chunk_delay{0};
    std::optional<std::string> exit_code{"0"};  ///< nullopt publishes no event
    std::optional<std::string> event_error;

    // Observations
    std::vector<std::string> calls;
    std::string built_context;
    std::string built_tag;
    eggshell::engine::ContainerSpec last_spec;
    eggshell::engine::EventFilter last_filter;
    std::vector<std::optional<std::chrono::seconds>> stop_graces;
    std::atomic<int> subscription_cancels{0};

    int Count(const std::string& verb) const {
        int n = 0;
        for (const auto& call : calls) {
            n += call == verb ? 1 : 0;
        }
        return n;
    }

    void BuildImage(std::istream& context, const std::string& tag,
                    const CancellationToken&) override {
        calls.push_back("build");
        built_context.assign(std::istreambuf_iterator<char>(context),
                             std::istreambuf_iterator<char>());
        built_tag = tag;
        FailIf(build_error);
    }

    void RemoveImage(const std::string&, bool, const CancellationToken&) override {
        calls.push_back("rmi");
    }

    std::string CreateContainer(const eggshell::engine::ContainerSpec& spec,
                                const CancellationToken&) override {
        calls.push_back("create");
        last_spec = spec;
        FailIf(create_error);
        return spec.name;
    }

    void StartContainer(const std::string&, const CancellationToken&) override {
        calls.push_back("start");
        FailIf(start_error);
    }

    void StopContainer(const std::string&, std::optional<std::chrono::seconds> grace,
                       const CancellationToken& token) override {
        calls.push_back("stop");
        stop_graces.push_back(grace);
        if (token.IsCancelled()) {
            throw eggshell::core::CancelledError();
        }
        FailIf(stop_error);
    }

    void RemoveContainer(const std::string&, bool, const CancellationToken&) override {
        calls.push_back("rm");
    }

    std::unique_ptr<eggshell::engine::LogStream> OpenLogStream(
        const std::string&, const CancellationToken&) override {
        calls.push_back("logs");
        FailIf(logs_error);
        return std::make_unique<FakeLogStream>(log_chunks, chunk_delay);
    }

    std::unique_ptr<eggshell::engine::EventSubscription> SubscribeEvents(
        const eggshell::engine::EventFilter& filter, const CancellationToken&) override {
        calls.push_back("subscribe");
        last_filter = filter;
        FailIf(subscribe_error);

        auto subscription = std::make_unique<ScriptedSubscription>(&subscription_cancels);
        if (exit_code) {
            subscription->PublishEvent(DieEvent(*exit_code));
        }
        if (event_error) {
            subscription->PublishError(*event_error);
        }
        return subscription;
    }

private:
    static void FailIf(const std::optional<std::string>& error) {
        if (error) {
            throw eggshell::core::EngineError(*error);
        }
    }
};

} // namespace eggshell_test

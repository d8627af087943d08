/**
 * @file log_demuxer.hpp
 * @brief Routes container output to the caller's sinks on a background thread
 *
 * @date 2025
 */

#pragma once

#include "eggshell/engine/container_engine.hpp"
#include "eggshell/utils/output_sink.hpp"

#include <exception>
#include <memory>
#include <thread>

namespace eggshell {
namespace core {

/**
 * @class LogDemuxer
 * @brief Sends each log chunk to the sink matching its stream
 */
class LogDemuxer {
public:
    LogDemuxer(std::shared_ptr<utils::OutputSink> stdout_sink,
               std::shared_ptr<utils::OutputSink> stderr_sink);

    /// Write one chunk to its sink
    void Route(const engine::LogChunk& chunk);

    /// Drain @p stream until it ends; returns the number of bytes routed
    std::size_t Drain(engine::LogStream& stream);

private:
    std::shared_ptr<utils::OutputSink> stdout_sink_;
    std::shared_ptr<utils::OutputSink> stderr_sink_;
};

/**
 * @class LogPump
 * @brief Owns the log stream and the thread draining it
 *
 * The thread starts with Start(). Join() waits for the stream to end and
 * rethrows anything the drain raised; Abort() closes the stream first so the
 * wait is short. The destructor aborts a pump that was neither joined nor
 * aborted, and never throws.
 */
class LogPump {
public:
    LogPump() = default;
    ~LogPump();

    LogPump(const LogPump&) = delete;
    LogPump& operator=(const LogPump&) = delete;

    /**
     * @brief Start draining @p stream into @p demuxer
     */
    void Start(std::unique_ptr<engine::LogStream> stream, LogDemuxer demuxer);

    /**
     * @brief Wait for the output to be fully routed
     * @throws whatever the drain thread raised (EngineError, IoError)
     */
    void Join();

    /// Close the stream and wait for the thread; errors are logged only
    void Abort() noexcept;

    bool running() const { return thread_.joinable(); }

    std::size_t bytes_routed() const { return bytes_routed_; }

private:
    std::unique_ptr<engine::LogStream> stream_;
    std::thread thread_;
    std::exception_ptr error_;
    std::size_t bytes_routed_{0};
};

} // namespace core
} // namespace eggshell

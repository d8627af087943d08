/**
 * @file output_sink.hpp
 * @brief Destinations for a container's standard output and standard error
 *
 * The log demultiplexer writes every chunk of container output to one of two
 * sinks. When a caller routes both streams to the same destination, the pair
 * is wrapped in a single SynchronizedSink so that one chunk is written and
 * flushed completely before the next one starts.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace eggshell {
namespace utils {

/**
 * @class OutputSink
 * @brief Abstract byte destination
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /**
     * @brief Write a chunk of output
     * @throws eggshell::core::IoError if the destination fails
     */
    virtual void Write(std::string_view data) = 0;

    /// Push buffered bytes to the underlying destination
    virtual void Flush() {}
};

/**
 * @class NullSink
 * @brief Discards everything written to it
 */
class NullSink : public OutputSink {
public:
    void Write(std::string_view) override {}
};

/**
 * @class OstreamSink
 * @brief Writes to a std::ostream owned by the caller, flushing each chunk
 *
 * The stream must outlive the sink.
 */
class OstreamSink : public OutputSink {
public:
    explicit OstreamSink(std::ostream& out) : out_(out) {}

    void Write(std::string_view data) override;
    void Flush() override;

private:
    std::ostream& out_;
};

/**
 * @class StringSink
 * @brief Collects output into memory; safe to read while being written
 */
class StringSink : public OutputSink {
public:
    void Write(std::string_view data) override;

    /// Copy of everything written so far
    std::string str() const;

private:
    mutable std::mutex mutex_;
    std::string buffer_;
};

/**
 * @class SynchronizedSink
 * @brief Serializes writers of a shared destination
 *
 * Each Write holds the lock across the inner write and its flush, so a
 * chunk from one writer never interleaves with a chunk from another.
 */
class SynchronizedSink : public OutputSink {
public:
    explicit SynchronizedSink(std::shared_ptr<OutputSink> inner);

    void Write(std::string_view data) override;
    void Flush() override;

    const std::shared_ptr<OutputSink>& inner() const { return inner_; }

private:
    std::mutex mutex_;
    std::shared_ptr<OutputSink> inner_;
};

/**
 * @brief Resolve the caller's stdout/stderr destinations for one run
 *
 * Unset destinations become NullSinks. If both point at the same sink, both
 * results share one SynchronizedSink around it.
 *
 * @return {stdout sink, stderr sink}, never null
 */
std::pair<std::shared_ptr<OutputSink>, std::shared_ptr<OutputSink>>
MakeOutputSinks(std::shared_ptr<OutputSink> stdout_sink,
                std::shared_ptr<OutputSink> stderr_sink);

} // namespace utils
} // namespace eggshell

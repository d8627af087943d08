/**
 * @file output_sink.cpp
 * @brief Output sink implementations
 *
 * @date 2025
 */

#include "eggshell/utils/output_sink.hpp"
#include "eggshell/core/errors.hpp"

namespace eggshell {
namespace utils {

void OstreamSink::Write(std::string_view data) {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    Flush();
}

void OstreamSink::Flush() {
    out_.flush();
    if (!out_) {
        throw core::IoError("failed to write container output");
    }
}

void StringSink::Write(std::string_view data) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.append(data.data(), data.size());
}

std::string StringSink::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

SynchronizedSink::SynchronizedSink(std::shared_ptr<OutputSink> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        inner_ = std::make_shared<NullSink>();
    }
}

void SynchronizedSink::Write(std::string_view data) {
    std::lock_guard<std::mutex> lock(mutex_);
    inner_->Write(data);
    inner_->Flush();
}

void SynchronizedSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    inner_->Flush();
}

std::pair<std::shared_ptr<OutputSink>, std::shared_ptr<OutputSink>>
MakeOutputSinks(std::shared_ptr<OutputSink> stdout_sink,
                std::shared_ptr<OutputSink> stderr_sink) {
    if (!stdout_sink) {
        stdout_sink = std::make_shared<NullSink>();
    }
    if (!stderr_sink) {
        stderr_sink = std::make_shared<NullSink>();
    }

    if (stdout_sink == stderr_sink) {
        auto shared = std::make_shared<SynchronizedSink>(stdout_sink);
        return {shared, shared};
    }
    return {std::move(stdout_sink), std::move(stderr_sink)};
}

} // namespace utils
} // namespace eggshell

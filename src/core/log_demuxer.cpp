/**
 * @file log_demuxer.cpp
 * @brief Implementation of the log demultiplexer and pump
 *
 * @date 2025
 */

#include "eggshell/core/log_demuxer.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace eggshell {
namespace core {

LogDemuxer::LogDemuxer(std::shared_ptr<utils::OutputSink> stdout_sink,
                       std::shared_ptr<utils::OutputSink> stderr_sink)
    : stdout_sink_(std::move(stdout_sink)),
      stderr_sink_(std::move(stderr_sink)) {
    if (!stdout_sink_) {
        stdout_sink_ = std::make_shared<utils::NullSink>();
    }
    if (!stderr_sink_) {
        stderr_sink_ = std::make_shared<utils::NullSink>();
    }
}

void LogDemuxer::Route(const engine::LogChunk& chunk) {
    if (chunk.stream == utils::OutputStream::STDERR) {
        stderr_sink_->Write(chunk.data);
    } else {
        stdout_sink_->Write(chunk.data);
    }
}

std::size_t LogDemuxer::Drain(engine::LogStream& stream) {
    std::size_t total = 0;
    engine::LogChunk chunk;
    while (stream.Next(chunk)) {
        Route(chunk);
        total += chunk.data.size();
    }
    stdout_sink_->Flush();
    stderr_sink_->Flush();
    return total;
}

LogPump::~LogPump() {
    Abort();
}

void LogPump::Start(std::unique_ptr<engine::LogStream> stream, LogDemuxer demuxer) {
    if (thread_.joinable()) {
        throw std::logic_error("log pump already started");
    }
    stream_ = std::move(stream);
    error_ = nullptr;

    engine::LogStream* source = stream_.get();
    thread_ = std::thread([this, source, demuxer = std::move(demuxer)]() mutable {
        try {
            bytes_routed_ = demuxer.Drain(*source);
        } catch (...) {
            error_ = std::current_exception();
        }
    });
}

void LogPump::Join() {
    if (thread_.joinable()) {
        thread_.join();
    }
    stream_.reset();

    if (error_) {
        auto error = error_;
        error_ = nullptr;
        std::rethrow_exception(error);
    }
}

void LogPump::Abort() noexcept {
    if (stream_) {
        stream_->Close();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    stream_.reset();

    if (error_) {
        try {
            std::rethrow_exception(error_);
        } catch (const std::exception& e) {
            spdlog::warn("Log streaming stopped with error: {}", e.what());
        } catch (...) {
            spdlog::warn("Log streaming stopped with unknown error");
        }
        error_ = nullptr;
    }
}

} // namespace core
} // namespace eggshell

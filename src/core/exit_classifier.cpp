/**
 * @file exit_classifier.cpp
 * @brief Implementation of run outcome classification
 *
 * @date 2025
 */

#include "eggshell/core/exit_classifier.hpp"
#include "eggshell/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace eggshell {
namespace core {

namespace {

constexpr const char* kExitCodeAttribute = "exitCode";

} // anonymous namespace

ExitClassifier::ExitClassifier(std::string command, std::string container_id,
                               std::string image_tag)
    : command_(std::move(command)),
      container_id_(std::move(container_id)),
      image_tag_(std::move(image_tag)) {}

ExitStatus ExitClassifier::Await(engine::EventSubscription& subscription,
                                 const utils::CancellationToken& token) {
    engine::ContainerEvent event;
    std::string error;

    switch (subscription.Next(token, event, error)) {
        case engine::SubscriptionSignal::EVENT: {
            exit_observed_ = true;
            subscription.Cancel();
            int code = ParseExitCode(event);
            spdlog::info("Container {} exited with code {}", container_id_, code);
            if (IsTimeoutExit(code)) {
                throw TimeoutError(command_, container_id_, image_tag_);
            }
            return ExitStatus{code};
        }
        case engine::SubscriptionSignal::ERROR:
            subscription.Cancel();
            throw EngineError(error);
        case engine::SubscriptionSignal::CANCELLED:
            subscription.Cancel();
            throw CancelledError();
    }

    subscription.Cancel();
    throw EngineError("unexpected subscription signal");
}

int ExitClassifier::ParseExitCode(const engine::ContainerEvent& event) const {
    auto it = event.attributes.find(kExitCodeAttribute);
    if (it == event.attributes.end()) {
        throw EngineError("\"" + event.action + "\" event for container " + container_id_ +
                          " carries no exit code");
    }

    try {
        std::size_t consumed = 0;
        int code = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
        return code;
    } catch (const std::logic_error&) {
        throw EngineError("unparseable exit code \"" + it->second + "\" for container " +
                          container_id_);
    }
}

} // namespace core
} // namespace eggshell

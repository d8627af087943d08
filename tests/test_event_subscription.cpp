#include <gtest/gtest.h>
#include <eggshell/engine/container_engine.hpp>

#include "fake_engine.hpp"

#include <thread>

using namespace eggshell::engine;
using eggshell::utils::CancellationToken;
using eggshell_test::ScriptedSubscription;

TEST(EventSubscription, DeliversPublishedEvent) {
    ScriptedSubscription subscription;
    subscription.PublishEvent(eggshell_test::DieEvent("0"));

    ContainerEvent event;
    std::string error;
    EXPECT_EQ(subscription.Next(CancellationToken(), event, error), SubscriptionSignal::EVENT);
    EXPECT_EQ(event.action, "die");
    EXPECT_EQ(event.attributes.at("exitCode"), "0");
}

TEST(EventSubscription, EventsWinOverErrors) {
    ScriptedSubscription subscription;
    subscription.PublishError("daemon went away");
    subscription.PublishEvent(eggshell_test::DieEvent("1"));

    ContainerEvent event;
    std::string error;
    EXPECT_EQ(subscription.Next(CancellationToken(), event, error), SubscriptionSignal::EVENT);
    EXPECT_EQ(subscription.Next(CancellationToken(), event, error), SubscriptionSignal::ERROR);
    EXPECT_EQ(error, "daemon went away");
}

TEST(EventSubscription, WakesOnPublishFromAnotherThread) {
    ScriptedSubscription subscription;
    std::thread publisher([&subscription]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        subscription.PublishEvent(eggshell_test::DieEvent("0"));
    });

    ContainerEvent event;
    std::string error;
    EXPECT_EQ(subscription.Next(CancellationToken(), event, error), SubscriptionSignal::EVENT);
    publisher.join();
}

TEST(EventSubscription, ObservesCancelledToken) {
    ScriptedSubscription subscription;
    auto token = CancellationToken::WithTimeout(std::chrono::milliseconds(30));

    ContainerEvent event;
    std::string error;
    EXPECT_EQ(subscription.Next(token, event, error), SubscriptionSignal::CANCELLED);
}

TEST(EventSubscription, CancelDropsLaterPublications) {
    ScriptedSubscription subscription;
    subscription.Cancel();
    EXPECT_TRUE(subscription.cancelled());
    subscription.PublishEvent(eggshell_test::DieEvent("0"));

    ContainerEvent event;
    std::string error;
    EXPECT_EQ(subscription.Next(CancellationToken(), event, error), SubscriptionSignal::ERROR);
}

#include <chrono>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "session/event_hub.hpp"

namespace {

using turnstile::session::EventHub;
using turnstile::session::Mailbox;
using turnstile::session::OutboundItem;
using turnstile::session::OutboundKind;

constexpr std::chrono::milliseconds kShort(10);

std::shared_ptr<const std::string> payload(const std::string& text) {
    return std::make_shared<const std::string>(text);
}

TEST(EventHubTest, PublishReachesEverySubscriberInOrder) {
    EventHub hub;
    auto first = hub.subscribe(8);
    auto second = hub.subscribe(8);
    EXPECT_EQ(hub.subscriber_count(), 2u);

    hub.publish(1, payload("one"));
    hub.publish(2, payload("two"));

    for (auto* subscription : {first.get(), second.get()}) {
        auto a = subscription->mailbox().pop(kShort);
        auto b = subscription->mailbox().pop(kShort);
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        EXPECT_EQ(a->rev, 1u);
        EXPECT_EQ(*a->payload, "one");
        EXPECT_EQ(b->rev, 2u);
        EXPECT_FALSE(subscription->mailbox().pop(kShort).has_value());
    }
}

TEST(EventHubTest, SubscribersShareOnePayload) {
    EventHub hub;
    auto first = hub.subscribe(4);
    auto second = hub.subscribe(4);
    auto shared = payload("shared");
    hub.publish(1, shared);

    auto a = first->mailbox().pop(kShort);
    auto b = second->mailbox().pop(kShort);
    EXPECT_EQ(a->payload.get(), shared.get());
    EXPECT_EQ(b->payload.get(), shared.get());
}

TEST(EventHubTest, DestroyingSubscriptionUnregisters) {
    EventHub hub;
    {
        auto subscription = hub.subscribe(4);
        EXPECT_EQ(hub.subscriber_count(), 1u);
    }
    EXPECT_EQ(hub.subscriber_count(), 0u);
    hub.publish(1, payload("nobody"));
}

TEST(EventHubTest, SubscriptionMayOutliveHub) {
    std::unique_ptr<turnstile::session::Subscription> subscription;
    {
        EventHub hub;
        subscription = hub.subscribe(4);
    }
    EXPECT_FALSE(subscription->mailbox().closed());
    subscription.reset();
}

TEST(MailboxTest, OverflowDropsBroadcastsAndLeavesOneResyncMarker) {
    Mailbox mailbox(2);
    OutboundItem direct;
    direct.kind = OutboundKind::Direct;
    direct.payload = payload("ack");
    mailbox.push(direct);

    mailbox.offer_broadcast(1, payload("one"));
    mailbox.offer_broadcast(2, payload("two"));
    mailbox.offer_broadcast(3, payload("three"));
    mailbox.offer_broadcast(4, payload("four"));

    EXPECT_EQ(mailbox.lag_count(), 1u);

    auto first = mailbox.pop(kShort);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, OutboundKind::Direct);

    auto marker = mailbox.pop(kShort);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->kind, OutboundKind::Resync);

    auto after = mailbox.pop(kShort);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->kind, OutboundKind::Broadcast);
    EXPECT_EQ(after->rev, 4u);
    EXPECT_FALSE(mailbox.pop(kShort).has_value());
}

TEST(MailboxTest, DirectItemsAreNeverDropped) {
    Mailbox mailbox(1);
    for (int i = 0; i < 5; ++i) {
        OutboundItem direct;
        direct.kind = OutboundKind::Direct;
        direct.payload = payload("reply");
        mailbox.push(direct);
    }
    mailbox.offer_broadcast(1, payload("one"));
    EXPECT_EQ(mailbox.pending(), 6u);
    EXPECT_EQ(mailbox.lag_count(), 0u);
}

TEST(MailboxTest, CloseWakesWaiterAndRejectsNewItems) {
    Mailbox mailbox(4);
    mailbox.close();
    EXPECT_TRUE(mailbox.closed());
    mailbox.offer_broadcast(1, payload("late"));
    EXPECT_FALSE(mailbox.pop(std::chrono::milliseconds(1000)).has_value());
}

TEST(MailboxTest, UnreadDirectBacklogOverflowsAndCloses) {
    Mailbox mailbox(4, 3);
    for (int i = 0; i < 3; ++i) {
        OutboundItem direct;
        direct.kind = OutboundKind::Direct;
        direct.payload = payload("reply");
        mailbox.push(direct);
    }
    EXPECT_FALSE(mailbox.overflowed());
    EXPECT_EQ(mailbox.pending(), 3u);

    OutboundItem one_more;
    one_more.kind = OutboundKind::Direct;
    one_more.payload = payload("reply");
    mailbox.push(one_more);

    EXPECT_TRUE(mailbox.overflowed());
    EXPECT_TRUE(mailbox.closed());
    EXPECT_EQ(mailbox.pending(), 0u);
    mailbox.offer_broadcast(1, payload("late"));
    EXPECT_FALSE(mailbox.try_pop().has_value());
}

TEST(MailboxTest, ReadingDirectItemsFreesBacklog) {
    Mailbox mailbox(4, 2);
    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 2; ++i) {
            OutboundItem direct;
            direct.kind = OutboundKind::Direct;
            direct.payload = payload("reply");
            mailbox.push(direct);
        }
        ASSERT_TRUE(mailbox.try_pop().has_value());
        ASSERT_TRUE(mailbox.try_pop().has_value());
    }
    EXPECT_FALSE(mailbox.overflowed());
    EXPECT_FALSE(mailbox.try_pop().has_value());
}

TEST(MailboxTest, NotifierRunsForEveryQueuedItem) {
    Mailbox mailbox(1);
    int notified = 0;
    mailbox.set_notifier([&notified] { ++notified; });

    OutboundItem direct;
    direct.kind = OutboundKind::Direct;
    direct.payload = payload("reply");
    mailbox.push(direct);
    mailbox.offer_broadcast(1, payload("one"));
    mailbox.offer_broadcast(2, payload("two"));  // collapses into a resync marker
    EXPECT_EQ(notified, 3);

    mailbox.close();
    mailbox.offer_broadcast(3, payload("late"));
    EXPECT_EQ(notified, 3);
}

}  // namespace

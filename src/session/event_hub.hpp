#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "protocol/task_contract.hpp"

namespace turnstile::session {

enum class OutboundKind {
    Broadcast,  // revisioned event, droppable on overflow
    Direct,     // reply to this connection only, never dropped
    Handshake,  // hello received; the consumer performs the resync
    Resync      // broadcasts were dropped; the consumer sends app_changed
};

struct OutboundItem {
    OutboundKind kind = OutboundKind::Direct;
    protocol::Revision rev = 0;
    std::shared_ptr<const std::string> payload;
    std::optional<protocol::Revision> last_seen_rev;
    bool close_after = false;
};

// Per-subscriber queue. At most `capacity` broadcasts are pending; the next
// one drops all of them and leaves a single Resync marker in their place.
// Direct items are never dropped; past `direct_capacity` of them the
// mailbox overflows and closes, since the consumer has stopped reading.
class Mailbox {
public:
    static constexpr std::size_t kDefaultDirectCapacity = 1024;

    explicit Mailbox(std::size_t capacity,
                     std::size_t direct_capacity = kDefaultDirectCapacity);

    // Called, with the mailbox lock held, after every item that is queued.
    void set_notifier(std::function<void()> notifier);

    void offer_broadcast(protocol::Revision rev, std::shared_ptr<const std::string> payload);
    void push(OutboundItem item);
    std::optional<OutboundItem> pop(std::chrono::milliseconds timeout);
    std::optional<OutboundItem> try_pop();
    void close();

    bool closed() const;
    bool overflowed() const;
    std::size_t lag_count() const;
    std::size_t pending() const;

private:
    std::optional<OutboundItem> take_front_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutboundItem> items_;
    std::function<void()> notifier_;
    std::size_t capacity_;
    std::size_t direct_capacity_;
    std::size_t pending_broadcasts_ = 0;
    std::size_t pending_direct_ = 0;
    std::size_t lag_count_ = 0;
    bool overflowed_ = false;
    bool closed_ = false;
};

class EventHub;

// RAII registration: destroying it unregisters the mailbox from the hub.
class Subscription {
public:
    Subscription(std::uint64_t id, std::shared_ptr<Mailbox> mailbox,
                 std::weak_ptr<void> registry_guard, EventHub* hub);
    ~Subscription();
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Mailbox& mailbox() { return *mailbox_; }
    std::uint64_t id() const { return id_; }

private:
    std::uint64_t id_;
    std::shared_ptr<Mailbox> mailbox_;
    std::weak_ptr<void> registry_guard_;
    EventHub* hub_;
};

// Broadcast fan-out. `publish` never blocks on a slow subscriber.
class EventHub {
public:
    EventHub();

    std::unique_ptr<Subscription> subscribe(std::size_t capacity);
    void publish(protocol::Revision rev, std::shared_ptr<const std::string> payload);
    std::size_t subscriber_count() const;

private:
    friend class Subscription;
    void unsubscribe(std::uint64_t id);

    mutable std::mutex mutex_;
    std::uint64_t next_id_ = 1;
    std::unordered_map<std::uint64_t, std::shared_ptr<Mailbox>> mailboxes_;
    std::shared_ptr<int> alive_;
};

}  // namespace turnstile::session

#include "session/event_hub.hpp"

#include <algorithm>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace turnstile::session {

namespace {

bool counts_as_direct(const OutboundKind kind) {
    return kind == OutboundKind::Direct || kind == OutboundKind::Handshake;
}

}  // namespace

Mailbox::Mailbox(const std::size_t capacity, const std::size_t direct_capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)),
      direct_capacity_(std::max<std::size_t>(direct_capacity, 1)) {}

void Mailbox::set_notifier(std::function<void()> notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

void Mailbox::offer_broadcast(const protocol::Revision rev,
                              std::shared_ptr<const std::string> payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (pending_broadcasts_ >= capacity_) {
            items_.erase(std::remove_if(items_.begin(), items_.end(),
                                        [](const OutboundItem& item) {
                                            return item.kind == OutboundKind::Broadcast;
                                        }),
                         items_.end());
            pending_broadcasts_ = 0;
            ++lag_count_;
            const bool marker_pending =
                std::any_of(items_.begin(), items_.end(), [](const OutboundItem& item) {
                    return item.kind == OutboundKind::Resync;
                });
            if (!marker_pending) {
                OutboundItem marker;
                marker.kind = OutboundKind::Resync;
                marker.rev = rev;
                items_.push_back(std::move(marker));
            }
        } else {
            OutboundItem item;
            item.kind = OutboundKind::Broadcast;
            item.rev = rev;
            item.payload = std::move(payload);
            items_.push_back(std::move(item));
            ++pending_broadcasts_;
        }
        if (notifier_) {
            notifier_();
        }
    }
    cv_.notify_one();
}

void Mailbox::push(OutboundItem item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (counts_as_direct(item.kind)) {
            if (pending_direct_ >= direct_capacity_) {
                overflowed_ = true;
                closed_ = true;
                items_.clear();
                pending_broadcasts_ = 0;
                pending_direct_ = 0;
                if (notifier_) {
                    notifier_();
                }
                cv_.notify_all();
                return;
            }
            ++pending_direct_;
        } else if (item.kind == OutboundKind::Broadcast) {
            ++pending_broadcasts_;
        }
        items_.push_back(std::move(item));
        if (notifier_) {
            notifier_();
        }
    }
    cv_.notify_one();
}

std::optional<OutboundItem> Mailbox::take_front_locked() {
    if (items_.empty()) {
        return std::nullopt;
    }
    OutboundItem item = std::move(items_.front());
    items_.pop_front();
    if (item.kind == OutboundKind::Broadcast) {
        --pending_broadcasts_;
    } else if (counts_as_direct(item.kind)) {
        --pending_direct_;
    }
    return item;
}

std::optional<OutboundItem> Mailbox::pop(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
    return take_front_locked();
}

std::optional<OutboundItem> Mailbox::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_front_locked();
}

void Mailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Mailbox::overflowed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflowed_;
}

std::size_t Mailbox::lag_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lag_count_;
}

std::size_t Mailbox::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

Subscription::Subscription(const std::uint64_t id, std::shared_ptr<Mailbox> mailbox,
                           std::weak_ptr<void> registry_guard, EventHub* hub)
    : id_(id),
      mailbox_(std::move(mailbox)),
      registry_guard_(std::move(registry_guard)),
      hub_(hub) {}

Subscription::~Subscription() {
    mailbox_->close();
    if (registry_guard_.lock()) {
        hub_->unsubscribe(id_);
    }
}

EventHub::EventHub() : alive_(std::make_shared<int>(0)) {}

std::unique_ptr<Subscription> EventHub::subscribe(const std::size_t capacity) {
    auto mailbox = std::make_shared<Mailbox>(capacity);
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        mailboxes_.emplace(id, mailbox);
    }
    LOG_DEBUG("EventHub: subscriber " + std::to_string(id) + " registered");
    return std::make_unique<Subscription>(id, std::move(mailbox),
                                          std::weak_ptr<void>(alive_), this);
}

void EventHub::unsubscribe(const std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    mailboxes_.erase(id);
    LOG_DEBUG("EventHub: subscriber " + std::to_string(id) + " removed");
}

void EventHub::publish(const protocol::Revision rev,
                       std::shared_ptr<const std::string> payload) {
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Mailbox>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.assign(mailboxes_.begin(), mailboxes_.end());
    }
    for (const auto& [id, mailbox] : targets) {
        const std::size_t lagged_before = mailbox->lag_count();
        mailbox->offer_broadcast(rev, payload);
        if (mailbox->lag_count() != lagged_before) {
            LOG_WARN("EventHub: subscriber " + std::to_string(id) + " lagged at rev " +
                     std::to_string(rev) + "; pending broadcasts dropped");
        }
    }
}

std::size_t EventHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mailboxes_.size();
}

}  // namespace turnstile::session

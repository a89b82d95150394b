#include "session/client_session.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using protocol::Revision;

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Handshaking:
            return "handshaking";
        case SessionState::Synced:
            return "synced";
        case SessionState::Lagging:
            return "lagging";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ClientSession::ClientSession(CommandDispatcher& dispatcher, EventHub& hub,
                             const std::size_t subscriber_capacity, std::string peer,
                             std::function<void()> wakeup)
    : dispatcher_(dispatcher),
      peer_(std::move(peer)),
      subscription_(hub.subscribe(subscriber_capacity)) {
    if (wakeup) {
        subscription_->mailbox().set_notifier(std::move(wakeup));
    }
    LOG_INFO("ClientSession: " + peer_ + " connected (subscriber " +
             std::to_string(subscription_->id()) + ")");
}

ClientSession::~ClientSession() {
    close();
}

void ClientSession::close() {
    const SessionState previous = state_.exchange(SessionState::Closed);
    subscription_->mailbox().close();
    if (previous != SessionState::Closed) {
        LOG_INFO("ClientSession: " + peer_ + " closed");
    }
}

bool ClientSession::closed() const {
    return state_.load() == SessionState::Closed;
}

bool ClientSession::backlog_exceeded() const {
    return subscription_->mailbox().overflowed();
}

std::size_t ClientSession::lag_count() const {
    return subscription_->mailbox().lag_count();
}

void ClientSession::push_direct(const protocol::ServerMessage& message,
                                const bool close_after) {
    OutboundItem item;
    item.kind = OutboundKind::Direct;
    item.payload = std::make_shared<const std::string>(protocol::codec::encode(message));
    item.close_after = close_after;
    subscription_->mailbox().push(std::move(item));
}

void ClientSession::send_error(const std::optional<std::string>& request_id,
                               const ServiceError& error, const bool close_after) {
    push_direct(protocol::ErrorMessage{request_id, error.message, error.code}, close_after);
}

void ClientSession::handle_text(const std::string& text) {
    if (closed()) {
        return;
    }
    auto decoded = protocol::codec::decode_client_message(text);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        LOG_WARN("ClientSession: " + peer_ + " sent an invalid message [" + err.code +
                 "]: " + err.message);
        send_error(std::nullopt, err);
        return;
    }

    const auto& message = core::errors::get_value(decoded);
    if (const auto* hello = std::get_if<protocol::ClientHello>(&message)) {
        handle_hello(*hello);
    } else if (const auto* action = std::get_if<protocol::ClientActionMessage>(&message)) {
        handle_action(*action);
    } else {
        push_direct(protocol::PongMessage{});
    }
}

void ClientSession::handle_hello(const protocol::ClientHello& hello) {
    if (hello.protocol_version != protocol::kProtocolVersion) {
        LOG_WARN("ClientSession: " + peer_ + " speaks protocol " +
                 std::to_string(hello.protocol_version) + ", expected " +
                 std::to_string(protocol::kProtocolVersion));
        send_error(std::nullopt,
                   ServiceError{ErrorCategory::Protocol,
                                "Unsupported protocol version " +
                                    std::to_string(hello.protocol_version),
                                "protocol_version_mismatch"},
                   true);
        return;
    }

    SessionState expected = SessionState::Connecting;
    state_.compare_exchange_strong(expected, SessionState::Handshaking);
    hello_accepted_.store(true);

    OutboundItem item;
    item.kind = OutboundKind::Handshake;
    item.last_seen_rev = hello.last_seen_rev;
    subscription_->mailbox().push(std::move(item));
}

void ClientSession::handle_action(const protocol::ClientActionMessage& message) {
    if (!hello_accepted_.load()) {
        send_error(message.request_id,
                   ServiceError{ErrorCategory::Protocol, "handshake required",
                                "handshake_required"});
        return;
    }

    auto action = protocol::codec::decode_action(message.action);
    if (core::errors::is_error(action)) {
        send_error(message.request_id, core::errors::get_error(action));
        return;
    }

    auto applied = dispatcher_.apply(message.request_id, core::errors::get_value(action));
    if (core::errors::is_error(applied)) {
        send_error(message.request_id, core::errors::get_error(applied));
        return;
    }
    push_direct(protocol::AckMessage{message.request_id, core::errors::get_value(applied)});
}

std::optional<OutboundFrame> ClientSession::drain(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (!pending_frames_.empty()) {
            OutboundFrame frame = std::move(pending_frames_.front());
            pending_frames_.pop_front();
            return frame;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto item = remaining.count() > 0 ? subscription_->mailbox().pop(remaining)
                                          : subscription_->mailbox().try_pop();
        if (!item.has_value()) {
            return std::nullopt;
        }

        switch (item->kind) {
            case OutboundKind::Direct:
                return OutboundFrame{*item->payload, item->close_after};
            case OutboundKind::Broadcast:
                // Anything at or below the last snapshot is already reflected in it.
                if (!synced_ || item->rev <= snapshot_rev_) {
                    continue;
                }
                return OutboundFrame{*item->payload, false};
            case OutboundKind::Handshake:
                complete_handshake(item->last_seen_rev);
                continue;
            case OutboundKind::Resync:
                if (synced_) {
                    resync();
                }
                continue;
        }
    }
}

void ClientSession::queue_app_changed(const protocol::AppSnapshot& snapshot) {
    const protocol::ServerMessage message = protocol::EventMessage{
        snapshot.rev, protocol::AppChangedEvent{snapshot.rev, snapshot}};
    pending_frames_.push_back(OutboundFrame{protocol::codec::encode(message), false});
}

void ClientSession::complete_handshake(const std::optional<Revision> last_seen_rev) {
    const protocol::AppSnapshot snapshot = dispatcher_.app_snapshot();
    pending_frames_.push_back(OutboundFrame{
        protocol::codec::encode(protocol::ServerHello{protocol::kProtocolVersion, snapshot.rev}),
        false});

    const bool stale = !last_seen_rev.has_value() || last_seen_rev.value() != snapshot.rev;
    if (stale) {
        queue_app_changed(snapshot);
    }
    LOG_INFO("ClientSession: " + peer_ + " handshake at rev " + std::to_string(snapshot.rev) +
             " (client " +
             (last_seen_rev.has_value() ? std::to_string(last_seen_rev.value())
                                        : std::string("none")) +
             (stale ? ", resync)" : ", up to date)"));

    synced_ = true;
    snapshot_rev_ = snapshot.rev;
    SessionState expected = SessionState::Handshaking;
    state_.compare_exchange_strong(expected, SessionState::Synced);
}

void ClientSession::resync() {
    SessionState expected = SessionState::Synced;
    state_.compare_exchange_strong(expected, SessionState::Lagging);

    const protocol::AppSnapshot snapshot = dispatcher_.app_snapshot();
    queue_app_changed(snapshot);
    snapshot_rev_ = snapshot.rev;
    LOG_WARN("ClientSession: " + peer_ + " lagged behind; resent snapshot at rev " +
             std::to_string(snapshot.rev));

    expected = SessionState::Lagging;
    state_.compare_exchange_strong(expected, SessionState::Synced);
}

}  // namespace turnstile::session

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "protocol/event_contract.hpp"
#include "session/command_dispatcher.hpp"
#include "session/event_hub.hpp"

namespace turnstile::session {

enum class SessionState {
    Connecting,
    Handshaking,
    Synced,
    Lagging,
    Closed
};

std::string to_string(SessionState state);

struct OutboundFrame {
    std::string text;
    bool close_after = false;
};

// Protocol state of one `/api/events` connection. `drain` is the only place
// the client's view is brought up to date (handshake replies, resync
// snapshots), so nothing published concurrently can slip between a snapshot
// and the broadcasts that follow it. `handle_text` and `drain` must not run
// concurrently with themselves; `wakeup` is called from any thread whenever
// there may be something new to drain.
class ClientSession {
public:
    ClientSession(CommandDispatcher& dispatcher, EventHub& hub,
                  std::size_t subscriber_capacity, std::string peer,
                  std::function<void()> wakeup = {});
    ~ClientSession();
    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    void handle_text(const std::string& text);

    // Next frame to send, or nullopt on timeout or once closed. A zero
    // timeout never waits.
    std::optional<OutboundFrame> drain(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    // The client stopped reading replies and the session gave up on it.
    bool backlog_exceeded() const;
    SessionState state() const { return state_.load(); }
    std::size_t lag_count() const;

private:
    void push_direct(const protocol::ServerMessage& message, bool close_after = false);
    void send_error(const std::optional<std::string>& request_id,
                    const core::errors::ServiceError& error, bool close_after = false);
    void handle_hello(const protocol::ClientHello& hello);
    void handle_action(const protocol::ClientActionMessage& message);

    void complete_handshake(std::optional<protocol::Revision> last_seen_rev);
    void resync();
    void queue_app_changed(const protocol::AppSnapshot& snapshot);

    CommandDispatcher& dispatcher_;
    std::string peer_;
    std::unique_ptr<Subscription> subscription_;
    std::atomic<SessionState> state_{SessionState::Connecting};
    std::atomic_bool hello_accepted_{false};

    // Touched by `drain` only.
    std::deque<OutboundFrame> pending_frames_;
    bool synced_ = false;
    protocol::Revision snapshot_rev_ = 0;
};

}  // namespace turnstile::session

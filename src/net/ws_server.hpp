#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "core/errors/service_errors.hpp"
#include "policy/auth_guard.hpp"
#include "pty/pty_session.hpp"
#include "session/command_dispatcher.hpp"
#include "session/event_hub.hpp"
#include "session/task_store.hpp"

struct lws;
struct lws_context;

namespace turnstile::net {

struct WsServerOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;  // 0 picks an ephemeral port
    std::size_t subscriber_capacity = 256;
    // Unsent terminal output per connection before it is dropped.
    std::size_t pty_backlog_bytes = 4 * 1024 * 1024;
    // Largest reassembled client message.
    std::size_t max_message_bytes = 1024 * 1024;
};

// Where an upgrade request goes, decided from its path and query.
struct WsRoute {
    enum class Kind {
        Events,
        Terminal
    };
    Kind kind = Kind::Events;
    protocol::TaskKey key;
    std::string reconnect;
};

// `/api/events` or `/api/pty/{workdir_id}/{task_id}`; the reconnect token
// comes from the `reconnect` query argument and defaults to "main".
// Errors carry the HTTP status the upgrade is refused with in `code`
// terms: `not_found` or `invalid_path`.
core::errors::Result<WsRoute> parse_ws_route(const std::string& path,
                                             const std::optional<std::string>& reconnect);

// libwebsockets listener for `/api/events` and `/api/pty/{workdir}/{task}`.
// A single service thread runs every callback; other threads only wake it.
class WsServer {
public:
    WsServer(WsServerOptions options, session::CommandDispatcher& dispatcher,
             session::EventHub& hub, session::TaskStore& store, pty::PtyRegistry* terminals,
             policy::AuthGuard& auth);
    ~WsServer();
    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    // Binds and starts serving; returns the bound port.
    core::errors::Result<std::uint16_t> start();
    void stop();

    std::size_t connection_count() const;

private:
    friend class WsCallbacks;
    struct Connection;

    void service_loop();
    void wake();

    core::errors::Result<WsRoute> admit(lws* wsi);
    bool open_connection(lws* wsi);
    bool receive(lws* wsi, const char* data, std::size_t len);
    bool writable(lws* wsi);
    void close_connection(lws* wsi);
    void request_writes();
    Connection* find(lws* wsi);

    WsServerOptions options_;
    session::CommandDispatcher& dispatcher_;
    session::EventHub& hub_;
    session::TaskStore& store_;
    pty::PtyRegistry* terminals_;
    policy::AuthGuard& auth_;

    std::mutex context_mutex_;  // guards context_ against concurrent wake()
    lws_context* context_ = nullptr;
    std::atomic_bool running_{false};
    std::thread service_thread_;

    mutable std::mutex connections_mutex_;
    std::map<lws*, std::unique_ptr<Connection>> connections_;
};

}  // namespace turnstile::net

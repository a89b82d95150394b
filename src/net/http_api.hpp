#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/errors/service_errors.hpp"
#include "policy/auth_guard.hpp"
#include "session/attachment_store.hpp"
#include "session/command_dispatcher.hpp"
#include "session/task_store.hpp"

namespace httplib {
class Server;
}

namespace turnstile::net {

struct HttpApiOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;  // 0 picks an ephemeral port
};

// Read-only snapshots, attachment upload/download and the auth exchange,
// served by cpp-httplib on its own thread.
class HttpApi {
public:
    HttpApi(HttpApiOptions options, session::CommandDispatcher& dispatcher,
            session::TaskStore& store, session::AttachmentStore* attachments,
            policy::AuthGuard& auth);
    ~HttpApi();
    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    core::errors::Result<std::uint16_t> start();
    void stop();
    bool running() const { return running_.load(); }

private:
    void configure_routes(httplib::Server& server);

    HttpApiOptions options_;
    session::CommandDispatcher& dispatcher_;
    session::TaskStore& store_;
    session::AttachmentStore* attachments_;
    policy::AuthGuard& auth_;

    std::mutex mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic_bool running_{false};
};

}  // namespace turnstile::net

#include <csignal>
#include <filesystem>
#include <memory>
#include <pthread.h>
#include <string>
#include <system_error>
#include "app/cli_parser.hpp"
#include "core/config/tokens.hpp"
#include "core/errors/service_errors.hpp"
#include "core/logging/logger.hpp"
#include "net/http_api.hpp"
#include "net/ws_server.hpp"
#include "policy/auth_guard.hpp"
#include "pty/pty_session.hpp"
#include "runtime/process_executor.hpp"
#include "session/attachment_store.hpp"
#include "session/command_dispatcher.hpp"
#include "session/conversation_journal.hpp"
#include "session/event_hub.hpp"
#include "session/revision_store.hpp"
#include "session/task_store.hpp"
#include "session/turn_registry.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line with this server instance
    const std::string instance_id = turnstile::core::config::generate_instance_id();
    turnstile::core::logging::Logger::get().set_instance_id(instance_id);

    // 2. Parse CLI input and return normalized input errors
    LOG_INFO("turnstile: bootstrapping...");
    auto parsed = turnstile::app::cli::parse_and_validate(argc, argv);
    if (turnstile::core::errors::is_error(parsed)) {
        const auto& err = turnstile::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    auto config = turnstile::core::errors::get_value(parsed);
    turnstile::core::logging::Logger::get().set_min_level(config.log_level);

    // 3. Signals: SIGPIPE is ignored, SIGINT/SIGTERM are collected by sigwait
    //    below, so every thread started from here inherits the blocked mask.
    std::signal(SIGPIPE, SIG_IGN);
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    // 4. Storage
    std::filesystem::path storage_root;
    if (config.data_dir.has_value()) {
        storage_root = config.data_dir.value();
    } else {
        std::error_code ec;
        storage_root = std::filesystem::temp_directory_path(ec) / ("turnstile-" + instance_id);
        if (ec) {
            LOG_ERROR("Startup failed: no temporary directory available: " + ec.message());
            return 3;
        }
        LOG_WARN("No --data-dir given; attachments go to " + storage_root.string() +
                 " and the conversation journal is disabled");
    }
    std::error_code dir_ec;
    std::filesystem::create_directories(storage_root, dir_ec);
    if (dir_ec) {
        LOG_ERROR("Startup failed: cannot create " + storage_root.string() + ": " +
                  dir_ec.message());
        return 3;
    }

    // 5. Auth
    if (config.auth_mode == turnstile::core::config::AuthMode::SingleUser &&
        !config.auth_token.has_value()) {
        config.auth_token = turnstile::core::config::generate_token("", 32);
    }
    turnstile::policy::AuthGuard auth(config.auth_mode, config.auth_token.value_or(""));

    // 6. Core services
    turnstile::session::TaskStore store;
    for (const auto& workdir : config.workdirs) {
        const auto id = store.add_workdir(workdir.project_id, workdir.path);
        LOG_INFO("Workdir w" + std::to_string(id) + " (" + workdir.project_id + "): " +
                 workdir.path.string());
    }
    turnstile::session::RevisionStore revisions;
    turnstile::session::EventHub hub;
    turnstile::session::TurnRegistry turns;
    turnstile::session::AttachmentStore attachments(storage_root, config.max_attachment_bytes);
    turnstile::pty::PtyRegistry terminals(config.pty_history_bytes);
    std::unique_ptr<turnstile::session::ConversationJournal> journal;
    if (config.data_dir.has_value()) {
        journal = std::make_unique<turnstile::session::ConversationJournal>(config.data_dir.value());
    }
    if (!config.agent_command.has_value()) {
        LOG_WARN("No --agent-command given; agent turns will fail until one is configured");
    }

    auto executor = std::make_unique<turnstile::runtime::ProcessExecutor>(
        turnstile::runtime::ProcessExecutorOptions{config.agent_command.value_or(""), 2048});

    turnstile::session::DispatcherServices services;
    services.attachments = &attachments;
    services.terminals = &terminals;
    services.journal = journal.get();
    turnstile::session::DispatcherOptions dispatcher_options;
    dispatcher_options.conversation_event_window = config.conversation_event_window;
    auto dispatcher = std::make_unique<turnstile::session::CommandDispatcher>(
        store, revisions, hub, turns, *executor, services, dispatcher_options);

    // 7. Transports
    turnstile::net::HttpApiOptions http_options;
    http_options.host = config.host;
    http_options.port = config.port;
    turnstile::net::HttpApi http(http_options, *dispatcher, store, &attachments, auth);

    turnstile::net::WsServerOptions ws_options;
    ws_options.host = config.host;
    ws_options.port = config.effective_ws_port();
    ws_options.subscriber_capacity = config.subscriber_capacity;
    turnstile::net::WsServer ws(ws_options, *dispatcher, hub, store, &terminals, auth);

    auto http_started = http.start();
    if (turnstile::core::errors::is_error(http_started)) {
        const auto& err = turnstile::core::errors::get_error(http_started);
        LOG_ERROR("Startup failed [" + err.code + "]: " + err.message);
        return 3;
    }
    auto ws_started = ws.start();
    if (turnstile::core::errors::is_error(ws_started)) {
        const auto& err = turnstile::core::errors::get_error(ws_started);
        LOG_ERROR("Startup failed [" + err.code + "]: " + err.message);
        http.stop();
        return 3;
    }

    const std::string base_url = "http://" + config.host + ":" + std::to_string(config.port);
    if (auth.enabled()) {
        LOG_INFO("Open " + base_url + "/auth?token=" + auth.bootstrap_token() + " to sign in");
    } else {
        LOG_INFO("Serving " + base_url + " without authentication");
    }

    // 8. Wait for a stop signal
    int received = 0;
    sigwait(&stop_signals, &received);
    LOG_INFO("Received signal " + std::to_string(received) + "; shutting down");

    // 9. Orderly shutdown: stop turns, then transports, then terminals;
    //    the executor joins its workers before the dispatcher goes away.
    dispatcher->shutdown();
    ws.stop();
    http.stop();
    terminals.shutdown();
    executor.reset();
    dispatcher.reset();

    LOG_INFO("turnstile: stopped");
    return 0;
}

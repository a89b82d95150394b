#include "pty/pty_session.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace turnstile::pty {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

constexpr int kReadPollMs = 200;

}  // namespace

PtySession::PtySession(std::string id, std::string reconnect, std::filesystem::path cwd,
                       const std::size_t history_bytes)
    : id_(std::move(id)),
      reconnect_(std::move(reconnect)),
      cwd_(std::move(cwd)),
      history_(history_bytes) {}

PtySession::~PtySession() {
    stop();
}

bool PtySession::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::string PtySession::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.snapshot();
}

std::uint64_t PtySession::total_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.total_written();
}

void PtySession::join_reader() {
    if (reader_.joinable()) {
        reader_.join();
    }
}

core::errors::Result<bool> PtySession::start(std::optional<std::string> command,
                                             ExitCallback on_exit) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return false;
        }
    }
    join_reader();

    PtySpawnOptions options;
    options.cwd = cwd_;
    options.command = std::move(command);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options.cols = cols_;
        options.rows = rows_;
    }
    auto spawned = PtyProcess::spawn(options);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    auto process = core::errors::get_value(spawned);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        process_ = process;
        running_ = true;
        stopping_ = false;
        on_exit_ = std::move(on_exit);
    }
    reader_ = std::thread(&PtySession::reader_loop, this, process);
    LOG_INFO("PtySession: " + id_ + " started pid " + std::to_string(process->pid()) +
             (options.command.has_value() ? " running '" + options.command.value() + "'"
                                          : " with interactive shell"));
    return true;
}

core::errors::Result<bool> PtySession::attach(const std::shared_ptr<PtyListener>& listener) {
    if (!running()) {
        auto started = start(std::nullopt);
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }
    }

    std::shared_ptr<PtyListener> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(listener_, listener);
        const std::string replay = history_.snapshot();
        if (!replay.empty()) {
            listener->on_output(replay);
        }
        if (!running_) {
            listener->on_exited();
        }
        if (previous && previous != listener) {
            previous->on_detached();
        }
    }
    LOG_DEBUG("PtySession: " + id_ + " attached" +
              (previous ? std::string(" (replaced previous attachment)") : std::string()));
    return true;
}

void PtySession::detach(const std::shared_ptr<PtyListener>& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener_ == listener) {
        listener_.reset();
    }
}

core::errors::Result<std::size_t> PtySession::write_input(std::string_view bytes) {
    std::shared_ptr<PtyProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return ServiceError{ErrorCategory::State, "Terminal is not running: " + id_,
                                "pty_not_running"};
        }
        process = process_;
    }
    return process->write(bytes);
}

core::errors::Result<bool> PtySession::resize(const std::uint16_t cols,
                                              const std::uint16_t rows) {
    std::shared_ptr<PtyProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cols == 0 || rows == 0) {
            return ServiceError{ErrorCategory::Input, "Terminal size must be positive.",
                                "invalid_terminal_size"};
        }
        cols_ = cols;
        rows_ = rows;
        if (!running_) {
            return false;
        }
        process = process_;
    }
    return process->resize(cols, rows);
}

void PtySession::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<PtyProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        process = process_;
    }
    if (process) {
        process->terminate();
    }
    join_reader();

    std::lock_guard<std::mutex> lock(mutex_);
    listener_.reset();
    process_.reset();
}

void PtySession::reader_loop(std::shared_ptr<PtyProcess> process) {
    std::string chunk;
    while (true) {
        chunk.clear();
        const ReadStatus status = process->read_some(chunk, kReadPollMs);
        if (status == ReadStatus::Closed) {
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (status == ReadStatus::Data) {
            history_.append(chunk);
            if (listener_) {
                listener_->on_output(chunk);
            }
        } else if (stopping_) {
            break;
        }
    }

    const int exit_code = process->wait_exit();
    ExitCallback on_exit;
    std::string history;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        stopping = stopping_;
        if (listener_) {
            listener_->on_exited();
        }
        on_exit = std::move(on_exit_);
        on_exit_ = nullptr;
        history = history_.snapshot();
    }
    LOG_INFO("PtySession: " + id_ + " process exited with code " + std::to_string(exit_code));
    if (on_exit && !stopping) {
        on_exit(history, exit_code);
    }
}

PtyRegistry::PtyRegistry(const std::size_t history_bytes) : history_bytes_(history_bytes) {}

PtyRegistry::~PtyRegistry() {
    shutdown();
}

std::string PtyRegistry::session_id(const protocol::TaskKey& key,
                                    const std::string& reconnect) {
    return protocol::to_string(key) + "/" + reconnect;
}

std::shared_ptr<PtySession> PtyRegistry::get_or_create(const protocol::TaskKey& key,
                                                       const std::string& reconnect,
                                                       const std::filesystem::path& cwd) {
    const std::string id = session_id(key, reconnect);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        return it->second;
    }
    auto session = std::make_shared<PtySession>(id, reconnect, cwd, history_bytes_);
    sessions_.emplace(id, session);
    return session;
}

std::shared_ptr<PtySession> PtyRegistry::find(const protocol::TaskKey& key,
                                              const std::string& reconnect) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id(key, reconnect));
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

core::errors::Result<std::shared_ptr<PtySession>> PtyRegistry::start_command(
    const protocol::TaskKey& key, const std::string& reconnect, const std::string& command,
    const std::filesystem::path& cwd, ExitCallback on_exit) {
    auto session = get_or_create(key, reconnect, cwd);
    // start() checks and claims the session under its own lock.
    auto started = session->start(command, std::move(on_exit));
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    if (!core::errors::get_value(started)) {
        return ServiceError{ErrorCategory::State,
                            "Terminal " + session->id() + " is still running.",
                            "terminal_busy"};
    }
    return session;
}

std::size_t PtyRegistry::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void PtyRegistry::shutdown() {
    std::vector<std::shared_ptr<PtySession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
        sessions_.clear();
    }
    for (const auto& session : sessions) {
        session->stop();
    }
}

}  // namespace turnstile::pty

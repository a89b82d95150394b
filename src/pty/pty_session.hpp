#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include "core/errors/service_errors.hpp"
#include "protocol/task_contract.hpp"
#include "pty/pty_process.hpp"
#include "pty/replay_buffer.hpp"

namespace turnstile::pty {

// Receiver of one attachment's stream. Called with the session lock held,
// so implementations must only enqueue.
class PtyListener {
public:
    virtual ~PtyListener() = default;
    virtual void on_output(std::string_view bytes) = 0;
    virtual void on_exited() = 0;
    // A newer attachment replaced this one.
    virtual void on_detached() = 0;
};

// Called once the process started with it exits, with the replay buffer
// contents at that moment.
using ExitCallback = std::function<void(const std::string& history, int exit_code)>;

// A terminal that outlives its connections. History survives process
// restarts; an attach after exit starts a fresh shell under the same id.
class PtySession {
public:
    PtySession(std::string id, std::string reconnect, std::filesystem::path cwd,
               std::size_t history_bytes);
    ~PtySession();
    PtySession(const PtySession&) = delete;
    PtySession& operator=(const PtySession&) = delete;

    // No-op while a process runs.
    core::errors::Result<bool> start(std::optional<std::string> command,
                                     ExitCallback on_exit = {});
    // Replays the history, then streams live output to `listener`.
    core::errors::Result<bool> attach(const std::shared_ptr<PtyListener>& listener);
    void detach(const std::shared_ptr<PtyListener>& listener);

    core::errors::Result<std::size_t> write_input(std::string_view bytes);
    core::errors::Result<bool> resize(std::uint16_t cols, std::uint16_t rows);
    void stop();

    const std::string& id() const { return id_; }
    const std::string& reconnect() const { return reconnect_; }
    bool running() const;
    std::string history() const;
    std::uint64_t total_written() const;

private:
    void reader_loop(std::shared_ptr<PtyProcess> process);
    void join_reader();

    const std::string id_;
    const std::string reconnect_;
    const std::filesystem::path cwd_;

    std::mutex lifecycle_mutex_;  // start/stop/respawn
    std::thread reader_;

    mutable std::mutex mutex_;  // output, history and attachment
    ReplayBuffer history_;
    std::shared_ptr<PtyProcess> process_;
    std::shared_ptr<PtyListener> listener_;
    ExitCallback on_exit_;
    bool running_ = false;
    bool stopping_ = false;
    std::uint16_t cols_ = 120;
    std::uint16_t rows_ = 32;
};

class PtyRegistry {
public:
    explicit PtyRegistry(std::size_t history_bytes);
    ~PtyRegistry();

    std::shared_ptr<PtySession> get_or_create(const protocol::TaskKey& key,
                                              const std::string& reconnect,
                                              const std::filesystem::path& cwd);
    std::shared_ptr<PtySession> find(const protocol::TaskKey& key,
                                     const std::string& reconnect) const;
    // Runs `command` in the session named by `reconnect`; fails while a
    // process is still running there.
    core::errors::Result<std::shared_ptr<PtySession>> start_command(
        const protocol::TaskKey& key, const std::string& reconnect,
        const std::string& command, const std::filesystem::path& cwd, ExitCallback on_exit);

    std::size_t session_count() const;
    void shutdown();

    static std::string session_id(const protocol::TaskKey& key, const std::string& reconnect);

private:
    std::size_t history_bytes_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PtySession>> sessions_;
};

}  // namespace turnstile::pty

#include "runtime/process_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace turnstile::runtime {

using nlohmann::json;

namespace {

struct ChildStreams {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_fd(fd);
        return;
    }
}

// Writes as much of `pending` as the pipe accepts; closes stdin when done.
void feed_stdin(int& fd, std::string& pending) {
    while (fd >= 0 && !pending.empty()) {
        const ssize_t n = write(fd, pending.data(), pending.size());
        if (n > 0) {
            pending.erase(0, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        pending.clear();
    }
    close_fd(fd);
}

bool spawn_child(const std::string& command, const TurnRequest& request,
                 ChildStreams& streams) {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]}) {
            close_fd(fd);
        }
        return false;
    }

    std::string attachments;
    for (const auto& path : request.attachment_paths) {
        if (!attachments.empty()) {
            attachments += "\n";
        }
        attachments += path.string();
    }
    const std::string task = protocol::to_string(request.key);

    const pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]}) {
            close_fd(fd);
        }
        return false;
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.workdir.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        for (const int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                             stderr_pipe[0], stderr_pipe[1]}) {
            static_cast<void>(close(fd));
        }
        static_cast<void>(setenv("TURNSTILE_TASK", task.c_str(), 1));
        static_cast<void>(setenv("TURNSTILE_ATTACHMENTS", attachments.c_str(), 1));
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Own process group, so cancellation reaches whatever the shell spawned.
    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    streams.pid = pid;
    streams.stdin_fd = stdin_pipe[1];
    streams.stdout_fd = stdout_pipe[0];
    streams.stderr_fd = stderr_pipe[0];
    set_nonblocking(streams.stdin_fd);
    set_nonblocking(streams.stdout_fd);
    set_nonblocking(streams.stderr_fd);
    return true;
}

int decode_exit_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string tail(const std::string& text, const std::size_t max_bytes) {
    std::string trimmed = text;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    if (trimmed.size() <= max_bytes) {
        return trimmed;
    }
    return trimmed.substr(trimmed.size() - max_bytes);
}

}  // namespace

std::optional<protocol::AgentEvent> parse_executor_line(const std::string& line) {
    const json value = json::parse(line, nullptr, false);
    if (value.is_discarded() || !value.is_object()) {
        return std::nullopt;
    }
    const auto type_it = value.find("type");
    if (type_it == value.end() || !type_it->is_string()) {
        return std::nullopt;
    }
    const std::string type = type_it->get<std::string>();
    const auto string_field = [&value](const char* name) -> std::optional<std::string> {
        const auto it = value.find(name);
        if (it == value.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    };

    if (type == "message") {
        const auto id = string_field("id");
        const auto text = string_field("text");
        if (!id.has_value() || !text.has_value()) {
            return std::nullopt;
        }
        return protocol::AgentEvent{protocol::AgentMessage{id.value(), text.value()}};
    }
    if (type == "item") {
        const auto id = string_field("id");
        const auto kind = string_field("kind");
        if (!id.has_value() || !kind.has_value()) {
            return std::nullopt;
        }
        const auto parsed_kind = protocol::parse_agent_item_kind(kind.value());
        if (!parsed_kind.has_value()) {
            return std::nullopt;
        }
        protocol::AgentItem item;
        item.id = id.value();
        item.kind = parsed_kind.value();
        item.payload = value.contains("payload") ? value.at("payload") : json::object();
        return protocol::AgentEvent{item};
    }
    if (type == "turn_usage") {
        protocol::TurnUsage usage;
        const auto it = value.find("usage_json");
        if (it != value.end() && !it->is_null()) {
            usage.usage_json = *it;
        }
        return protocol::AgentEvent{usage};
    }
    return std::nullopt;
}

ProcessExecutor::ProcessExecutor(ProcessExecutorOptions options)
    : options_(std::move(options)) {}

ProcessExecutor::~ProcessExecutor() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void ProcessExecutor::start(const TurnRequest& request,
                            std::shared_ptr<std::atomic_bool> cancel_token,
                            std::shared_ptr<TurnSink> sink) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_workers();
    auto done = std::make_shared<std::atomic_bool>(false);
    std::thread thread([this, request = request, cancel_token = std::move(cancel_token),
                        sink = std::move(sink), done]() mutable {
        run_turn(std::move(request), std::move(cancel_token), std::move(sink));
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

std::size_t ProcessExecutor::live_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_workers();
    return workers_.size();
}

void ProcessExecutor::reap_finished_workers() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (!it->done->load()) {
            ++it;
            continue;
        }
        if (it->thread.joinable()) {
            it->thread.join();
        }
        it = workers_.erase(it);
    }
}

void ProcessExecutor::run_turn(TurnRequest request,
                               std::shared_ptr<std::atomic_bool> cancel_token,
                               std::shared_ptr<TurnSink> sink) const {
    // A child that exits without reading its prompt must not kill the server.
    sigset_t pipe_signal;
    sigemptyset(&pipe_signal);
    sigaddset(&pipe_signal, SIGPIPE);
    static_cast<void>(pthread_sigmask(SIG_BLOCK, &pipe_signal, nullptr));

    const std::string task = protocol::to_string(request.key);
    const auto started = std::chrono::steady_clock::now();
    const auto elapsed_ms = [&started]() {
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started)
                .count());
    };

    TurnCompletion completion;
    if (options_.command.empty()) {
        completion.error_message = "no agent command configured";
        LOG_WARN("ProcessExecutor: task " + task + " turn " +
                 std::to_string(request.turn_id) + " failed: " + completion.error_message);
        sink->on_finished(completion);
        return;
    }

    ChildStreams streams;
    if (!spawn_child(options_.command, request, streams)) {
        completion.error_message = "failed to start agent process";
        LOG_ERROR("ProcessExecutor: task " + task + " turn " +
                  std::to_string(request.turn_id) + " could not spawn the agent process");
        sink->on_finished(completion);
        return;
    }
    LOG_INFO("ProcessExecutor: task " + task + " turn " + std::to_string(request.turn_id) +
             " started pid " + std::to_string(streams.pid));

    std::string pending_stdin = request.prompt;
    std::string stdout_buffer;
    std::string stderr_text;
    bool child_exited = false;
    bool cancelled = false;
    int status = 0;

    while (streams.stdout_fd >= 0 || streams.stderr_fd >= 0 || !child_exited) {
        if (!cancelled && cancel_token && cancel_token->load() && !child_exited) {
            cancelled = true;
            static_cast<void>(kill(-streams.pid, SIGKILL));
        }

        feed_stdin(streams.stdin_fd, pending_stdin);

        pollfd fds[3];
        nfds_t nfds = 0;
        if (streams.stdout_fd >= 0) {
            fds[nfds].fd = streams.stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (streams.stderr_fd >= 0) {
            fds[nfds].fd = streams.stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (streams.stdin_fd >= 0) {
            fds[nfds].fd = streams.stdin_fd;
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        drain_pipe(streams.stdout_fd, stdout_buffer);
        drain_pipe(streams.stderr_fd, stderr_text);

        std::size_t newline = stdout_buffer.find('\n');
        while (newline != std::string::npos) {
            const std::string line = stdout_buffer.substr(0, newline);
            stdout_buffer.erase(0, newline + 1);
            if (!cancelled) {
                auto event = parse_executor_line(line);
                if (event.has_value()) {
                    sink->on_event(event.value());
                }
            }
            newline = stdout_buffer.find('\n');
        }

        if (!child_exited) {
            const pid_t waited = waitpid(streams.pid, &status, WNOHANG);
            if (waited == streams.pid) {
                child_exited = true;
            }
        }
    }
    close_fd(streams.stdin_fd);

    if (!cancelled && !stdout_buffer.empty()) {
        auto event = parse_executor_line(stdout_buffer);
        if (event.has_value()) {
            sink->on_event(event.value());
        }
    }

    const int exit_code = decode_exit_status(status);
    completion.duration_ms = elapsed_ms();
    if (cancelled) {
        completion.error_message = "turn cancelled";
    } else if (exit_code == 0) {
        completion.success = true;
    } else {
        completion.error_message = tail(stderr_text, options_.stderr_tail_bytes);
        if (completion.error_message.empty()) {
            completion.error_message =
                "agent process failed with exit code " + std::to_string(exit_code);
        }
        LOG_WARN("ProcessExecutor: task " + task + " turn " +
                 std::to_string(request.turn_id) + " exited with code " +
                 std::to_string(exit_code));
    }
    sink->on_finished(completion);
}

}  // namespace turnstile::runtime

#include "pty/pty_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace turnstile::pty {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

core::errors::Result<std::shared_ptr<PtyProcess>> PtyProcess::spawn(
    const PtySpawnOptions& options) {
    struct winsize size {};
    size.ws_col = options.cols;
    size.ws_row = options.rows;

    int master_fd = -1;
    const pid_t pid = forkpty(&master_fd, nullptr, nullptr, &size);
    if (pid < 0) {
        return ServiceError{ErrorCategory::Execution, "Failed to fork pseudo terminal.",
                            "pty_spawn_failed"};
    }

    if (pid == 0) {
        if (chdir(options.cwd.c_str()) != 0) {
            _exit(126);
        }
        setenv("TERM", "xterm-256color", 1);
        if (options.command.has_value()) {
            execl("/bin/sh", "sh", "-c", options.command->c_str(),
                  static_cast<char*>(nullptr));
        } else {
            const char* shell = getenv("SHELL");
            if (shell == nullptr || *shell == '\0') {
                shell = "/bin/sh";
            }
            execl(shell, shell, static_cast<char*>(nullptr));
        }
        _exit(127);
    }

    set_nonblocking(master_fd);
    return std::shared_ptr<PtyProcess>(new PtyProcess(pid, master_fd));
}

PtyProcess::PtyProcess(const pid_t pid, const int master_fd)
    : pid_(pid), master_fd_(master_fd) {}

PtyProcess::~PtyProcess() {
    terminate();
    static_cast<void>(wait_exit());
    if (master_fd_ >= 0) {
        static_cast<void>(close(master_fd_));
    }
}

core::errors::Result<std::size_t> PtyProcess::write(std::string_view data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(master_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd fd{master_fd_, POLLOUT, 0};
            if (poll(&fd, 1, 1000) <= 0) {
                return ServiceError{ErrorCategory::Transport,
                                    "Terminal input is not being consumed.",
                                    "pty_write_timeout"};
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return ServiceError{ErrorCategory::Transport, "Failed to write to terminal.",
                            "pty_write_failed"};
    }
    return written;
}

core::errors::Result<bool> PtyProcess::resize(const std::uint16_t cols,
                                              const std::uint16_t rows) {
    if (cols == 0 || rows == 0) {
        return ServiceError{ErrorCategory::Input, "Terminal size must be positive.",
                            "invalid_terminal_size"};
    }
    struct winsize size {};
    size.ws_col = cols;
    size.ws_row = rows;
    if (ioctl(master_fd_, TIOCSWINSZ, &size) != 0) {
        return ServiceError{ErrorCategory::Transport, "Failed to resize terminal.",
                            "pty_resize_failed"};
    }
    return true;
}

ReadStatus PtyProcess::read_some(std::string& out, const int timeout_ms) {
    pollfd fd{master_fd_, POLLIN, 0};
    const int ready = poll(&fd, 1, timeout_ms);
    if (ready == 0) {
        return ReadStatus::Timeout;
    }
    if (ready < 0) {
        return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Closed;
    }

    char buffer[4096];
    bool got_data = false;
    while (true) {
        const ssize_t n = read(master_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            got_data = true;
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return got_data ? ReadStatus::Data : ReadStatus::Timeout;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // EOF, or EIO once the slave side has no process left.
        return got_data ? ReadStatus::Data : ReadStatus::Closed;
    }
}

int PtyProcess::wait_exit() {
    if (reaped_) {
        return exit_code_;
    }
    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);
    exit_code_ = waited == pid_ ? decode_wait_status(status) : -1;
    reaped_ = true;
    return exit_code_;
}

void PtyProcess::terminate() {
    if (!reaped_) {
        static_cast<void>(kill(pid_, SIGKILL));
    }
}

}  // namespace turnstile::pty

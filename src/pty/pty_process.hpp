#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include "core/errors/service_errors.hpp"

namespace turnstile::pty {

struct PtySpawnOptions {
    std::filesystem::path cwd = ".";
    // Run through `/bin/sh -c`; an interactive $SHELL when absent.
    std::optional<std::string> command;
    std::uint16_t cols = 120;
    std::uint16_t rows = 32;
};

enum class ReadStatus {
    Data,
    Timeout,
    Closed
};

// A child process attached to the master side of a pseudo terminal.
class PtyProcess {
public:
    static core::errors::Result<std::shared_ptr<PtyProcess>> spawn(const PtySpawnOptions& options);

    ~PtyProcess();
    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    core::errors::Result<std::size_t> write(std::string_view data);
    core::errors::Result<bool> resize(std::uint16_t cols, std::uint16_t rows);
    ReadStatus read_some(std::string& out, int timeout_ms);

    // Blocks until the child exits; returns its exit code (128 + signal).
    int wait_exit();
    void terminate();
    pid_t pid() const { return pid_; }

private:
    PtyProcess(pid_t pid, int master_fd);

    pid_t pid_;
    int master_fd_;
    std::atomic_bool reaped_{false};
    std::atomic_int exit_code_{-1};
};

}  // namespace turnstile::pty

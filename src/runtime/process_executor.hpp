#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "protocol/conversation_contract.hpp"
#include "runtime/turn_executor.hpp"

namespace turnstile::runtime {

struct ProcessExecutorOptions {
    // Run through `/bin/sh -c` in the task's workdir. Empty: every turn fails.
    std::string command;
    std::size_t stderr_tail_bytes = 2048;
};

// Maps one stdout line of the agent process to an agent event:
//   {"type":"message","id":..,"text":..}
//   {"type":"item","id":..,"kind":..,"payload":..}
//   {"type":"turn_usage","usage_json":..}
// Anything else, including non-JSON output, yields nullopt.
std::optional<protocol::AgentEvent> parse_executor_line(const std::string& line);

// Runs each turn as a child process on its own worker thread. The prompt is
// written to the child's stdin; TURNSTILE_TASK and TURNSTILE_ATTACHMENTS
// describe the task and the attachment files.
class ProcessExecutor : public TurnExecutor {
public:
    explicit ProcessExecutor(ProcessExecutorOptions options);
    ~ProcessExecutor() override;

    void start(const TurnRequest& request, std::shared_ptr<std::atomic_bool> cancel_token,
               std::shared_ptr<TurnSink> sink) override;

    // Joins finished workers and returns how many are still running.
    std::size_t live_workers();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    void run_turn(TurnRequest request, std::shared_ptr<std::atomic_bool> cancel_token,
                  std::shared_ptr<TurnSink> sink) const;
    // Caller holds workers_mutex_.
    void reap_finished_workers();

    ProcessExecutorOptions options_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

}  // namespace turnstile::runtime

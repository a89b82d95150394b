#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "protocol/conversation_contract.hpp"
#include "protocol/task_contract.hpp"

namespace turnstile::runtime {

struct TurnRequest {
    protocol::TaskKey key;
    std::uint64_t turn_id = 0;
    std::filesystem::path workdir;
    std::string prompt;
    std::vector<protocol::AttachmentRef> attachments;
    std::vector<std::filesystem::path> attachment_paths;
};

struct TurnCompletion {
    bool success = false;
    std::string error_message;
    std::uint64_t duration_ms = 0;
};

// Receives the executor's output for one turn. `on_finished` is called
// exactly once, after the last `on_event`.
class TurnSink {
public:
    virtual ~TurnSink() = default;
    virtual void on_event(const protocol::AgentEvent& event) = 0;
    virtual void on_finished(const TurnCompletion& completion) = 0;
};

// Runs agent turns. `start` returns immediately; work happens elsewhere and
// stops cooperatively once `cancel_token` is set.
class TurnExecutor {
public:
    virtual ~TurnExecutor() = default;
    virtual void start(const TurnRequest& request,
                       std::shared_ptr<std::atomic_bool> cancel_token,
                       std::shared_ptr<TurnSink> sink) = 0;
};

}  // namespace turnstile::runtime

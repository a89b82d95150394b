#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/snapshot_contract.hpp"
#include "runtime/turn_executor.hpp"
#include "session/conversation_log.hpp"
#include "session/turn_registry.hpp"

namespace turnstile::session {

// A turn the caller must hand to the executor once the task lock is released.
struct TurnStart {
    protocol::TaskKey key;
    std::uint64_t turn_id = 0;
    protocol::UserInput input;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Outcome of a call that may be a no-op and may start a turn.
struct Transition {
    bool changed = false;
    std::optional<TurnStart> start;
};

struct QueuedPrompt {
    protocol::PromptId id = 0;
    protocol::UserInput input;
};

// Task/turn state machine of a single task. Not thread-safe; the owner
// serializes access with the task's mutex. Every mutating call either fails
// without side effects or reports whether anything changed.
class TaskState {
public:
    TaskState(protocol::TaskKey key, std::int64_t now_ms);

    // --- task metadata ---
    // False when the task already has `next`.
    bool set_status(protocol::TaskStatus next, std::int64_t now_ms);
    bool set_starred(bool starred, std::int64_t now_ms);

    // --- turns ---
    core::errors::Result<std::optional<TurnStart>> send_message(
        protocol::UserInput input, TurnRegistry& turns, std::int64_t now_ms);
    core::errors::Result<std::optional<TurnStart>> queue_message(
        protocol::UserInput input, TurnRegistry& turns, std::int64_t now_ms);
    core::errors::Result<TurnStart> cancel_and_send(
        protocol::UserInput input, TurnRegistry& turns, std::int64_t now_ms);
    core::errors::Result<bool> cancel_turn(TurnRegistry& turns, std::int64_t now_ms);

    // False when the turn is no longer the active one.
    bool record_agent_event(std::uint64_t turn_id, protocol::AgentEvent event,
                            std::int64_t now_ms);
    // Unchanged for a stale turn id; `start` is the next queued prompt.
    Transition finish_turn(std::uint64_t turn_id, const runtime::TurnCompletion& completion,
                           TurnRegistry& turns, std::int64_t now_ms);

    // --- queue ---
    core::errors::Result<bool> remove_queued(protocol::PromptId id, std::int64_t now_ms);
    core::errors::Result<bool> reorder_queued(protocol::PromptId active_id,
                                              protocol::PromptId over_id,
                                              std::int64_t now_ms);
    core::errors::Result<bool> update_queued(protocol::PromptId id,
                                             protocol::UserInput input,
                                             std::int64_t now_ms);
    bool clear_queue(std::int64_t now_ms);
    Transition resume_queue(TurnRegistry& turns, std::int64_t now_ms);

    // --- terminal commands ---
    void record_terminal_started(const protocol::TerminalCommandStarted& started,
                                 std::int64_t now_ms);
    void record_terminal_finished(const protocol::TerminalCommandFinished& finished,
                                  std::int64_t now_ms);

    // --- views ---
    const protocol::TaskKey& key() const { return key_; }
    const std::string& title() const { return title_; }
    protocol::TaskStatus task_status() const { return task_status_; }
    bool is_starred() const { return is_starred_; }
    bool is_running() const { return active_turn_.has_value(); }
    bool queue_paused() const { return queue_paused_; }
    std::optional<std::uint64_t> active_turn_id() const;
    const std::deque<QueuedPrompt>& queue() const { return queue_; }
    const ConversationLog& log() const { return log_; }
    std::int64_t created_at_unix_ms() const { return created_at_unix_ms_; }
    std::int64_t updated_at_unix_ms() const { return updated_at_unix_ms_; }
    std::optional<protocol::TurnResult> last_turn_result() const { return last_turn_result_; }
    protocol::TurnStatus turn_status() const;

    core::errors::Result<protocol::ConversationSnapshot> snapshot(
        protocol::Revision rev, std::optional<std::uint64_t> before,
        std::optional<std::size_t> limit) const;

private:
    TurnStart start_turn(protocol::UserInput input, TurnRegistry& turns, std::int64_t now_ms);
    std::optional<TurnStart> start_next_queued(TurnRegistry& turns, std::int64_t now_ms);
    void stop_active_turn(TurnRegistry& turns, std::int64_t now_ms);
    void change_status(protocol::TaskStatus next, std::int64_t now_ms);
    void append(std::int64_t now_ms,
                std::variant<protocol::SystemEvent, protocol::UserEvent, protocol::AgentEvent> body);
    std::deque<QueuedPrompt>::iterator find_queued(protocol::PromptId id);

    protocol::TaskKey key_;
    std::string title_;
    bool title_from_message_ = false;
    protocol::TaskStatus task_status_ = protocol::TaskStatus::Todo;
    bool is_starred_ = false;
    std::int64_t created_at_unix_ms_ = 0;
    std::int64_t updated_at_unix_ms_ = 0;

    ConversationLog log_;

    std::deque<QueuedPrompt> queue_;
    bool queue_paused_ = false;
    protocol::PromptId next_prompt_id_ = 1;

    std::optional<TurnHandle> active_turn_;
    std::optional<std::int64_t> run_started_at_unix_ms_;
    std::optional<std::int64_t> run_finished_at_unix_ms_;
    std::optional<protocol::TurnResult> last_turn_result_;
};

// A message needs non-blank text or at least one attachment.
core::errors::Result<bool> validate_user_input(const protocol::UserInput& input);

// First line of `text`, trimmed, at most 80 characters; empty if blank.
std::string derive_title(const std::string& text);

}  // namespace turnstile::session

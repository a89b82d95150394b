#include "session/task_state.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/turn_activity.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using protocol::TaskStatus;
using protocol::UserInput;

namespace {

constexpr std::size_t kMaxTitleChars = 80;

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

ServiceError prompt_not_found(const protocol::PromptId id) {
    return ServiceError{ErrorCategory::State,
                        "Queued prompt not found: " + std::to_string(id),
                        "queued_prompt_not_found"};
}

}  // namespace

core::errors::Result<bool> validate_user_input(const UserInput& input) {
    if (is_blank(input.text) && input.attachments.empty()) {
        return ServiceError{ErrorCategory::Input,
                            "Message must contain text or attachments.",
                            "invalid_action"};
    }
    return true;
}

std::string derive_title(const std::string& text) {
    const auto line_end = text.find('\n');
    std::string line = text.substr(0, line_end);
    const auto begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = line.find_last_not_of(" \t\r");
    line = line.substr(begin, end - begin + 1);

    // Cut after 80 code points without splitting a UTF-8 sequence.
    std::size_t chars = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const auto byte = static_cast<unsigned char>(line[i]);
        if ((byte & 0xC0) != 0x80) {
            if (chars == kMaxTitleChars) {
                return line.substr(0, i);
            }
            ++chars;
        }
    }
    return line;
}

TaskState::TaskState(protocol::TaskKey key, const std::int64_t now_ms)
    : key_(key),
      title_("Task " + std::to_string(key.task_id)),
      created_at_unix_ms_(now_ms),
      updated_at_unix_ms_(now_ms) {
    append(now_ms, protocol::SystemEvent{protocol::TaskCreated{}});
}

void TaskState::append(
    const std::int64_t now_ms,
    std::variant<protocol::SystemEvent, protocol::UserEvent, protocol::AgentEvent> body) {
    log_.append(now_ms, std::move(body));
    updated_at_unix_ms_ = now_ms;
}

void TaskState::change_status(const TaskStatus next, const std::int64_t now_ms) {
    const TaskStatus prev = task_status_;
    task_status_ = next;
    append(now_ms, protocol::SystemEvent{protocol::TaskStatusChanged{prev, next}});
    LOG_INFO("TaskState: task " + protocol::to_string(key_) + " status " +
             protocol::to_string(prev) + " -> " + protocol::to_string(next));
}

bool TaskState::set_status(const TaskStatus next, const std::int64_t now_ms) {
    if (task_status_ == next) {
        return false;
    }
    change_status(next, now_ms);
    return true;
}

bool TaskState::set_starred(const bool starred, const std::int64_t now_ms) {
    if (is_starred_ == starred) {
        return false;
    }
    is_starred_ = starred;
    updated_at_unix_ms_ = now_ms;
    return true;
}

std::optional<std::uint64_t> TaskState::active_turn_id() const {
    if (!active_turn_.has_value()) {
        return std::nullopt;
    }
    return active_turn_->turn_id;
}

protocol::TurnStatus TaskState::turn_status() const {
    if (is_running()) {
        return protocol::TurnStatus::Running;
    }
    if (!queue_.empty()) {
        return queue_paused_ ? protocol::TurnStatus::Paused
                             : protocol::TurnStatus::Awaiting;
    }
    return protocol::TurnStatus::Idle;
}

TurnStart TaskState::start_turn(UserInput input, TurnRegistry& turns,
                                const std::int64_t now_ms) {
    if (task_status_ == TaskStatus::Todo) {
        change_status(TaskStatus::Iterating, now_ms);
    }
    if (!title_from_message_) {
        std::string derived = derive_title(input.text);
        if (!derived.empty()) {
            title_ = std::move(derived);
            title_from_message_ = true;
        }
    }
    append(now_ms, protocol::UserEvent{protocol::UserMessage{input.text, input.attachments}});

    const TurnHandle handle = turns.start_turn(key_);
    active_turn_ = handle;
    run_started_at_unix_ms_ = now_ms;
    run_finished_at_unix_ms_.reset();

    TurnStart start;
    start.key = key_;
    start.turn_id = handle.turn_id;
    start.input = std::move(input);
    start.cancel_token = handle.cancel_token;
    return start;
}

std::optional<TurnStart> TaskState::start_next_queued(TurnRegistry& turns,
                                                      const std::int64_t now_ms) {
    if (is_running() || queue_paused_ || queue_.empty()) {
        return std::nullopt;
    }
    QueuedPrompt prompt = std::move(queue_.front());
    queue_.pop_front();
    LOG_DEBUG("TaskState: task " + protocol::to_string(key_) + " dequeued prompt " +
              std::to_string(prompt.id));
    return start_turn(std::move(prompt.input), turns, now_ms);
}

void TaskState::stop_active_turn(TurnRegistry& turns, const std::int64_t now_ms) {
    const std::uint64_t turn_id = active_turn_->turn_id;
    append(now_ms, protocol::AgentEvent{protocol::TurnCanceled{}});

    auto cancelled = turns.cancel_turn(turn_id);
    if (core::errors::is_error(cancelled)) {
        const auto& err = core::errors::get_error(cancelled);
        LOG_WARN("TaskState: cancel of turn " + std::to_string(turn_id) + " [" +
                 err.code + "]: " + err.message);
        active_turn_->cancel_token->store(true);
    }

    active_turn_.reset();
    run_finished_at_unix_ms_ = now_ms;
    last_turn_result_ = protocol::TurnResult::Failed;
    if (!queue_.empty()) {
        queue_paused_ = true;
    }
}

core::errors::Result<std::optional<TurnStart>> TaskState::send_message(
    UserInput input, TurnRegistry& turns, const std::int64_t now_ms) {
    auto valid = validate_user_input(input);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    if (is_running()) {
        queue_.push_back(QueuedPrompt{next_prompt_id_++, std::move(input)});
        updated_at_unix_ms_ = now_ms;
        return std::optional<TurnStart>{};
    }

    // A paused, non-empty queue stays paused; the new text goes first.
    if (queue_.empty()) {
        queue_paused_ = false;
    }
    return std::optional<TurnStart>{start_turn(std::move(input), turns, now_ms)};
}

core::errors::Result<std::optional<TurnStart>> TaskState::queue_message(
    UserInput input, TurnRegistry& turns, const std::int64_t now_ms) {
    auto valid = validate_user_input(input);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    queue_.push_back(QueuedPrompt{next_prompt_id_++, std::move(input)});
    updated_at_unix_ms_ = now_ms;
    return start_next_queued(turns, now_ms);
}

core::errors::Result<TurnStart> TaskState::cancel_and_send(UserInput input,
                                                           TurnRegistry& turns,
                                                           const std::int64_t now_ms) {
    auto valid = validate_user_input(input);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    if (is_running()) {
        stop_active_turn(turns, now_ms);
    }
    if (queue_.empty()) {
        queue_paused_ = false;
    }
    return start_turn(std::move(input), turns, now_ms);
}

core::errors::Result<bool> TaskState::cancel_turn(TurnRegistry& turns,
                                                  const std::int64_t now_ms) {
    if (!is_running()) {
        return ServiceError{ErrorCategory::State,
                            "No running turn for task " + protocol::to_string(key_),
                            "turn_not_running"};
    }
    stop_active_turn(turns, now_ms);
    return true;
}

bool TaskState::record_agent_event(const std::uint64_t turn_id, protocol::AgentEvent event,
                                   const std::int64_t now_ms) {
    if (!active_turn_.has_value() || active_turn_->turn_id != turn_id) {
        return false;
    }
    append(now_ms, std::move(event));
    return true;
}

Transition TaskState::finish_turn(const std::uint64_t turn_id,
                                  const runtime::TurnCompletion& completion, TurnRegistry& turns,
                                  const std::int64_t now_ms) {
    Transition transition;
    if (!active_turn_.has_value() || active_turn_->turn_id != turn_id) {
        return transition;
    }

    core::errors::Result<TurnState> marked = TurnState::Running;
    if (completion.success) {
        append(now_ms, protocol::AgentEvent{protocol::TurnDuration{completion.duration_ms}});
        last_turn_result_ = protocol::TurnResult::Completed;
        marked = turns.mark_completed(turn_id);
    } else {
        append(now_ms, protocol::AgentEvent{protocol::TurnError{completion.error_message}});
        last_turn_result_ = protocol::TurnResult::Failed;
        marked = turns.mark_failed(turn_id, completion.error_message);
    }
    if (core::errors::is_error(marked)) {
        const auto& err = core::errors::get_error(marked);
        LOG_WARN("TaskState: finishing turn " + std::to_string(turn_id) + " [" + err.code +
                 "]: " + err.message);
    }

    active_turn_.reset();
    run_finished_at_unix_ms_ = now_ms;
    transition.changed = true;
    transition.start = start_next_queued(turns, now_ms);
    return transition;
}

std::deque<QueuedPrompt>::iterator TaskState::find_queued(const protocol::PromptId id) {
    return std::find_if(queue_.begin(), queue_.end(),
                        [id](const QueuedPrompt& prompt) { return prompt.id == id; });
}

core::errors::Result<bool> TaskState::remove_queued(const protocol::PromptId id,
                                                    const std::int64_t now_ms) {
    auto it = find_queued(id);
    if (it == queue_.end()) {
        return prompt_not_found(id);
    }
    queue_.erase(it);
    if (queue_.empty()) {
        queue_paused_ = false;
    }
    updated_at_unix_ms_ = now_ms;
    return true;
}

core::errors::Result<bool> TaskState::reorder_queued(const protocol::PromptId active_id,
                                                     const protocol::PromptId over_id,
                                                     const std::int64_t now_ms) {
    auto active = find_queued(active_id);
    if (active == queue_.end()) {
        return prompt_not_found(active_id);
    }
    auto over = find_queued(over_id);
    if (over == queue_.end()) {
        return prompt_not_found(over_id);
    }
    if (active_id == over_id) {
        return false;
    }

    // List-move: the active item lands at the index the over item had.
    const auto to = static_cast<std::size_t>(over - queue_.begin());
    QueuedPrompt moved = std::move(*active);
    queue_.erase(active);
    queue_.insert(queue_.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    updated_at_unix_ms_ = now_ms;
    return true;
}

core::errors::Result<bool> TaskState::update_queued(const protocol::PromptId id,
                                                    UserInput input,
                                                    const std::int64_t now_ms) {
    auto valid = validate_user_input(input);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    auto it = find_queued(id);
    if (it == queue_.end()) {
        return prompt_not_found(id);
    }
    it->input = std::move(input);
    updated_at_unix_ms_ = now_ms;
    return true;
}

bool TaskState::clear_queue(const std::int64_t now_ms) {
    if (queue_.empty() && !queue_paused_) {
        return false;
    }
    queue_.clear();
    queue_paused_ = false;
    updated_at_unix_ms_ = now_ms;
    return true;
}

Transition TaskState::resume_queue(TurnRegistry& turns, const std::int64_t now_ms) {
    Transition transition;
    if (!queue_paused_) {
        return transition;
    }
    queue_paused_ = false;
    updated_at_unix_ms_ = now_ms;
    transition.changed = true;
    transition.start = start_next_queued(turns, now_ms);
    return transition;
}

void TaskState::record_terminal_started(const protocol::TerminalCommandStarted& started,
                                        const std::int64_t now_ms) {
    append(now_ms, protocol::UserEvent{started});
}

void TaskState::record_terminal_finished(const protocol::TerminalCommandFinished& finished,
                                         const std::int64_t now_ms) {
    append(now_ms, protocol::UserEvent{finished});
}

core::errors::Result<protocol::ConversationSnapshot> TaskState::snapshot(
    const protocol::Revision rev, const std::optional<std::uint64_t> before,
    const std::optional<std::size_t> limit) const {
    auto page = log_.page(before, limit);
    if (core::errors::is_error(page)) {
        return core::errors::get_error(page);
    }
    LogPage& window = std::get<LogPage>(page);

    protocol::ConversationSnapshot snapshot;
    snapshot.rev = rev;
    snapshot.workdir_id = key_.workdir_id;
    snapshot.task_id = key_.task_id;
    snapshot.title = title_;
    snapshot.task_status = task_status_;
    snapshot.run_status = is_running() ? protocol::OperationStatus::Running
                                       : protocol::OperationStatus::Idle;
    snapshot.run_started_at_unix_ms = run_started_at_unix_ms_;
    snapshot.run_finished_at_unix_ms = run_finished_at_unix_ms_;
    snapshot.entries = std::move(window.entries);
    snapshot.entries_total = window.entries_total;
    snapshot.entries_start = window.entries_start;
    for (const auto& prompt : queue_) {
        snapshot.pending_prompts.push_back(
            protocol::QueuedPromptSnapshot{prompt.id, prompt.input.text,
                                           prompt.input.attachments});
    }
    snapshot.queue_paused = queue_paused_;
    snapshot.latest_turn =
        fold_latest_turn(log_.entries(), is_running(), queue_paused_, queue_.size());
    return snapshot;
}

}  // namespace turnstile::session

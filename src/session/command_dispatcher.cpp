#include "session/command_dispatcher.hpp"

#include <utility>
#include "core/config/tokens.hpp"
#include "core/encoding/encoding.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using protocol::Revision;
using protocol::TaskKey;

namespace {

// Routes one turn's executor output back into the dispatcher.
class DispatcherSink : public runtime::TurnSink {
public:
    DispatcherSink(CommandDispatcher& dispatcher, TaskKey key, std::uint64_t turn_id)
        : dispatcher_(dispatcher), key_(key), turn_id_(turn_id) {}

    void on_event(const protocol::AgentEvent& event) override {
        dispatcher_.on_agent_event(key_, turn_id_, event);
    }

    void on_finished(const runtime::TurnCompletion& completion) override {
        dispatcher_.on_turn_finished(key_, turn_id_, completion);
    }

private:
    CommandDispatcher& dispatcher_;
    TaskKey key_;
    std::uint64_t turn_id_;
};

ServiceError task_not_found(const TaskKey& key) {
    return ServiceError{ErrorCategory::State, "Task not found: " + protocol::to_string(key),
                        "task_not_found"};
}

}  // namespace

CommandDispatcher::CommandDispatcher(TaskStore& store, RevisionStore& revisions, EventHub& hub,
                                     TurnRegistry& turns, runtime::TurnExecutor& executor,
                                     DispatcherServices services, DispatcherOptions options)
    : store_(store),
      revisions_(revisions),
      hub_(hub),
      turns_(turns),
      executor_(executor),
      services_(services),
      options_(options) {}

core::errors::Result<Revision> CommandDispatcher::apply(const std::string& request_id,
                                                        const protocol::ClientAction& action) {
    LOG_DEBUG("CommandDispatcher: " + protocol::action_name(action) + " (request " +
              request_id + ")");
    auto result = std::visit(
        [this, &request_id](const auto& concrete) { return handle(request_id, concrete); },
        action);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        LOG_INFO("CommandDispatcher: " + protocol::action_name(action) + " rejected [" +
                 err.code + "]: " + err.message);
    }
    return result;
}

template <typename Fn>
core::errors::Result<Revision> CommandDispatcher::mutate_task(const TaskKey& key,
                                                              const bool create_if_missing,
                                                              Fn&& mutate) {
    const std::int64_t now = core::config::now_unix_ms();
    std::shared_ptr<TaskSlot> slot;
    bool created = false;
    if (create_if_missing) {
        auto found = store_.get_or_create_task(key, now);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        slot = core::errors::get_value(found).first;
        created = core::errors::get_value(found).second;
    } else {
        auto found = store_.require_task(key);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        slot = core::errors::get_value(found);
    }

    std::optional<TurnStart> start;
    Revision rev = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const std::size_t journal_from = created ? 0 : slot->state.log().size();
        core::errors::Result<Transition> transition = mutate(slot->state, now);
        if (core::errors::is_error(transition)) {
            // Callers validate before creating, so this only fires on
            // existing tasks; a task made here is still published.
            if (created) {
                commit_locked(slot->state, journal_from);
            }
            return core::errors::get_error(transition);
        }
        Transition& value = std::get<Transition>(transition);
        if (value.changed || created) {
            rev = commit_locked(slot->state, journal_from);
        } else {
            rev = revisions_.current();
        }
        start = std::move(value.start);
    }

    if (start.has_value()) {
        launch_turn(start.value());
    }
    return rev;
}

Revision CommandDispatcher::commit_locked(const TaskState& state, const std::size_t journal_from,
                                          std::vector<protocol::ServerEvent> extra) {
    if (services_.journal != nullptr) {
        const auto& entries = state.log().entries();
        for (std::size_t i = journal_from; i < entries.size(); ++i) {
            auto written = services_.journal->write_entry(state.key(), entries[i]);
            if (core::errors::is_error(written)) {
                LOG_ERROR("CommandDispatcher: journal write failed: " +
                          core::errors::get_error(written).message);
                break;
            }
        }
    }

    const protocol::TaskSummary summary = store_.summarize(state);
    return revisions_.commit([&](const Revision rev) {
        store_.update_summary(summary);

        std::vector<protocol::ServerEvent> events;
        auto snapshot = state.snapshot(rev, std::nullopt, options_.conversation_event_window);
        if (core::errors::is_error(snapshot)) {
            LOG_ERROR("CommandDispatcher: conversation snapshot failed: " +
                      core::errors::get_error(snapshot).message);
        } else {
            events.emplace_back(
                protocol::ConversationChangedEvent{core::errors::get_value(snapshot)});
        }
        events.emplace_back(protocol::TaskSummariesChangedEvent{store_.summaries()});
        const protocol::WorkdirId workdir_id = state.key().workdir_id;
        events.emplace_back(protocol::WorkdirTasksChangedEvent{
            workdir_id, store_.workdir_summaries(workdir_id)});
        for (auto& event : extra) {
            events.push_back(std::move(event));
        }

        for (auto& event : events) {
            auto payload = std::make_shared<const std::string>(
                protocol::codec::encode(protocol::EventMessage{rev, std::move(event)}));
            hub_.publish(rev, std::move(payload));
        }
        LOG_DEBUG("CommandDispatcher: committed rev " + std::to_string(rev) + " for task " +
                  protocol::to_string(state.key()));
    });
}

core::errors::Result<protocol::UserInput> CommandDispatcher::prepare_input(
    const protocol::WorkdirId workdir_id, protocol::UserInput input) const {
    auto valid = validate_user_input(input);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    for (auto& attachment : input.attachments) {
        if (services_.attachments == nullptr) {
            return ServiceError{ErrorCategory::State,
                                "Attachment not found: " + attachment.id,
                                "attachment_not_found"};
        }
        auto stored = services_.attachments->find(workdir_id, attachment.id);
        if (core::errors::is_error(stored)) {
            return core::errors::get_error(stored);
        }
        attachment = core::errors::get_value(stored).ref;
    }
    return input;
}

void CommandDispatcher::launch_turn(const TurnStart& start) {
    if (stopping_.load()) {
        on_turn_finished(start.key, start.turn_id,
                         runtime::TurnCompletion{false, "server is shutting down", 0});
        return;
    }
    const auto workdir = store_.find_workdir(start.key.workdir_id);
    if (!workdir.has_value()) {
        on_turn_finished(start.key, start.turn_id,
                         runtime::TurnCompletion{false, "workdir is no longer registered", 0});
        return;
    }

    runtime::TurnRequest request;
    request.key = start.key;
    request.turn_id = start.turn_id;
    request.workdir = workdir->path;
    request.prompt = start.input.text;
    request.attachments = start.input.attachments;
    if (services_.attachments != nullptr) {
        for (const auto& attachment : start.input.attachments) {
            auto stored = services_.attachments->find(start.key.workdir_id, attachment.id);
            if (core::errors::is_error(stored)) {
                LOG_WARN("CommandDispatcher: attachment " + attachment.id +
                         " vanished before turn " + std::to_string(start.turn_id));
                continue;
            }
            request.attachment_paths.push_back(core::errors::get_value(stored).path);
        }
    }

    executor_.start(request, start.cancel_token,
                    std::make_shared<DispatcherSink>(*this, start.key, start.turn_id));
}

void CommandDispatcher::on_agent_event(const TaskKey& key, const std::uint64_t turn_id,
                                       const protocol::AgentEvent& event) {
    auto slot = store_.find_task(key);
    if (!slot) {
        return;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    const std::size_t journal_from = slot->state.log().size();
    if (!slot->state.record_agent_event(turn_id, event, core::config::now_unix_ms())) {
        LOG_DEBUG("CommandDispatcher: dropped event of stale turn " + std::to_string(turn_id));
        return;
    }
    commit_locked(slot->state, journal_from);
}

void CommandDispatcher::on_turn_finished(const TaskKey& key, const std::uint64_t turn_id,
                                         const runtime::TurnCompletion& completion) {
    auto slot = store_.find_task(key);
    if (!slot) {
        return;
    }

    std::optional<TurnStart> next;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const std::size_t journal_from = slot->state.log().size();
        Transition transition =
            slot->state.finish_turn(turn_id, completion, turns_, core::config::now_unix_ms());
        if (!transition.changed) {
            LOG_DEBUG("CommandDispatcher: ignored completion of stale turn " +
                      std::to_string(turn_id));
            return;
        }

        std::vector<protocol::ServerEvent> extra;
        if (!completion.success) {
            LOG_WARN("CommandDispatcher: task " + protocol::to_string(key) + " turn " +
                     std::to_string(turn_id) + " failed: " + completion.error_message);
            extra.emplace_back(protocol::ToastEvent{"Turn failed: " + completion.error_message});
        }
        commit_locked(slot->state, journal_from, std::move(extra));
        next = std::move(transition.start);
    }

    if (next.has_value()) {
        launch_turn(next.value());
    }
}

void CommandDispatcher::shutdown() {
    stopping_.store(true);
    const std::size_t cancelled = turns_.cancel_all();
    if (cancelled > 0) {
        LOG_INFO("CommandDispatcher: signalled " + std::to_string(cancelled) +
                 " running turn(s) to stop");
    }
}

// --- actions ---

core::errors::Result<Revision> CommandDispatcher::handle(const std::string& request_id,
                                                         const protocol::CreateTask& action) {
    auto created = store_.create_task(action.workdir_id, core::config::now_unix_ms());
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    const auto& slot = core::errors::get_value(created);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const TaskKey key = slot->state.key();
    std::vector<protocol::ServerEvent> extra;
    extra.emplace_back(protocol::TaskCreatedEvent{request_id, key.workdir_id, key.task_id});
    return commit_locked(slot->state, 0, std::move(extra));
}

core::errors::Result<Revision> CommandDispatcher::handle(const std::string&,
                                                         const protocol::TaskStatusSet& action) {
    return mutate_task(action.key, false,
                       [&action](TaskState& state,
                                 const std::int64_t now) -> core::errors::Result<Transition> {
                           return Transition{state.set_status(action.status, now), std::nullopt};
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(const std::string&,
                                                         const protocol::TaskStarSet& action) {
    return mutate_task(action.key, false,
                       [&action](TaskState& state,
                                 const std::int64_t now) -> core::errors::Result<Transition> {
                           return Transition{state.set_starred(action.starred, now),
                                             std::nullopt};
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::SendAgentMessage& action) {
    auto input = prepare_input(action.key.workdir_id, action.input);
    if (core::errors::is_error(input)) {
        return core::errors::get_error(input);
    }
    return mutate_task(
        action.key, true,
        [this, &input](TaskState& state,
                       const std::int64_t now) -> core::errors::Result<Transition> {
            auto sent = state.send_message(std::get<protocol::UserInput>(std::move(input)),
                                           turns_, now);
            if (core::errors::is_error(sent)) {
                return core::errors::get_error(sent);
            }
            return Transition{true, core::errors::get_value(sent)};
        });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::QueueAgentMessage& action) {
    auto input = prepare_input(action.key.workdir_id, action.input);
    if (core::errors::is_error(input)) {
        return core::errors::get_error(input);
    }
    return mutate_task(
        action.key, true,
        [this, &input](TaskState& state,
                       const std::int64_t now) -> core::errors::Result<Transition> {
            auto queued = state.queue_message(std::get<protocol::UserInput>(std::move(input)),
                                              turns_, now);
            if (core::errors::is_error(queued)) {
                return core::errors::get_error(queued);
            }
            return Transition{true, core::errors::get_value(queued)};
        });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::CancelAndSendAgentMessage& action) {
    auto input = prepare_input(action.key.workdir_id, action.input);
    if (core::errors::is_error(input)) {
        return core::errors::get_error(input);
    }
    return mutate_task(
        action.key, true,
        [this, &input](TaskState& state,
                       const std::int64_t now) -> core::errors::Result<Transition> {
            auto started = state.cancel_and_send(
                std::get<protocol::UserInput>(std::move(input)), turns_, now);
            if (core::errors::is_error(started)) {
                return core::errors::get_error(started);
            }
            return Transition{true, core::errors::get_value(started)};
        });
}

core::errors::Result<Revision> CommandDispatcher::handle(const std::string&,
                                                         const protocol::CancelAgentTurn& action) {
    return mutate_task(action.key, false,
                       [this](TaskState& state,
                              const std::int64_t now) -> core::errors::Result<Transition> {
                           auto cancelled = state.cancel_turn(turns_, now);
                           if (core::errors::is_error(cancelled)) {
                               return core::errors::get_error(cancelled);
                           }
                           return Transition{true, std::nullopt};
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::RemoveQueuedPrompt& action) {
    return mutate_task(action.key, false,
                       [&action](TaskState& state,
                                 const std::int64_t now) -> core::errors::Result<Transition> {
                           auto removed = state.remove_queued(action.prompt_id, now);
                           if (core::errors::is_error(removed)) {
                               return core::errors::get_error(removed);
                           }
                           return Transition{core::errors::get_value(removed), std::nullopt};
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::ReorderQueuedPrompt& action) {
    return mutate_task(action.key, false,
                       [&action](TaskState& state,
                                 const std::int64_t now) -> core::errors::Result<Transition> {
                           auto moved =
                               state.reorder_queued(action.active_id, action.over_id, now);
                           if (core::errors::is_error(moved)) {
                               return core::errors::get_error(moved);
                           }
                           return Transition{core::errors::get_value(moved), std::nullopt};
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::UpdateQueuedPrompt& action) {
    auto input = prepare_input(action.key.workdir_id, action.input);
    if (core::errors::is_error(input)) {
        return core::errors::get_error(input);
    }
    return mutate_task(
        action.key, false,
        [&action, &input](TaskState& state,
                          const std::int64_t now) -> core::errors::Result<Transition> {
            auto updated = state.update_queued(
                action.prompt_id, std::get<protocol::UserInput>(std::move(input)), now);
            if (core::errors::is_error(updated)) {
                return core::errors::get_error(updated);
            }
            return Transition{core::errors::get_value(updated), std::nullopt};
        });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::ClearQueuedPrompts& action) {
    return mutate_task(action.key, false,
                       [](TaskState& state,
                          const std::int64_t now) -> core::errors::Result<Transition> {
                           return Transition{state.clear_queue(now), std::nullopt};
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::ResumeQueuedPrompts& action) {
    return mutate_task(action.key, false,
                       [this](TaskState& state,
                              const std::int64_t now) -> core::errors::Result<Transition> {
                           return state.resume_queue(turns_, now);
                       });
}

core::errors::Result<Revision> CommandDispatcher::handle(
    const std::string&, const protocol::TerminalCommandStart& action) {
    if (services_.terminals == nullptr) {
        return ServiceError{ErrorCategory::Execution, "Terminals are not available.",
                            "terminal_unavailable"};
    }
    if (action.command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ServiceError{ErrorCategory::Input, "Command cannot be empty.", "invalid_action"};
    }
    const auto workdir = store_.find_workdir(action.key.workdir_id);
    if (!workdir.has_value()) {
        return ServiceError{ErrorCategory::State,
                            "Workdir not found: " + std::to_string(action.key.workdir_id),
                            "workdir_not_found"};
    }

    protocol::TerminalCommandStarted started;
    started.id = core::config::generate_token("term_", 12);
    started.command = action.command;
    started.reconnect = action.reconnect.has_value() && !action.reconnect->empty()
                            ? action.reconnect.value()
                            : core::config::generate_token("", 12);

    const auto existing = services_.terminals->find(action.key, started.reconnect);
    if (existing && existing->running()) {
        return ServiceError{ErrorCategory::State,
                            "Terminal " + existing->id() + " is still running.",
                            "terminal_busy"};
    }

    // Recorded before the process exists so its finish entry always follows.
    auto recorded = mutate_task(
        action.key, true,
        [&started](TaskState& state,
                   const std::int64_t now) -> core::errors::Result<Transition> {
            state.record_terminal_started(started, now);
            return Transition{true, std::nullopt};
        });
    if (core::errors::is_error(recorded)) {
        return recorded;
    }

    const TaskKey key = action.key;
    auto launched = services_.terminals->start_command(
        key, started.reconnect, started.command, workdir->path,
        [this, key, started](const std::string& history, const int exit_code) {
            finish_terminal_command(key, started, history, exit_code);
        });
    if (core::errors::is_error(launched)) {
        const auto& err = core::errors::get_error(launched);
        LOG_WARN("CommandDispatcher: terminal command " + started.id + " failed to start [" +
                 err.code + "]: " + err.message);
        return finish_terminal_command(key, started, err.message + "\r\n", -1);
    }
    return recorded;
}

Revision CommandDispatcher::finish_terminal_command(
    const TaskKey& key, const protocol::TerminalCommandStarted& started,
    const std::string& history, const int exit_code) {
    LOG_INFO("CommandDispatcher: terminal command " + started.id + " for task " +
             protocol::to_string(key) + " exited with code " + std::to_string(exit_code));
    auto slot = store_.find_task(key);
    if (!slot) {
        return revisions_.current();
    }

    protocol::TerminalCommandFinished finished;
    finished.id = started.id;
    finished.command = started.command;
    finished.reconnect = started.reconnect;
    finished.output_base64 = core::encoding::encode_base64(history);
    finished.output_byte_len = history.size();

    std::lock_guard<std::mutex> lock(slot->mutex);
    const std::size_t journal_from = slot->state.log().size();
    slot->state.record_terminal_finished(finished, core::config::now_unix_ms());
    return commit_locked(slot->state, journal_from);
}

// --- reads ---

protocol::AppSnapshot CommandDispatcher::app_snapshot() const {
    return revisions_.read_consistent([this](const Revision rev) {
        protocol::AppSnapshot snapshot;
        snapshot.rev = rev;
        snapshot.workdirs = store_.workdir_snapshots();
        snapshot.tasks = store_.summaries();
        return snapshot;
    });
}

protocol::TasksSnapshot CommandDispatcher::tasks_snapshot(const TaskFilter& filter) const {
    return revisions_.read_consistent([this, &filter](const Revision rev) {
        return protocol::TasksSnapshot{rev, store_.summaries(filter)};
    });
}

core::errors::Result<protocol::WorkdirTasksSnapshot> CommandDispatcher::workdir_tasks_snapshot(
    const protocol::WorkdirId workdir_id) const {
    if (!store_.find_workdir(workdir_id).has_value()) {
        return ServiceError{ErrorCategory::State,
                            "Workdir not found: " + std::to_string(workdir_id),
                            "workdir_not_found"};
    }
    return revisions_.read_consistent([this, workdir_id](const Revision rev) {
        return protocol::WorkdirTasksSnapshot{rev, workdir_id,
                                              store_.workdir_summaries(workdir_id)};
    });
}

core::errors::Result<protocol::ConversationSnapshot> CommandDispatcher::conversation_snapshot(
    const TaskKey& key, const std::optional<std::uint64_t> before,
    const std::optional<std::size_t> limit) const {
    auto slot = store_.find_task(key);
    if (!slot) {
        return task_not_found(key);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state.snapshot(revisions_.current(), before, limit);
}

}  // namespace turnstile::session

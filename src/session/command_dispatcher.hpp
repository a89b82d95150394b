#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/snapshot_contract.hpp"
#include "pty/pty_session.hpp"
#include "runtime/turn_executor.hpp"
#include "session/attachment_store.hpp"
#include "session/conversation_journal.hpp"
#include "session/event_hub.hpp"
#include "session/revision_store.hpp"
#include "session/task_store.hpp"
#include "session/turn_registry.hpp"

namespace turnstile::session {

struct DispatcherOptions {
    // Most recent entries carried by a broadcast conversation snapshot.
    std::size_t conversation_event_window = 200;
};

// Optional collaborators; a null member disables the feature.
struct DispatcherServices {
    const AttachmentStore* attachments = nullptr;
    pty::PtyRegistry* terminals = nullptr;
    ConversationJournal* journal = nullptr;
};

// Applies client actions and executor callbacks to tasks. This is the only
// code that commits a revision: each externally visible change is one
// commit, whose events are serialized once and published in revision order.
class CommandDispatcher {
public:
    CommandDispatcher(TaskStore& store, RevisionStore& revisions, EventHub& hub,
                      TurnRegistry& turns, runtime::TurnExecutor& executor,
                      DispatcherServices services = {}, DispatcherOptions options = {});

    // Revision after the action; unchanged for a no-op.
    core::errors::Result<protocol::Revision> apply(const std::string& request_id,
                                                   const protocol::ClientAction& action);

    void on_agent_event(const protocol::TaskKey& key, std::uint64_t turn_id,
                        const protocol::AgentEvent& event);
    void on_turn_finished(const protocol::TaskKey& key, std::uint64_t turn_id,
                          const runtime::TurnCompletion& completion);

    // Signals every running turn to stop; later turns fail without being
    // handed to the executor. Entries are left untouched.
    void shutdown();

    protocol::AppSnapshot app_snapshot() const;
    protocol::TasksSnapshot tasks_snapshot(const TaskFilter& filter) const;
    core::errors::Result<protocol::WorkdirTasksSnapshot> workdir_tasks_snapshot(
        protocol::WorkdirId workdir_id) const;
    core::errors::Result<protocol::ConversationSnapshot> conversation_snapshot(
        const protocol::TaskKey& key, std::optional<std::uint64_t> before,
        std::optional<std::size_t> limit) const;

private:
    template <typename Fn>
    core::errors::Result<protocol::Revision> mutate_task(const protocol::TaskKey& key,
                                                         bool create_if_missing, Fn&& mutate);

    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::CreateTask& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::TaskStatusSet& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::TaskStarSet& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::SendAgentMessage& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::QueueAgentMessage& action);
    core::errors::Result<protocol::Revision> handle(
        const std::string& request_id, const protocol::CancelAndSendAgentMessage& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::CancelAgentTurn& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::RemoveQueuedPrompt& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::ReorderQueuedPrompt& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::UpdateQueuedPrompt& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::ClearQueuedPrompts& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::ResumeQueuedPrompts& action);
    core::errors::Result<protocol::Revision> handle(const std::string& request_id,
                                                    const protocol::TerminalCommandStart& action);

    // Rejects empty messages, then replaces each referenced attachment with
    // the stored reference. Runs before any task is touched.
    core::errors::Result<protocol::UserInput> prepare_input(
        protocol::WorkdirId workdir_id, protocol::UserInput input) const;

    // Caller holds the task's mutex. Journals entries from `journal_from`
    // on, refreshes the summary cache and publishes the task's events
    // followed by `extra`.
    protocol::Revision commit_locked(const TaskState& state, std::size_t journal_from,
                                     std::vector<protocol::ServerEvent> extra = {});

    void launch_turn(const TurnStart& start);
    protocol::Revision finish_terminal_command(const protocol::TaskKey& key,
                                               const protocol::TerminalCommandStarted& started,
                                               const std::string& history, int exit_code);

    TaskStore& store_;
    RevisionStore& revisions_;
    EventHub& hub_;
    TurnRegistry& turns_;
    runtime::TurnExecutor& executor_;
    DispatcherServices services_;
    DispatcherOptions options_;
    std::atomic_bool stopping_{false};
};

}  // namespace turnstile::session

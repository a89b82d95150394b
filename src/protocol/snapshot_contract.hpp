#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/conversation_contract.hpp"
#include "protocol/task_contract.hpp"

namespace turnstile::protocol {

struct QueuedPromptSnapshot {
    PromptId id = 0;
    std::string text;
    std::vector<AttachmentRef> attachments;
};

enum class TurnOutcome {
    Running,
    Completed,
    Canceled,
    Failed
};

// Folded view of the entries that follow the most recent user message.
struct TurnActivity {
    std::size_t steps = 0;
    TurnOutcome outcome = TurnOutcome::Completed;
    std::string label;
    bool resumable = false;
};

struct ConversationSnapshot {
    Revision rev = 0;
    WorkdirId workdir_id = 0;
    TaskId task_id = 0;
    std::string title;
    TaskStatus task_status = TaskStatus::Todo;
    OperationStatus run_status = OperationStatus::Idle;
    std::optional<std::int64_t> run_started_at_unix_ms;
    std::optional<std::int64_t> run_finished_at_unix_ms;
    std::vector<ConversationEntry> entries;
    std::uint64_t entries_total = 0;
    std::uint64_t entries_start = 0;
    std::vector<QueuedPromptSnapshot> pending_prompts;
    bool queue_paused = false;
    std::optional<TurnActivity> latest_turn;
};

struct TaskSummary {
    std::string project_id;
    WorkdirId workdir_id = 0;
    TaskId task_id = 0;
    std::string title;
    std::int64_t created_at_unix_seconds = 0;
    std::int64_t updated_at_unix_seconds = 0;
    std::string workdir_name;
    WorkdirStatus workdir_status = WorkdirStatus::Active;
    OperationStatus agent_run_status = OperationStatus::Idle;
    TaskStatus task_status = TaskStatus::Todo;
    TurnStatus turn_status = TurnStatus::Idle;
    std::optional<TurnResult> last_turn_result;
    bool is_starred = false;
};

struct TasksSnapshot {
    Revision rev = 0;
    std::vector<TaskSummary> tasks;
};

struct WorkdirTasksSnapshot {
    Revision rev = 0;
    WorkdirId workdir_id = 0;
    std::vector<TaskSummary> tasks;
};

struct WorkdirSnapshot {
    WorkdirId id = 0;
    std::string project_id;
    std::string name;
    std::string path;
    WorkdirStatus status = WorkdirStatus::Active;
    OperationStatus agent_run_status = OperationStatus::Idle;
    std::size_t task_count = 0;
};

struct AppSnapshot {
    Revision rev = 0;
    std::vector<WorkdirSnapshot> workdirs;
    std::vector<TaskSummary> tasks;
};

inline std::string to_string(const TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::Running:
            return "running";
        case TurnOutcome::Completed:
            return "completed";
        case TurnOutcome::Canceled:
            return "canceled";
        case TurnOutcome::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace turnstile::protocol

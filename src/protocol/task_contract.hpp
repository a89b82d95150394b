#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace turnstile::protocol {

using WorkdirId = std::uint64_t;
using TaskId = std::uint64_t;
using Revision = std::uint64_t;
using PromptId = std::uint64_t;

constexpr std::uint32_t kProtocolVersion = 1;

struct TaskKey {
    WorkdirId workdir_id = 0;
    TaskId task_id = 0;

    bool operator==(const TaskKey& other) const {
        return workdir_id == other.workdir_id && task_id == other.task_id;
    }
    bool operator!=(const TaskKey& other) const { return !(*this == other); }
    bool operator<(const TaskKey& other) const {
        return std::tie(workdir_id, task_id) <
               std::tie(other.workdir_id, other.task_id);
    }
};

inline std::string to_string(const TaskKey& key) {
    return "w" + std::to_string(key.workdir_id) + "/t" +
           std::to_string(key.task_id);
}

enum class TaskStatus {
    Backlog,
    Todo,
    Iterating,
    Validating,
    Done,
    Canceled
};

enum class OperationStatus {
    Idle,
    Running
};

enum class TurnStatus {
    Idle,
    Running,
    Awaiting,
    Paused
};

enum class TurnResult {
    Completed,
    Failed
};

enum class WorkdirStatus {
    Active,
    Archived
};

inline std::string to_string(const TaskStatus status) {
    switch (status) {
        case TaskStatus::Backlog:
            return "backlog";
        case TaskStatus::Todo:
            return "todo";
        case TaskStatus::Iterating:
            return "iterating";
        case TaskStatus::Validating:
            return "validating";
        case TaskStatus::Done:
            return "done";
        case TaskStatus::Canceled:
            return "canceled";
        default:
            return "unknown";
    }
}

// Accepts canonical names and the legacy aliases `in_progress` and
// `in_review`. Matching is case-insensitive and ignores surrounding spaces.
inline std::optional<TaskStatus> parse_task_status(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    std::string lowered = value.substr(begin, end - begin + 1);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });

    if (lowered == "backlog") return TaskStatus::Backlog;
    if (lowered == "todo") return TaskStatus::Todo;
    if (lowered == "iterating" || lowered == "in_progress") return TaskStatus::Iterating;
    if (lowered == "validating" || lowered == "in_review") return TaskStatus::Validating;
    if (lowered == "done") return TaskStatus::Done;
    if (lowered == "canceled") return TaskStatus::Canceled;
    return std::nullopt;
}

inline std::string to_string(const OperationStatus status) {
    switch (status) {
        case OperationStatus::Idle:
            return "idle";
        case OperationStatus::Running:
            return "running";
        default:
            return "unknown";
    }
}

inline std::string to_string(const TurnStatus status) {
    switch (status) {
        case TurnStatus::Idle:
            return "idle";
        case TurnStatus::Running:
            return "running";
        case TurnStatus::Awaiting:
            return "awaiting";
        case TurnStatus::Paused:
            return "paused";
        default:
            return "unknown";
    }
}

inline std::string to_string(const TurnResult result) {
    switch (result) {
        case TurnResult::Completed:
            return "completed";
        case TurnResult::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::string to_string(const WorkdirStatus status) {
    switch (status) {
        case WorkdirStatus::Active:
            return "active";
        case WorkdirStatus::Archived:
            return "archived";
        default:
            return "unknown";
    }
}

inline std::optional<WorkdirStatus> parse_workdir_status(const std::string& value) {
    if (value == "active") return WorkdirStatus::Active;
    if (value == "archived") return WorkdirStatus::Archived;
    return std::nullopt;
}

}  // namespace turnstile::protocol

#include "session/task_store.hpp"

#include <algorithm>
#include "core/logging/logger.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using protocol::TaskKey;

namespace {

std::int64_t to_seconds(const std::int64_t unix_ms) {
    return unix_ms / 1000;
}

ServiceError workdir_not_found(const protocol::WorkdirId id) {
    return ServiceError{ErrorCategory::State,
                        "Workdir not found: " + std::to_string(id),
                        "workdir_not_found"};
}

}  // namespace

protocol::WorkdirId TaskStore::add_workdir(const std::string& project_id,
                                           const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    WorkdirRecord record;
    record.id = next_workdir_id_++;
    record.project_id = project_id;
    record.name = path.filename().string();
    if (record.name.empty()) {
        record.name = path.parent_path().filename().string();
    }
    record.path = path;
    workdirs_.emplace(record.id, record);
    next_task_id_[record.id] = 1;
    LOG_INFO("TaskStore: workdir " + std::to_string(record.id) + " registered at " +
             path.string() + " (project " + project_id + ")");
    return record.id;
}

std::optional<WorkdirRecord> TaskStore::find_workdir(const protocol::WorkdirId id) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = workdirs_.find(id);
    if (it == workdirs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<WorkdirRecord> TaskStore::workdirs() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    std::vector<WorkdirRecord> out;
    out.reserve(workdirs_.size());
    for (const auto& [id, record] : workdirs_) {
        out.push_back(record);
    }
    return out;
}

std::shared_ptr<TaskSlot> TaskStore::find_task(const TaskKey& key) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = tasks_.find(key);
    if (it == tasks_.end()) {
        return nullptr;
    }
    return it->second;
}

core::errors::Result<std::shared_ptr<TaskSlot>> TaskStore::require_task(
    const TaskKey& key) const {
    auto slot = find_task(key);
    if (!slot) {
        return ServiceError{ErrorCategory::State,
                            "Task not found: " + protocol::to_string(key),
                            "task_not_found"};
    }
    return slot;
}

core::errors::Result<std::pair<std::shared_ptr<TaskSlot>, bool>>
TaskStore::get_or_create_task(const TaskKey& key, const std::int64_t now_ms) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if (workdirs_.find(key.workdir_id) == workdirs_.end()) {
        return workdir_not_found(key.workdir_id);
    }
    auto it = tasks_.find(key);
    if (it != tasks_.end()) {
        return std::make_pair(it->second, false);
    }
    if (key.task_id == 0) {
        return ServiceError{ErrorCategory::Input, "Task id must be positive.",
                            "invalid_action"};
    }

    auto slot = std::make_shared<TaskSlot>(TaskState(key, now_ms));
    tasks_.emplace(key, slot);
    auto& next = next_task_id_[key.workdir_id];
    next = std::max(next, key.task_id + 1);
    LOG_INFO("TaskStore: task " + protocol::to_string(key) + " created on first write");
    return std::make_pair(slot, true);
}

core::errors::Result<std::shared_ptr<TaskSlot>> TaskStore::create_task(
    const protocol::WorkdirId workdir_id, const std::int64_t now_ms) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if (workdirs_.find(workdir_id) == workdirs_.end()) {
        return workdir_not_found(workdir_id);
    }
    auto& next = next_task_id_[workdir_id];
    const TaskKey key{workdir_id, next++};
    auto slot = std::make_shared<TaskSlot>(TaskState(key, now_ms));
    tasks_.emplace(key, slot);
    LOG_INFO("TaskStore: task " + protocol::to_string(key) + " created");
    return slot;
}

protocol::TaskSummary TaskStore::summarize(const TaskState& state) const {
    protocol::TaskSummary summary;
    summary.workdir_id = state.key().workdir_id;
    summary.task_id = state.key().task_id;
    summary.title = state.title();
    summary.created_at_unix_seconds = to_seconds(state.created_at_unix_ms());
    summary.updated_at_unix_seconds = to_seconds(state.updated_at_unix_ms());
    summary.agent_run_status = state.is_running() ? protocol::OperationStatus::Running
                                                  : protocol::OperationStatus::Idle;
    summary.task_status = state.task_status();
    summary.turn_status = state.turn_status();
    summary.last_turn_result = state.last_turn_result();
    summary.is_starred = state.is_starred();

    const auto workdir = find_workdir(summary.workdir_id);
    if (workdir.has_value()) {
        summary.project_id = workdir->project_id;
        summary.workdir_name = workdir->name;
        summary.workdir_status = workdir->status;
    }
    return summary;
}

void TaskStore::update_summary(const protocol::TaskSummary& summary) {
    std::lock_guard<std::mutex> lock(summaries_mutex_);
    summaries_[TaskKey{summary.workdir_id, summary.task_id}] = summary;
}

std::vector<protocol::TaskSummary> TaskStore::summaries(const TaskFilter& filter) const {
    std::lock_guard<std::mutex> lock(summaries_mutex_);
    std::vector<protocol::TaskSummary> out;
    for (const auto& [key, summary] : summaries_) {
        if (filter.project_id.has_value() && summary.project_id != filter.project_id.value()) {
            continue;
        }
        if (filter.workdir_status.has_value() &&
            summary.workdir_status != filter.workdir_status.value()) {
            continue;
        }
        if (filter.task_status.has_value() &&
            summary.task_status != filter.task_status.value()) {
            continue;
        }
        out.push_back(summary);
    }
    return out;
}

std::vector<protocol::TaskSummary> TaskStore::workdir_summaries(
    const protocol::WorkdirId workdir_id) const {
    std::lock_guard<std::mutex> lock(summaries_mutex_);
    std::vector<protocol::TaskSummary> out;
    for (const auto& [key, summary] : summaries_) {
        if (key.workdir_id == workdir_id) {
            out.push_back(summary);
        }
    }
    return out;
}

std::vector<protocol::WorkdirSnapshot> TaskStore::workdir_snapshots() const {
    std::vector<protocol::WorkdirSnapshot> out;
    for (const auto& record : workdirs()) {
        protocol::WorkdirSnapshot snapshot;
        snapshot.id = record.id;
        snapshot.project_id = record.project_id;
        snapshot.name = record.name;
        snapshot.path = record.path.string();
        snapshot.status = record.status;
        out.push_back(std::move(snapshot));
    }

    std::lock_guard<std::mutex> lock(summaries_mutex_);
    for (auto& snapshot : out) {
        for (const auto& [key, summary] : summaries_) {
            if (key.workdir_id != snapshot.id) {
                continue;
            }
            ++snapshot.task_count;
            if (summary.agent_run_status == protocol::OperationStatus::Running) {
                snapshot.agent_run_status = protocol::OperationStatus::Running;
            }
        }
    }
    return out;
}

}  // namespace turnstile::session

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/service_errors.hpp"
#include "protocol/snapshot_contract.hpp"
#include "session/task_state.hpp"

namespace turnstile::session {

struct WorkdirRecord {
    protocol::WorkdirId id = 0;
    std::string project_id;
    std::string name;
    std::filesystem::path path;
    protocol::WorkdirStatus status = protocol::WorkdirStatus::Active;
};

// A task and the mutex that serializes its mutation path.
struct TaskSlot {
    explicit TaskSlot(TaskState initial) : state(std::move(initial)) {}

    std::mutex mutex;
    TaskState state;
};

struct TaskFilter {
    std::optional<std::string> project_id;
    std::optional<protocol::WorkdirStatus> workdir_status;
    std::optional<protocol::TaskStatus> task_status;
};

// Workdirs, tasks and the cross-task summary cache. The slot map and the
// summary cache have their own locks, so listing tasks never waits on a
// task's mutation path.
class TaskStore {
public:
    protocol::WorkdirId add_workdir(const std::string& project_id,
                                    const std::filesystem::path& path);
    std::optional<WorkdirRecord> find_workdir(protocol::WorkdirId id) const;
    std::vector<WorkdirRecord> workdirs() const;

    std::shared_ptr<TaskSlot> find_task(const protocol::TaskKey& key) const;
    core::errors::Result<std::shared_ptr<TaskSlot>> require_task(
        const protocol::TaskKey& key) const;
    // Second member is true when the task was created by this call.
    core::errors::Result<std::pair<std::shared_ptr<TaskSlot>, bool>> get_or_create_task(
        const protocol::TaskKey& key, std::int64_t now_ms);
    core::errors::Result<std::shared_ptr<TaskSlot>> create_task(protocol::WorkdirId workdir_id,
                                                                std::int64_t now_ms);

    // Caller holds the task's mutex.
    protocol::TaskSummary summarize(const TaskState& state) const;
    void update_summary(const protocol::TaskSummary& summary);

    std::vector<protocol::TaskSummary> summaries(const TaskFilter& filter = {}) const;
    std::vector<protocol::TaskSummary> workdir_summaries(protocol::WorkdirId workdir_id) const;
    std::vector<protocol::WorkdirSnapshot> workdir_snapshots() const;

private:
    mutable std::mutex tasks_mutex_;
    std::map<protocol::WorkdirId, WorkdirRecord> workdirs_;
    std::map<protocol::TaskKey, std::shared_ptr<TaskSlot>> tasks_;
    std::map<protocol::WorkdirId, protocol::TaskId> next_task_id_;
    protocol::WorkdirId next_workdir_id_ = 1;

    mutable std::mutex summaries_mutex_;
    std::map<protocol::TaskKey, protocol::TaskSummary> summaries_;
};

}  // namespace turnstile::session

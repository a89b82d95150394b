#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/service_errors.hpp"
#include "protocol/task_contract.hpp"

namespace turnstile::session {

enum class TurnState {
    Running,
    Completed,
    Failed,
    Cancelled
};

struct TurnRecord {
    std::uint64_t turn_id = 0;
    protocol::TaskKey key;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct TurnHandle {
    std::uint64_t turn_id = 0;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Bookkeeping for running turns: owning task and cooperative cancellation
// token. A turn leaves the registry when it reaches a terminal state; later
// lookups report `turn_not_found`.
class TurnRegistry {
public:
    TurnHandle start_turn(const protocol::TaskKey& key);
    core::errors::Result<TurnState> cancel_turn(std::uint64_t turn_id);
    core::errors::Result<TurnState> mark_completed(std::uint64_t turn_id);
    core::errors::Result<TurnState> mark_failed(std::uint64_t turn_id,
                                                const std::string& reason);

    core::errors::Result<TurnState> get_turn_state(std::uint64_t turn_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        std::uint64_t turn_id) const;

    // Running turns only.
    std::size_t turn_count() const;
    std::size_t running_count(const protocol::TaskKey& key) const;
    // Sets the token of every running turn without changing its state.
    std::size_t cancel_all();

    static std::string to_string(TurnState state);

private:
    core::errors::Result<TurnState> transition_to_terminal(
        std::uint64_t turn_id, TurnState next_state,
        const std::optional<std::string>& failure_reason);

    mutable std::mutex mutex_;
    std::uint64_t next_turn_id_ = 1;
    std::unordered_map<std::uint64_t, TurnRecord> turns_;
};

}  // namespace turnstile::session

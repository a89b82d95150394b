#include "session/turn_registry.hpp"
#include <utility>
#include "core/logging/logger.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

std::string TurnRegistry::to_string(const TurnState state) {
    switch (state) {
        case TurnState::Running:
            return "running";
        case TurnState::Completed:
            return "completed";
        case TurnState::Failed:
            return "failed";
        case TurnState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

TurnHandle TurnRegistry::start_turn(const protocol::TaskKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    TurnRecord record;
    record.turn_id = next_turn_id_++;
    record.key = key;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);

    TurnHandle handle{record.turn_id, record.cancel_token};
    turns_.emplace(record.turn_id, std::move(record));
    LOG_INFO("TurnRegistry: task " + protocol::to_string(key) + " turn " +
             std::to_string(handle.turn_id) + " idle -> running");
    return handle;
}

core::errors::Result<TurnState> TurnRegistry::cancel_turn(const std::uint64_t turn_id) {
    return transition_to_terminal(turn_id, TurnState::Cancelled, std::nullopt);
}

core::errors::Result<TurnState> TurnRegistry::mark_completed(const std::uint64_t turn_id) {
    return transition_to_terminal(turn_id, TurnState::Completed, std::nullopt);
}

core::errors::Result<TurnState> TurnRegistry::mark_failed(const std::uint64_t turn_id,
                                                          const std::string& reason) {
    return transition_to_terminal(turn_id, TurnState::Failed, reason);
}

core::errors::Result<TurnState> TurnRegistry::transition_to_terminal(
    const std::uint64_t turn_id, const TurnState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(turn_id);
    if (it == turns_.end()) {
        return ServiceError{ErrorCategory::State,
                            "Turn is not running: " + std::to_string(turn_id),
                            "turn_not_found"};
    }

    if (next_state == TurnState::Cancelled) {
        it->second.cancel_token->store(true);
    }
    LOG_INFO("TurnRegistry: task " + protocol::to_string(it->second.key) + " turn " +
             std::to_string(turn_id) + " running -> " + to_string(next_state) +
             (failure_reason.has_value() ? " (" + failure_reason.value() + ")" : ""));
    turns_.erase(it);
    return next_state;
}

core::errors::Result<TurnState> TurnRegistry::get_turn_state(
    const std::uint64_t turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(turn_id);
    if (it == turns_.end()) {
        return ServiceError{ErrorCategory::State,
                            "Turn ID not found: " + std::to_string(turn_id),
                            "turn_not_found"};
    }
    return TurnState::Running;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> TurnRegistry::get_cancel_token(
    const std::uint64_t turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(turn_id);
    if (it == turns_.end()) {
        return ServiceError{ErrorCategory::State,
                            "Turn ID not found: " + std::to_string(turn_id),
                            "turn_not_found"};
    }
    return it->second.cancel_token;
}

std::size_t TurnRegistry::turn_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

std::size_t TurnRegistry::running_count(const protocol::TaskKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, record] : turns_) {
        if (record.key == key) {
            ++count;
        }
    }
    return count;
}

std::size_t TurnRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, record] : turns_) {
        record.cancel_token->store(true);
    }
    return turns_.size();
}

}  // namespace turnstile::session

#include "session/turn_activity.hpp"

#include <string>
#include <unordered_set>

namespace turnstile::session {

using protocol::AgentEvent;
using protocol::TurnActivity;
using protocol::TurnOutcome;

namespace {

bool is_user_message(const protocol::ConversationEntry& entry) {
    const auto* user = std::get_if<protocol::UserEvent>(&entry.body);
    return user != nullptr && std::holds_alternative<protocol::UserMessage>(*user);
}

}  // namespace

std::string activity_label(const TurnOutcome outcome, const std::size_t steps) {
    const std::string count = std::to_string(steps) + " steps";
    switch (outcome) {
        case TurnOutcome::Running:
            return "Running";
        case TurnOutcome::Completed:
            return "Completed " + count;
        case TurnOutcome::Canceled:
            return "Cancelled after " + count;
        case TurnOutcome::Failed:
            return "Failed after " + count;
        default:
            return "";
    }
}

std::vector<TurnActivity> fold_turns(
    const std::vector<protocol::ConversationEntry>& entries, const bool running) {
    std::vector<TurnActivity> turns;
    std::unordered_set<std::string> step_ids;
    std::optional<TurnOutcome> outcome;
    bool in_turn = false;

    auto close_turn = [&](const bool last) {
        if (!in_turn) {
            return;
        }
        TurnActivity activity;
        activity.steps = step_ids.size();
        if (outcome.has_value()) {
            activity.outcome = outcome.value();
        } else {
            activity.outcome = (last && running) ? TurnOutcome::Running
                                                 : TurnOutcome::Completed;
        }
        activity.label = activity_label(activity.outcome, activity.steps);
        turns.push_back(std::move(activity));
    };

    for (const auto& entry : entries) {
        if (is_user_message(entry)) {
            close_turn(false);
            in_turn = true;
            step_ids.clear();
            outcome.reset();
            continue;
        }
        if (!in_turn) {
            continue;
        }
        const auto* agent = std::get_if<AgentEvent>(&entry.body);
        if (agent == nullptr) {
            continue;
        }
        if (const auto* message = std::get_if<protocol::AgentMessage>(agent)) {
            step_ids.insert("message:" + message->id);
        } else if (const auto* item = std::get_if<protocol::AgentItem>(agent)) {
            step_ids.insert("item:" + item->id);
        } else if (std::holds_alternative<protocol::TurnCanceled>(*agent)) {
            outcome = TurnOutcome::Canceled;
        } else if (std::holds_alternative<protocol::TurnError>(*agent)) {
            outcome = TurnOutcome::Failed;
        } else if (std::holds_alternative<protocol::TurnDuration>(*agent)) {
            outcome = TurnOutcome::Completed;
        }
    }
    close_turn(true);
    return turns;
}

std::optional<TurnActivity> fold_latest_turn(
    const std::vector<protocol::ConversationEntry>& entries, const bool running,
    const bool queue_paused, const std::size_t pending_prompts) {
    auto turns = fold_turns(entries, running);
    if (turns.empty()) {
        return std::nullopt;
    }
    TurnActivity latest = turns.back();
    latest.resumable = latest.outcome == TurnOutcome::Canceled && queue_paused &&
                       pending_prompts > 0;
    return latest;
}

}  // namespace turnstile::session

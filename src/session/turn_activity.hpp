#pragma once

#include <optional>
#include <vector>
#include "protocol/conversation_contract.hpp"
#include "protocol/snapshot_contract.hpp"

namespace turnstile::session {

// One activity per user message, in log order. Streamed updates sharing an
// item id count as a single step. `running` applies to the last turn only.
std::vector<protocol::TurnActivity> fold_turns(
    const std::vector<protocol::ConversationEntry>& entries, bool running);

// Activity of the most recent turn, or nothing before the first user message.
// Resumable when that turn was cancelled and the queue is paused with
// prompts waiting.
std::optional<protocol::TurnActivity> fold_latest_turn(
    const std::vector<protocol::ConversationEntry>& entries, bool running,
    bool queue_paused, std::size_t pending_prompts);

std::string activity_label(protocol::TurnOutcome outcome, std::size_t steps);

}  // namespace turnstile::session

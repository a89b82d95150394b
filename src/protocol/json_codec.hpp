#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/snapshot_contract.hpp"

namespace turnstile::protocol::codec {

nlohmann::json to_json(const AttachmentRef& attachment);
nlohmann::json to_json(const ConversationEntry& entry);
nlohmann::json to_json(const QueuedPromptSnapshot& prompt);
nlohmann::json to_json(const TurnActivity& activity);
nlohmann::json to_json(const ConversationSnapshot& snapshot);
nlohmann::json to_json(const TaskSummary& summary);
nlohmann::json to_json(const TasksSnapshot& snapshot);
nlohmann::json to_json(const WorkdirTasksSnapshot& snapshot);
nlohmann::json to_json(const WorkdirSnapshot& workdir);
nlohmann::json to_json(const AppSnapshot& snapshot);
nlohmann::json to_json(const ServerEvent& event);
nlohmann::json to_json(const ServerMessage& message);

std::string encode(const ServerMessage& message);

// Strict decoding. Unknown `type` tags and missing or mistyped fields are
// Protocol errors; nothing thrown by nlohmann escapes these functions.
core::errors::Result<ClientMessage> decode_client_message(const std::string& text);
core::errors::Result<ClientAction> decode_action(const nlohmann::json& action);
core::errors::Result<AttachmentRef> decode_attachment(const nlohmann::json& value);

}  // namespace turnstile::protocol::codec

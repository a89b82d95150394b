#include "protocol/json_codec.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace turnstile::protocol::codec {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

// Raised by the field readers below and converted to a ServiceError before
// leaving this file.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const json& require_field(const json& object, const char* name) {
    const auto it = object.find(name);
    if (it == object.end()) {
        throw DecodeError(std::string("missing field '") + name + "'");
    }
    return *it;
}

std::uint64_t read_u64(const json& value, const char* name) {
    if (!value.is_number_unsigned()) {
        throw DecodeError(std::string("field '") + name +
                          "' must be a non-negative integer");
    }
    return value.get<std::uint64_t>();
}

std::uint64_t require_u64(const json& object, const char* name) {
    return read_u64(require_field(object, name), name);
}

std::string require_string(const json& object, const char* name) {
    const json& value = require_field(object, name);
    if (!value.is_string()) {
        throw DecodeError(std::string("field '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> optional_string(const json& object, const char* name) {
    const auto it = object.find(name);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw DecodeError(std::string("field '") + name + "' must be a string");
    }
    return it->get<std::string>();
}

bool require_bool(const json& object, const char* name) {
    const json& value = require_field(object, name);
    if (!value.is_boolean()) {
        throw DecodeError(std::string("field '") + name + "' must be a boolean");
    }
    return value.get<bool>();
}

// Accepts the legacy names `workspace_id` and `thread_id`.
std::uint64_t require_aliased_u64(const json& object, const char* name,
                                  const char* legacy_name) {
    if (object.contains(name)) {
        return require_u64(object, name);
    }
    if (object.contains(legacy_name)) {
        return require_u64(object, legacy_name);
    }
    throw DecodeError(std::string("missing field '") + name + "'");
}

TaskKey require_key(const json& object) {
    TaskKey key;
    key.workdir_id = require_aliased_u64(object, "workdir_id", "workspace_id");
    key.task_id = require_aliased_u64(object, "task_id", "thread_id");
    return key;
}

AttachmentRef read_attachment(const json& value) {
    if (!value.is_object()) {
        throw DecodeError("attachment must be an object");
    }
    AttachmentRef attachment;
    attachment.id = require_string(value, "id");
    const std::string kind = require_string(value, "kind");
    const auto parsed_kind = parse_attachment_kind(kind);
    if (!parsed_kind.has_value()) {
        throw DecodeError("unknown attachment kind '" + kind + "'");
    }
    attachment.kind = parsed_kind.value();
    attachment.name = require_string(value, "name");
    attachment.extension = require_string(value, "extension");
    attachment.mime = optional_string(value, "mime");
    attachment.byte_len = require_u64(value, "byte_len");
    return attachment;
}

UserInput read_input(const json& object) {
    UserInput input;
    input.text = require_string(object, "text");
    const auto it = object.find("attachments");
    if (it != object.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw DecodeError("field 'attachments' must be an array");
        }
        for (const auto& item : *it) {
            input.attachments.push_back(read_attachment(item));
        }
    }
    return input;
}

ClientAction read_action(const std::string& type, const json& object) {
    if (type == "create_task") {
        CreateTask action;
        action.workdir_id = require_aliased_u64(object, "workdir_id", "workspace_id");
        return action;
    }
    if (type == "task_status_set") {
        TaskStatusSet action;
        action.key = require_key(object);
        const std::string status = require_string(object, "task_status");
        const auto parsed = parse_task_status(status);
        if (!parsed.has_value()) {
            throw DecodeError("unknown task status '" + status + "'");
        }
        action.status = parsed.value();
        return action;
    }
    if (type == "task_star_set") {
        TaskStarSet action;
        action.key = require_key(object);
        action.starred = require_bool(object, "starred");
        return action;
    }
    if (type == "send_agent_message") {
        SendAgentMessage action;
        action.key = require_key(object);
        action.input = read_input(object);
        return action;
    }
    if (type == "queue_agent_message") {
        QueueAgentMessage action;
        action.key = require_key(object);
        action.input = read_input(object);
        return action;
    }
    if (type == "cancel_and_send_agent_message") {
        CancelAndSendAgentMessage action;
        action.key = require_key(object);
        action.input = read_input(object);
        return action;
    }
    if (type == "cancel_agent_turn") {
        CancelAgentTurn action;
        action.key = require_key(object);
        return action;
    }
    if (type == "remove_queued_prompt") {
        RemoveQueuedPrompt action;
        action.key = require_key(object);
        action.prompt_id = require_u64(object, "prompt_id");
        return action;
    }
    if (type == "reorder_queued_prompt") {
        ReorderQueuedPrompt action;
        action.key = require_key(object);
        action.active_id = require_u64(object, "active_id");
        action.over_id = require_u64(object, "over_id");
        return action;
    }
    if (type == "update_queued_prompt") {
        UpdateQueuedPrompt action;
        action.key = require_key(object);
        action.prompt_id = require_u64(object, "prompt_id");
        action.input = read_input(object);
        return action;
    }
    if (type == "clear_queued_prompts") {
        ClearQueuedPrompts action;
        action.key = require_key(object);
        return action;
    }
    if (type == "resume_queued_prompts") {
        ResumeQueuedPrompts action;
        action.key = require_key(object);
        return action;
    }
    TerminalCommandStart action;
    action.key = require_key(object);
    action.command = require_string(object, "command");
    action.reconnect = optional_string(object, "reconnect");
    return action;
}

bool is_known_action(const std::string& type) {
    static const char* const kActions[] = {
        "create_task",          "task_status_set",
        "task_star_set",        "send_agent_message",
        "queue_agent_message",  "cancel_and_send_agent_message",
        "cancel_agent_turn",    "remove_queued_prompt",
        "reorder_queued_prompt", "update_queued_prompt",
        "clear_queued_prompts", "resume_queued_prompts",
        "terminal_command_start"};
    for (const char* known : kActions) {
        if (type == known) {
            return true;
        }
    }
    return false;
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

json system_event_to_json(const SystemEvent& event) {
    return std::visit(
        [](const auto& value) -> json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, TaskCreated>) {
                return json{{"type", "task_created"}};
            } else {
                return json{{"type", "task_status_changed"},
                            {"from", to_string(value.from)},
                            {"to", to_string(value.to)}};
            }
        },
        event);
}

json user_event_to_json(const UserEvent& event) {
    return std::visit(
        [](const auto& value) -> json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, UserMessage>) {
                json attachments = json::array();
                for (const auto& attachment : value.attachments) {
                    attachments.push_back(to_json(attachment));
                }
                return json{{"type", "message"},
                            {"text", value.text},
                            {"attachments", attachments}};
            } else if constexpr (std::is_same_v<T, TerminalCommandStarted>) {
                return json{{"type", "terminal_command_started"},
                            {"id", value.id},
                            {"command", value.command},
                            {"reconnect", value.reconnect}};
            } else {
                return json{{"type", "terminal_command_finished"},
                            {"id", value.id},
                            {"command", value.command},
                            {"reconnect", value.reconnect},
                            {"output_base64", value.output_base64},
                            {"output_byte_len", value.output_byte_len}};
            }
        },
        event);
}

json agent_event_to_json(const AgentEvent& event) {
    return std::visit(
        [](const auto& value) -> json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AgentMessage>) {
                return json{{"type", "message"}, {"id", value.id}, {"text", value.text}};
            } else if constexpr (std::is_same_v<T, AgentItem>) {
                return json{{"type", "item"},
                            {"id", value.id},
                            {"kind", to_string(value.kind)},
                            {"payload", value.payload}};
            } else if constexpr (std::is_same_v<T, TurnUsage>) {
                return json{{"type", "turn_usage"},
                            {"usage_json", optional_to_json(value.usage_json)}};
            } else if constexpr (std::is_same_v<T, TurnDuration>) {
                return json{{"type", "turn_duration"}, {"duration_ms", value.duration_ms}};
            } else if constexpr (std::is_same_v<T, TurnCanceled>) {
                return json{{"type", "turn_canceled"}};
            } else {
                return json{{"type", "turn_error"}, {"message", value.message}};
            }
        },
        event);
}

json summaries_to_json(const std::vector<TaskSummary>& tasks) {
    json out = json::array();
    for (const auto& task : tasks) {
        out.push_back(to_json(task));
    }
    return out;
}

ServiceError protocol_error(const std::string& message, const std::string& code) {
    return ServiceError{ErrorCategory::Protocol, message, code};
}

}  // namespace

json to_json(const AttachmentRef& attachment) {
    json payload;
    payload["id"] = attachment.id;
    payload["kind"] = to_string(attachment.kind);
    payload["name"] = attachment.name;
    payload["extension"] = attachment.extension;
    payload["mime"] = optional_to_json(attachment.mime);
    payload["byte_len"] = attachment.byte_len;
    return payload;
}

json to_json(const ConversationEntry& entry) {
    json payload;
    payload["entry_id"] = entry.entry_id;
    payload["created_at_unix_ms"] = entry.created_at_unix_ms;
    if (const auto* system = std::get_if<SystemEvent>(&entry.body)) {
        payload["type"] = "system_event";
        payload["event"] = system_event_to_json(*system);
    } else if (const auto* user = std::get_if<UserEvent>(&entry.body)) {
        payload["type"] = "user_event";
        payload["event"] = user_event_to_json(*user);
    } else {
        payload["type"] = "agent_event";
        payload["event"] = agent_event_to_json(std::get<AgentEvent>(entry.body));
    }
    return payload;
}

json to_json(const QueuedPromptSnapshot& prompt) {
    json attachments = json::array();
    for (const auto& attachment : prompt.attachments) {
        attachments.push_back(to_json(attachment));
    }
    return json{{"id", prompt.id}, {"text", prompt.text}, {"attachments", attachments}};
}

json to_json(const TurnActivity& activity) {
    return json{{"steps", activity.steps},
                {"outcome", to_string(activity.outcome)},
                {"label", activity.label},
                {"resumable", activity.resumable}};
}

json to_json(const ConversationSnapshot& snapshot) {
    json entries = json::array();
    for (const auto& entry : snapshot.entries) {
        entries.push_back(to_json(entry));
    }
    json pending = json::array();
    for (const auto& prompt : snapshot.pending_prompts) {
        pending.push_back(to_json(prompt));
    }

    json payload;
    payload["rev"] = snapshot.rev;
    payload["workdir_id"] = snapshot.workdir_id;
    payload["task_id"] = snapshot.task_id;
    payload["title"] = snapshot.title;
    payload["task_status"] = to_string(snapshot.task_status);
    payload["run_status"] = to_string(snapshot.run_status);
    payload["run_started_at_unix_ms"] = optional_to_json(snapshot.run_started_at_unix_ms);
    payload["run_finished_at_unix_ms"] = optional_to_json(snapshot.run_finished_at_unix_ms);
    payload["entries"] = entries;
    payload["entries_total"] = snapshot.entries_total;
    payload["entries_start"] = snapshot.entries_start;
    payload["entries_truncated"] = snapshot.entries_start > 0;
    payload["pending_prompts"] = pending;
    payload["queue_paused"] = snapshot.queue_paused;
    payload["latest_turn"] = snapshot.latest_turn.has_value()
                                 ? to_json(snapshot.latest_turn.value())
                                 : json(nullptr);
    return payload;
}

json to_json(const TaskSummary& summary) {
    json payload;
    payload["project_id"] = summary.project_id;
    payload["workdir_id"] = summary.workdir_id;
    payload["task_id"] = summary.task_id;
    payload["title"] = summary.title;
    payload["created_at_unix_seconds"] = summary.created_at_unix_seconds;
    payload["updated_at_unix_seconds"] = summary.updated_at_unix_seconds;
    payload["workdir_name"] = summary.workdir_name;
    payload["workdir_status"] = to_string(summary.workdir_status);
    payload["agent_run_status"] = to_string(summary.agent_run_status);
    payload["task_status"] = to_string(summary.task_status);
    payload["turn_status"] = to_string(summary.turn_status);
    payload["last_turn_result"] =
        summary.last_turn_result.has_value()
            ? json(to_string(summary.last_turn_result.value()))
            : json(nullptr);
    payload["is_starred"] = summary.is_starred;
    return payload;
}

json to_json(const TasksSnapshot& snapshot) {
    return json{{"rev", snapshot.rev}, {"tasks", summaries_to_json(snapshot.tasks)}};
}

json to_json(const WorkdirTasksSnapshot& snapshot) {
    return json{{"rev", snapshot.rev},
                {"workdir_id", snapshot.workdir_id},
                {"tasks", summaries_to_json(snapshot.tasks)}};
}

json to_json(const WorkdirSnapshot& workdir) {
    json payload;
    payload["id"] = workdir.id;
    payload["project_id"] = workdir.project_id;
    payload["name"] = workdir.name;
    payload["path"] = workdir.path;
    payload["status"] = to_string(workdir.status);
    payload["agent_run_status"] = to_string(workdir.agent_run_status);
    payload["task_count"] = workdir.task_count;
    return payload;
}

json to_json(const AppSnapshot& snapshot) {
    json workdirs = json::array();
    for (const auto& workdir : snapshot.workdirs) {
        workdirs.push_back(to_json(workdir));
    }
    return json{{"rev", snapshot.rev},
                {"workdirs", workdirs},
                {"tasks", summaries_to_json(snapshot.tasks)}};
}

json to_json(const ServerEvent& event) {
    return std::visit(
        [](const auto& value) -> json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AppChangedEvent>) {
                return json{{"type", "app_changed"},
                            {"rev", value.rev},
                            {"snapshot", to_json(value.snapshot)}};
            } else if constexpr (std::is_same_v<T, TaskSummariesChangedEvent>) {
                return json{{"type", "task_summaries_changed"},
                            {"tasks", summaries_to_json(value.tasks)}};
            } else if constexpr (std::is_same_v<T, WorkdirTasksChangedEvent>) {
                return json{{"type", "workdir_tasks_changed"},
                            {"workdir_id", value.workdir_id},
                            {"tasks", summaries_to_json(value.tasks)}};
            } else if constexpr (std::is_same_v<T, ConversationChangedEvent>) {
                return json{{"type", "conversation_changed"},
                            {"snapshot", to_json(value.snapshot)}};
            } else if constexpr (std::is_same_v<T, ToastEvent>) {
                return json{{"type", "toast"}, {"message", value.message}};
            } else {
                return json{{"type", "task_created"},
                            {"request_id", value.request_id},
                            {"workdir_id", value.workdir_id},
                            {"task_id", value.task_id}};
            }
        },
        event);
}

json to_json(const ServerMessage& message) {
    return std::visit(
        [](const auto& value) -> json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ServerHello>) {
                return json{{"type", "hello"},
                            {"protocol_version", value.protocol_version},
                            {"rev", value.rev}};
            } else if constexpr (std::is_same_v<T, AckMessage>) {
                return json{{"type", "ack"},
                            {"request_id", value.request_id},
                            {"rev", value.rev}};
            } else if constexpr (std::is_same_v<T, ErrorMessage>) {
                return json{{"type", "error"},
                            {"request_id", optional_to_json(value.request_id)},
                            {"message", value.message},
                            {"code", value.code}};
            } else if constexpr (std::is_same_v<T, EventMessage>) {
                return json{{"type", "event"},
                            {"rev", value.rev},
                            {"event", to_json(value.event)}};
            } else {
                return json{{"type", "pong"}};
            }
        },
        message);
}

std::string encode(const ServerMessage& message) {
    return to_json(message).dump();
}

Result<ClientMessage> decode_client_message(const std::string& text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        return protocol_error(std::string("Malformed message: ") + e.what(),
                              "malformed_message");
    }

    if (!parsed.is_object()) {
        return protocol_error("Message must be a JSON object.", "malformed_message");
    }
    const auto type_it = parsed.find("type");
    if (type_it == parsed.end() || !type_it->is_string()) {
        return protocol_error("Message is missing a string 'type'.", "malformed_message");
    }
    const std::string type = type_it->get<std::string>();

    try {
        if (type == "hello") {
            ClientHello hello;
            hello.protocol_version =
                static_cast<std::uint32_t>(require_u64(parsed, "protocol_version"));
            const auto rev_it = parsed.find("last_seen_rev");
            if (rev_it != parsed.end() && !rev_it->is_null()) {
                hello.last_seen_rev = read_u64(*rev_it, "last_seen_rev");
            }
            return ClientMessage{hello};
        }
        if (type == "action") {
            ClientActionMessage message;
            message.request_id = require_string(parsed, "request_id");
            message.action = require_field(parsed, "action");
            return ClientMessage{std::move(message)};
        }
        if (type == "ping") {
            return ClientMessage{ClientPing{}};
        }
    } catch (const DecodeError& e) {
        return protocol_error(std::string("Malformed message: ") + e.what(),
                              "malformed_message");
    } catch (const json::exception& e) {
        return protocol_error(std::string("Malformed message: ") + e.what(),
                              "malformed_message");
    }

    return protocol_error("Unknown message type: " + type, "unknown_message_type");
}

Result<ClientAction> decode_action(const json& action) {
    if (!action.is_object()) {
        return protocol_error("Action must be a JSON object.", "invalid_action");
    }
    const auto type_it = action.find("type");
    if (type_it == action.end() || !type_it->is_string()) {
        return protocol_error("Action is missing a string 'type'.", "invalid_action");
    }
    const std::string type = type_it->get<std::string>();
    if (!is_known_action(type)) {
        return protocol_error("Unknown action: " + type, "unknown_action");
    }

    try {
        return read_action(type, action);
    } catch (const DecodeError& e) {
        return protocol_error("Invalid " + type + ": " + e.what(), "invalid_action");
    } catch (const json::exception& e) {
        return protocol_error("Invalid " + type + ": " + e.what(), "invalid_action");
    }
}

Result<AttachmentRef> decode_attachment(const json& value) {
    try {
        return read_attachment(value);
    } catch (const DecodeError& e) {
        return protocol_error(std::string("Invalid attachment: ") + e.what(),
                              "invalid_attachment");
    } catch (const json::exception& e) {
        return protocol_error(std::string("Invalid attachment: ") + e.what(),
                              "invalid_attachment");
    }
}

}  // namespace turnstile::protocol::codec

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/task_contract.hpp"

namespace turnstile::protocol {

enum class AttachmentKind {
    Image,
    Text,
    File
};

struct AttachmentRef {
    std::string id;
    AttachmentKind kind = AttachmentKind::File;
    std::string name;
    std::string extension;
    std::optional<std::string> mime;
    std::uint64_t byte_len = 0;
};

// --- system events ---
struct TaskCreated {};
struct TaskStatusChanged {
    TaskStatus from = TaskStatus::Todo;
    TaskStatus to = TaskStatus::Todo;
};
using SystemEvent = std::variant<TaskCreated, TaskStatusChanged>;

// --- user events ---
struct UserMessage {
    std::string text;
    std::vector<AttachmentRef> attachments;
};
struct TerminalCommandStarted {
    std::string id;
    std::string command;
    std::string reconnect;
};
struct TerminalCommandFinished {
    std::string id;
    std::string command;
    std::string reconnect;
    std::string output_base64;
    std::uint64_t output_byte_len = 0;
};
using UserEvent =
    std::variant<UserMessage, TerminalCommandStarted, TerminalCommandFinished>;

// --- agent events ---
enum class AgentItemKind {
    Reasoning,
    CommandExecution,
    FileChange,
    McpToolCall,
    WebSearch,
    TodoList,
    Error
};

struct AgentMessage {
    std::string id;
    std::string text;
};
struct AgentItem {
    std::string id;
    AgentItemKind kind = AgentItemKind::Reasoning;
    nlohmann::json payload;
};
struct TurnUsage {
    std::optional<nlohmann::json> usage_json;
};
struct TurnDuration {
    std::uint64_t duration_ms = 0;
};
struct TurnCanceled {};
struct TurnError {
    std::string message;
};
using AgentEvent = std::variant<AgentMessage, AgentItem, TurnUsage, TurnDuration,
                                TurnCanceled, TurnError>;

// One immutable record in a task's conversation. The body alternative is
// the entry's tag: system_event, user_event or agent_event.
struct ConversationEntry {
    std::string entry_id;
    std::int64_t created_at_unix_ms = 0;
    std::variant<SystemEvent, UserEvent, AgentEvent> body;
};

inline bool is_system_event(const ConversationEntry& entry) {
    return std::holds_alternative<SystemEvent>(entry.body);
}

inline bool is_user_event(const ConversationEntry& entry) {
    return std::holds_alternative<UserEvent>(entry.body);
}

inline bool is_agent_event(const ConversationEntry& entry) {
    return std::holds_alternative<AgentEvent>(entry.body);
}

inline std::string to_string(const AttachmentKind kind) {
    switch (kind) {
        case AttachmentKind::Image:
            return "image";
        case AttachmentKind::Text:
            return "text";
        case AttachmentKind::File:
            return "file";
        default:
            return "unknown";
    }
}

inline std::optional<AttachmentKind> parse_attachment_kind(const std::string& value) {
    if (value == "image") return AttachmentKind::Image;
    if (value == "text") return AttachmentKind::Text;
    if (value == "file") return AttachmentKind::File;
    return std::nullopt;
}

inline std::string to_string(const AgentItemKind kind) {
    switch (kind) {
        case AgentItemKind::Reasoning:
            return "reasoning";
        case AgentItemKind::CommandExecution:
            return "command_execution";
        case AgentItemKind::FileChange:
            return "file_change";
        case AgentItemKind::McpToolCall:
            return "mcp_tool_call";
        case AgentItemKind::WebSearch:
            return "web_search";
        case AgentItemKind::TodoList:
            return "todo_list";
        case AgentItemKind::Error:
            return "error";
        default:
            return "unknown";
    }
}

inline std::optional<AgentItemKind> parse_agent_item_kind(const std::string& value) {
    if (value == "reasoning") return AgentItemKind::Reasoning;
    if (value == "command_execution") return AgentItemKind::CommandExecution;
    if (value == "file_change") return AgentItemKind::FileChange;
    if (value == "mcp_tool_call") return AgentItemKind::McpToolCall;
    if (value == "web_search") return AgentItemKind::WebSearch;
    if (value == "todo_list") return AgentItemKind::TodoList;
    if (value == "error") return AgentItemKind::Error;
    return std::nullopt;
}

}  // namespace turnstile::protocol

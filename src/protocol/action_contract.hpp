#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "protocol/conversation_contract.hpp"
#include "protocol/task_contract.hpp"

namespace turnstile::protocol {

// Text plus attachments, as typed into the composer.
struct UserInput {
    std::string text;
    std::vector<AttachmentRef> attachments;
};

struct CreateTask {
    WorkdirId workdir_id = 0;
};
struct TaskStatusSet {
    TaskKey key;
    TaskStatus status = TaskStatus::Todo;
};
struct TaskStarSet {
    TaskKey key;
    bool starred = false;
};
struct SendAgentMessage {
    TaskKey key;
    UserInput input;
};
struct QueueAgentMessage {
    TaskKey key;
    UserInput input;
};
struct CancelAndSendAgentMessage {
    TaskKey key;
    UserInput input;
};
struct CancelAgentTurn {
    TaskKey key;
};
struct RemoveQueuedPrompt {
    TaskKey key;
    PromptId prompt_id = 0;
};
struct ReorderQueuedPrompt {
    TaskKey key;
    PromptId active_id = 0;
    PromptId over_id = 0;
};
struct UpdateQueuedPrompt {
    TaskKey key;
    PromptId prompt_id = 0;
    UserInput input;
};
struct ClearQueuedPrompts {
    TaskKey key;
};
struct ResumeQueuedPrompts {
    TaskKey key;
};
struct TerminalCommandStart {
    TaskKey key;
    std::string command;
    std::optional<std::string> reconnect;
};

using ClientAction = std::variant<
    CreateTask,
    TaskStatusSet,
    TaskStarSet,
    SendAgentMessage,
    QueueAgentMessage,
    CancelAndSendAgentMessage,
    CancelAgentTurn,
    RemoveQueuedPrompt,
    ReorderQueuedPrompt,
    UpdateQueuedPrompt,
    ClearQueuedPrompts,
    ResumeQueuedPrompts,
    TerminalCommandStart>;

// Wire tag of an action, e.g. "send_agent_message".
std::string action_name(const ClientAction& action);

}  // namespace turnstile::protocol

#include "protocol/action_contract.hpp"

#include <type_traits>

namespace turnstile::protocol {

std::string action_name(const ClientAction& action) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, CreateTask>) {
                return "create_task";
            } else if constexpr (std::is_same_v<T, TaskStatusSet>) {
                return "task_status_set";
            } else if constexpr (std::is_same_v<T, TaskStarSet>) {
                return "task_star_set";
            } else if constexpr (std::is_same_v<T, SendAgentMessage>) {
                return "send_agent_message";
            } else if constexpr (std::is_same_v<T, QueueAgentMessage>) {
                return "queue_agent_message";
            } else if constexpr (std::is_same_v<T, CancelAndSendAgentMessage>) {
                return "cancel_and_send_agent_message";
            } else if constexpr (std::is_same_v<T, CancelAgentTurn>) {
                return "cancel_agent_turn";
            } else if constexpr (std::is_same_v<T, RemoveQueuedPrompt>) {
                return "remove_queued_prompt";
            } else if constexpr (std::is_same_v<T, ReorderQueuedPrompt>) {
                return "reorder_queued_prompt";
            } else if constexpr (std::is_same_v<T, UpdateQueuedPrompt>) {
                return "update_queued_prompt";
            } else if constexpr (std::is_same_v<T, ClearQueuedPrompts>) {
                return "clear_queued_prompts";
            } else if constexpr (std::is_same_v<T, ResumeQueuedPrompts>) {
                return "resume_queued_prompts";
            } else {
                static_assert(std::is_same_v<T, TerminalCommandStart>,
                              "unhandled client action");
                return "terminal_command_start";
            }
        },
        action);
}

}  // namespace turnstile::protocol

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/snapshot_contract.hpp"

namespace turnstile::protocol {

    // Broadcast events. Every event travels inside `event{rev, event}`.
    struct AppChangedEvent { Revision rev = 0; AppSnapshot snapshot; };
    struct TaskSummariesChangedEvent { std::vector<TaskSummary> tasks; };
    struct WorkdirTasksChangedEvent { WorkdirId workdir_id = 0; std::vector<TaskSummary> tasks; };
    struct ConversationChangedEvent { ConversationSnapshot snapshot; };
    struct ToastEvent { std::string message; };
    struct TaskCreatedEvent { std::string request_id; WorkdirId workdir_id = 0; TaskId task_id = 0; };

    using ServerEvent = std::variant<
        AppChangedEvent,
        TaskSummariesChangedEvent,
        WorkdirTasksChangedEvent,
        ConversationChangedEvent,
        ToastEvent,
        TaskCreatedEvent
    >;

    // Client -> server. The action body stays raw json until the session
    // decodes it, so a decode failure can still echo the request id.
    struct ClientHello { std::uint32_t protocol_version = 0; std::optional<Revision> last_seen_rev; };
    struct ClientActionMessage { std::string request_id; nlohmann::json action; };
    struct ClientPing {};

    using ClientMessage = std::variant<ClientHello, ClientActionMessage, ClientPing>;

    // Server -> client.
    struct ServerHello { std::uint32_t protocol_version = kProtocolVersion; Revision rev = 0; };
    struct AckMessage { std::string request_id; Revision rev = 0; };
    struct ErrorMessage { std::optional<std::string> request_id; std::string message; std::string code; };
    struct EventMessage { Revision rev = 0; ServerEvent event; };
    struct PongMessage {};

    using ServerMessage = std::variant<ServerHello, AckMessage, ErrorMessage, EventMessage, PongMessage>;

} // namespace turnstile::protocol

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"
#include "protocol/conversation_contract.hpp"

namespace turnstile::session {

struct LogPage {
    std::vector<protocol::ConversationEntry> entries;
    std::uint64_t entries_total = 0;
    std::uint64_t entries_start = 0;
};

// Append-only entry sequence of one task. Entry ids are `e_<n>` with n the
// 1-based position, so a cursor is simply a position.
class ConversationLog {
public:
    const protocol::ConversationEntry& append(
        std::int64_t created_at_unix_ms,
        std::variant<protocol::SystemEvent, protocol::UserEvent, protocol::AgentEvent> body);

    // Entries strictly older than position `before` (or all entries), the
    // most recent `limit` of them.
    core::errors::Result<LogPage> page(std::optional<std::uint64_t> before,
                                       std::optional<std::size_t> limit) const;

    std::size_t size() const { return entries_.size(); }
    const std::vector<protocol::ConversationEntry>& entries() const { return entries_; }

private:
    std::vector<protocol::ConversationEntry> entries_;
};

// Parses "e_12" or "12" into the position 12.
std::optional<std::uint64_t> parse_entry_cursor(const std::string& value);

}  // namespace turnstile::session

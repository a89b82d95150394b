#include "session/conversation_log.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

const protocol::ConversationEntry& ConversationLog::append(
    const std::int64_t created_at_unix_ms,
    std::variant<protocol::SystemEvent, protocol::UserEvent, protocol::AgentEvent> body) {
    protocol::ConversationEntry entry;
    entry.entry_id = "e_" + std::to_string(entries_.size() + 1);
    entry.created_at_unix_ms = created_at_unix_ms;
    entry.body = std::move(body);
    entries_.push_back(std::move(entry));
    return entries_.back();
}

core::errors::Result<LogPage> ConversationLog::page(
    const std::optional<std::uint64_t> before,
    const std::optional<std::size_t> limit) const {
    if (limit.has_value() && limit.value() == 0) {
        return ServiceError{ErrorCategory::Input, "limit must be greater than zero.",
                            "invalid_query"};
    }
    if (before.has_value() && before.value() == 0) {
        return ServiceError{ErrorCategory::Input,
                            "before must reference an entry position (>= 1).",
                            "invalid_query"};
    }

    const std::uint64_t total = entries_.size();
    std::uint64_t upper = total;
    if (before.has_value()) {
        upper = std::min<std::uint64_t>(before.value() - 1, total);
    }
    std::uint64_t start = 0;
    if (limit.has_value()) {
        start = upper - std::min<std::uint64_t>(limit.value(), upper);
    }

    LogPage page;
    page.entries_total = total;
    page.entries_start = start;
    page.entries.assign(entries_.begin() + static_cast<std::ptrdiff_t>(start),
                        entries_.begin() + static_cast<std::ptrdiff_t>(upper));
    return page;
}

std::optional<std::uint64_t> parse_entry_cursor(const std::string& value) {
    std::string digits = value;
    if (digits.rfind("e_", 0) == 0) {
        digits = digits.substr(2);
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    std::uint64_t position = 0;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(begin, end, position);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return position;
}

}  // namespace turnstile::session

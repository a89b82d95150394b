#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "core/errors/service_errors.hpp"
#include "session/task_store.hpp"

namespace turnstile::net {

using QueryParams = std::map<std::string, std::string>;

struct ConversationQuery {
    std::optional<std::uint64_t> before;
    std::optional<std::size_t> limit;
};

constexpr std::size_t kMaxConversationLimit = 1000;

// Unknown parameters are ignored; malformed known ones are Input errors
// with code `invalid_query`.
core::errors::Result<session::TaskFilter> parse_task_filter(const QueryParams& params);
core::errors::Result<ConversationQuery> parse_conversation_query(const QueryParams& params);
core::errors::Result<std::uint64_t> parse_path_id(const std::string& value,
                                                  const std::string& what);

// HTTP status for an error returned by a route handler.
int http_status_for(const core::errors::ServiceError& error);
std::string error_body(const core::errors::ServiceError& error);

}  // namespace turnstile::net

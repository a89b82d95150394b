#include "net/http_query.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include "session/conversation_log.hpp"

namespace turnstile::net {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

ServiceError invalid_query(const std::string& message) {
    return ServiceError{ErrorCategory::Input, message, "invalid_query"};
}

std::optional<std::uint64_t> parse_unsigned(const std::string& value) {
    std::uint64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

const std::string* find_param(const QueryParams& params, const std::string& name) {
    auto it = params.find(name);
    return it == params.end() ? nullptr : &it->second;
}

}  // namespace

core::errors::Result<session::TaskFilter> parse_task_filter(const QueryParams& params) {
    session::TaskFilter filter;
    if (const auto* project = find_param(params, "project_id")) {
        if (project->empty()) {
            return invalid_query("project_id must not be empty.");
        }
        filter.project_id = *project;
    }
    if (const auto* status = find_param(params, "workdir_status")) {
        filter.workdir_status = protocol::parse_workdir_status(*status);
        if (!filter.workdir_status.has_value()) {
            return invalid_query("Unknown workdir_status '" + *status + "'.");
        }
    }
    if (const auto* status = find_param(params, "task_status")) {
        filter.task_status = protocol::parse_task_status(*status);
        if (!filter.task_status.has_value()) {
            return invalid_query("Unknown task_status '" + *status + "'.");
        }
    }
    return filter;
}

core::errors::Result<ConversationQuery> parse_conversation_query(const QueryParams& params) {
    ConversationQuery query;
    if (const auto* before = find_param(params, "before")) {
        query.before = session::parse_entry_cursor(*before);
        if (!query.before.has_value() || query.before.value() == 0) {
            return invalid_query("before must be an entry cursor such as e_12.");
        }
    }
    if (const auto* limit = find_param(params, "limit")) {
        const auto parsed = parse_unsigned(*limit);
        if (!parsed.has_value() || parsed.value() == 0 ||
            parsed.value() > kMaxConversationLimit) {
            return invalid_query("limit must be between 1 and " +
                                 std::to_string(kMaxConversationLimit) + ".");
        }
        query.limit = static_cast<std::size_t>(parsed.value());
    }
    return query;
}

core::errors::Result<std::uint64_t> parse_path_id(const std::string& value,
                                                  const std::string& what) {
    const auto parsed = parse_unsigned(value);
    if (!parsed.has_value() || parsed.value() == 0) {
        return ServiceError{ErrorCategory::Input, "Invalid " + what + " '" + value + "'.",
                            "invalid_path"};
    }
    return parsed.value();
}

int http_status_for(const ServiceError& error) {
    switch (error.category) {
        case ErrorCategory::Input:
            if (error.code == "attachment_too_large") {
                return 413;
            }
            return 400;
        case ErrorCategory::Protocol:
            return 400;
        case ErrorCategory::State:
            if (error.code == "task_not_found" || error.code == "workdir_not_found" ||
                error.code == "attachment_not_found") {
                return 404;
            }
            return 409;
        case ErrorCategory::Auth:
            return 401;
        case ErrorCategory::Execution:
            return 502;
        case ErrorCategory::Transport:
        case ErrorCategory::Internal:
        default:
            return 500;
    }
}

std::string error_body(const ServiceError& error) {
    return nlohmann::json{{"message", error.message}, {"code", error.code}}.dump();
}

}  // namespace turnstile::net

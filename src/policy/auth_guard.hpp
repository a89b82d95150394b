#pragma once

#include <mutex>
#include <optional>
#include <string>
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"

namespace turnstile::policy {

// Single-user authentication. A bootstrap token, exchanged at
// `/auth?token=...`, yields a session cookie that gates every protected
// path. The bootstrap token stays valid for the life of the process and
// every exchange returns the same session token.
class AuthGuard {
public:
    static constexpr const char* kCookieName = "turnstile_session";

    AuthGuard(core::config::AuthMode mode, std::string bootstrap_token);

    bool enabled() const { return mode_ == core::config::AuthMode::SingleUser; }
    const std::string& bootstrap_token() const { return bootstrap_token_; }

    core::errors::Result<std::string> exchange(const std::string& token);
    // True when auth is disabled or `cookie_header` carries the session token.
    bool authorize(const std::string& cookie_header) const;

    std::string set_cookie_header(const std::string& session_token) const;

    static std::optional<std::string> find_cookie(const std::string& cookie_header,
                                                  const std::string& name);

private:
    static bool constant_time_equals(const std::string& a, const std::string& b);

    core::config::AuthMode mode_;
    std::string bootstrap_token_;
    mutable std::mutex mutex_;
    std::string session_token_;
};

}  // namespace turnstile::policy

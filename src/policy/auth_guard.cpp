#include "policy/auth_guard.hpp"

#include <utility>
#include "core/config/tokens.hpp"
#include "core/logging/logger.hpp"

namespace turnstile::policy {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

AuthGuard::AuthGuard(const core::config::AuthMode mode, std::string bootstrap_token)
    : mode_(mode), bootstrap_token_(std::move(bootstrap_token)) {}

bool AuthGuard::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

core::errors::Result<std::string> AuthGuard::exchange(const std::string& token) {
    if (!enabled()) {
        return ServiceError{ErrorCategory::Auth, "Authentication is disabled.",
                            "auth_disabled"};
    }
    if (token.empty() || !constant_time_equals(token, bootstrap_token_)) {
        LOG_WARN("AuthGuard: rejected bootstrap token exchange");
        return ServiceError{ErrorCategory::Auth, "unauthorized", "unauthorized"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (session_token_.empty()) {
        session_token_ = core::config::generate_token("", 48);
        LOG_INFO("AuthGuard: session token issued");
    }
    return session_token_;
}

bool AuthGuard::authorize(const std::string& cookie_header) const {
    if (!enabled()) {
        return true;
    }
    const auto cookie = find_cookie(cookie_header, kCookieName);
    if (!cookie.has_value()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !session_token_.empty() && constant_time_equals(cookie.value(), session_token_);
}

std::string AuthGuard::set_cookie_header(const std::string& session_token) const {
    return std::string(kCookieName) + "=" + session_token + "; Path=/; HttpOnly; SameSite=Lax";
}

std::optional<std::string> AuthGuard::find_cookie(const std::string& cookie_header,
                                                  const std::string& name) {
    std::size_t pos = 0;
    while (pos < cookie_header.size()) {
        auto end = cookie_header.find(';', pos);
        if (end == std::string::npos) {
            end = cookie_header.size();
        }
        std::string pair = cookie_header.substr(pos, end - pos);
        const auto begin = pair.find_first_not_of(' ');
        if (begin != std::string::npos) {
            pair = pair.substr(begin);
            const auto eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == name) {
                std::string value = pair.substr(eq + 1);
                const auto last = value.find_last_not_of(' ');
                return last == std::string::npos ? std::string() : value.substr(0, last + 1);
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

}  // namespace turnstile::policy

#pragma once
#include <string>
#include <variant>

namespace turnstile::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag or query parameter
        Protocol,   // E.g., malformed wire message, unknown action tag
        State,      // E.g., starting a turn while one is already running
        Execution,  // E.g., the turn executor process failed
        Transport,  // E.g., socket closed mid-frame
        Auth,       // E.g., missing or wrong session cookie
        Internal    // E.g., C++ logic bug or I/O failure
    };

    // The standardized error payload
    struct ServiceError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a ServiceError.
    template <typename T>
    using Result = std::variant<T, ServiceError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServiceError>(result);
    }

    template <typename T>
    const ServiceError& get_error(const Result<T>& result) {
        return std::get<ServiceError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Protocol:  return "protocol";
            case ErrorCategory::State:     return "state";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Auth:      return "auth";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace turnstile::core::errors

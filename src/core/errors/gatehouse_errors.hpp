#pragma once
#include <string>
#include <variant>

namespace gatehouse::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // Malformed tool arguments or CLI flags
        Execution,  // A spawned command or file operation failed
        Policy,     // A guard refused the request
        Config,     // Startup configuration is unusable
        Internal    // pipe/fork failures and similar
    };

    // The standardized error payload surfaced to tool callers
    struct GatehouseError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy
    // A Result holds either the value T or an error of type E. Guards use
    // their own rejection types for E; everything else uses GatehouseError.
    template <typename T, typename E = GatehouseError>
    using Result = std::variant<T, E>;

    template <typename T, typename E>
    bool is_error(const std::variant<T, E>& result) {
        return std::holds_alternative<E>(result);
    }

    template <typename T, typename E>
    const E& get_error(const std::variant<T, E>& result) {
        return std::get<E>(result);
    }

    template <typename T, typename E>
    const T& get_value(const std::variant<T, E>& result) {
        return std::get<T>(result);
    }

    template <typename T, typename E>
    T& get_value(std::variant<T, E>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Policy:
                return "policy";
            case ErrorCategory::Config:
                return "config";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace gatehouse::core::errors

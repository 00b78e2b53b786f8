#pragma once
#include <string>
#include <variant>

namespace relay::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,     // E.g., HTTP body is not valid JSON, command carries a newline
        Config,    // E.g., descriptor file unreadable or server name unknown
        Setup,     // E.g., clone or install command failed
        Launch,    // E.g., interpreter could not be spawned
        Protocol,  // E.g., agent process timed out or closed stdout
        Internal   // E.g., pipe creation failed
    };

    // The standardized error payload
    struct RelayError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a RelayError.
    template <typename T>
    using Result = std::variant<T, RelayError>;

    // Operations that succeed without producing a value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RelayError>(result);
    }

    template <typename T>
    const RelayError& get_error(const Result<T>& result) {
        return std::get<RelayError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Config:
                return "config";
            case ErrorCategory::Setup:
                return "setup";
            case ErrorCategory::Launch:
                return "launch";
            case ErrorCategory::Protocol:
                return "protocol";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

    // "[code] message" form used in log lines.
    inline std::string describe(const RelayError& error) {
        return "[" + error.code + "] " + error.message;
    }

} // namespace relay::core::errors

#pragma once
#include <string>
#include <utility>
#include <variant>

namespace stride::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,        // E.g., an empty task or an unknown CLI flag
        Setup,        // E.g., unsupported provider or missing credential
        Transport,    // E.g., network failure or the remote API rejected the request
        Execution,    // E.g., a tool failed while running
        Persistence,  // E.g., a snapshot or trajectory could not be read or written
        Internal      // E.g., a logic bug or an exception escaping a collaborator
    };

    // The standardized error payload
    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";              // Helpful tips for the user
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    // Result for operations that produce nothing but may fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:       return "input";
            case ErrorCategory::Setup:       return "setup";
            case ErrorCategory::Transport:   return "transport";
            case ErrorCategory::Execution:   return "execution";
            case ErrorCategory::Persistence: return "persistence";
            case ErrorCategory::Internal:    return "internal";
            default: return "unknown";
        }
    }

    // "[code] message", the form used in logs and summaries
    inline std::string describe(const AgentError& error) {
        return "[" + error.code + "] " + error.message;
    }

} // namespace stride::core::errors

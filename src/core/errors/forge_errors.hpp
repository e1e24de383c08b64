#pragma once
#include <string>
#include <utility>
#include <variant>

namespace forge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Validation,  // E.g., tool arguments do not match the schema
        Sandbox,     // E.g., a path resolves outside the workspace root
        Permission,  // E.g., denied by the permission mode
        Execution,   // E.g., a tool or a process failed
        Transport,   // E.g., the model stream broke after all retries
        Fatal,       // E.g., duplicate tool registration at startup
        Input,       // E.g., an invalid CLI flag or config value
        Internal     // E.g., a broken engine invariant
    };

    // The standardized error payload
    struct ForgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ForgeError.
    template <typename T>
    using Result = std::variant<T, ForgeError>;

    // Result for operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ForgeError>(result);
    }

    template <typename T>
    const ForgeError& get_error(const Result<T>& result) {
        return std::get<ForgeError>(result);
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
            case ErrorCategory::Validation: return "validation_error";
            case ErrorCategory::Sandbox:    return "sandbox_violation";
            case ErrorCategory::Permission: return "permission_denied";
            case ErrorCategory::Execution:  return "execution_error";
            case ErrorCategory::Transport:  return "transport_error";
            case ErrorCategory::Fatal:      return "fatal_engine_error";
            case ErrorCategory::Input:      return "input_error";
            case ErrorCategory::Internal:   return "internal_error";
            default: return "unknown";
        }
    }

    // "sandbox_violation [path_outside_workspace]: Path escapes workspace root: /etc"
    inline std::string describe(const ForgeError& error) {
        return to_string(error.category) + " [" + error.code + "]: " + error.message;
    }

} // namespace forge::core::errors

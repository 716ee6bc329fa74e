#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace stride::model {

// Why the model stopped generating
enum class FinishReason {
    Stop,
    ToolUse,
    MaxTokens,
    ContentFilter
};

struct ChatOptions {
    std::optional<std::uint32_t> max_tokens;
    std::optional<double> temperature;
    // Polled by transports that can abandon a request in flight; unset means never
    std::function<bool()> cancelled;
};

struct ModelResponse {
    protocol::Message message;
    std::optional<protocol::TokenUsage> usage;
    std::optional<FinishReason> finish_reason;
    std::string model;
};

// Model capability consumed by the engine. Vendor wire formats live in the
// implementations; the engine only sees messages in and a message out.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual core::errors::Result<ModelResponse> complete(
        const std::vector<protocol::Message>& messages,
        const std::vector<protocol::ToolDefinition>& tools,
        const ChatOptions& options) = 0;

    virtual std::string model_name() const = 0;
    virtual std::string provider_name() const = 0;
};

std::string to_string(FinishReason reason);
std::optional<FinishReason> finish_reason_from_string(const std::string& value);

// --- Transport error constructors shared by model clients ---

inline core::errors::AgentError authentication_error(const std::string& message) {
    return {core::errors::ErrorCategory::Transport, message, "authentication_failed",
            "Check the API key configured for this provider."};
}

inline core::errors::AgentError network_error(const std::string& message) {
    return {core::errors::ErrorCategory::Transport, message, "network_error"};
}

inline core::errors::AgentError malformed_request(const std::string& message) {
    return {core::errors::ErrorCategory::Transport, message, "malformed_request"};
}

inline core::errors::AgentError remote_rejected(const int status, const std::string& message) {
    return {core::errors::ErrorCategory::Transport,
            "Remote rejected request (status " + std::to_string(status) + "): " + message,
            "remote_rejected"};
}

inline core::errors::AgentError unsupported_capability(const std::string& message) {
    return {core::errors::ErrorCategory::Transport, message, "unsupported_capability"};
}

}  // namespace stride::model

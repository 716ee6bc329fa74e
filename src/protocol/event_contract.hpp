#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "protocol/run_execution_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace stride::protocol {

    enum class ToolExecutionStatus {
        Executing,
        Success,
        Error
    };

    struct ToolExecutionInfo {
        std::string execution_id;   // the tool-use id
        std::string tool_name;
        nlohmann::json parameters = nlohmann::json::object();
        ToolExecutionStatus status = ToolExecutionStatus::Executing;
        std::optional<ToolResult> result;
    };

    enum class MessageLevel {
        Debug,
        Normal,
        Info,
        Warning,
        Error
    };

    // Run lifecycle
    struct ExecutionStartedEvent { ExecutionContext context; };
    struct ExecutionCompletedEvent { ExecutionContext context; bool success = false; std::string summary; };
    struct ExecutionInterruptedEvent { ExecutionContext context; std::string reason; };

    // Steps
    struct StepStartedEvent { std::uint32_t step_number = 0; std::string task; };
    struct StepCompletedEvent { std::uint32_t step_number = 0; bool success = false; };

    // Tools
    struct ToolExecutionStartedEvent { ToolExecutionInfo tool_info; };
    struct ToolExecutionUpdatedEvent { ToolExecutionInfo tool_info; };
    struct ToolExecutionCompletedEvent { ToolExecutionInfo tool_info; };

    // Progress
    struct AgentThinkingEvent { std::uint32_t step_number = 0; std::string thinking; };
    struct TokenUsageUpdatedEvent { TokenUsage token_usage; };
    struct StatusUpdateEvent { std::string status; nlohmann::json metadata = nlohmann::json::object(); };
    struct MessageEvent { MessageLevel level = MessageLevel::Normal; std::string content; };

    // History compression
    struct CompressionStartedEvent {
        std::string level;
        std::size_t current_tokens = 0;
        std::size_t target_tokens = 0;
        std::string reason;
    };
    struct CompressionCompletedEvent {
        std::string summary;
        std::size_t tokens_saved = 0;
        std::size_t messages_before = 0;
        std::size_t messages_after = 0;
    };
    struct CompressionFailedEvent { std::string error; std::string fallback_action; };

    // "AgentEvent" is exactly ONE of the types listed below.
    using AgentEvent = std::variant<
        ExecutionStartedEvent,
        ExecutionCompletedEvent,
        ExecutionInterruptedEvent,
        StepStartedEvent,
        StepCompletedEvent,
        ToolExecutionStartedEvent,
        ToolExecutionUpdatedEvent,
        ToolExecutionCompletedEvent,
        AgentThinkingEvent,
        TokenUsageUpdatedEvent,
        StatusUpdateEvent,
        MessageEvent,
        CompressionStartedEvent,
        CompressionCompletedEvent,
        CompressionFailedEvent
    >;

    // Stable snake_case name of the active alternative, e.g. "execution_started"
    std::string event_name(const AgentEvent& event);

    std::string to_string(ToolExecutionStatus status);
    std::string to_string(MessageLevel level);

} // namespace stride::protocol

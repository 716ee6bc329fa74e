#include "protocol/event_contract.hpp"

namespace stride::protocol {

namespace {

struct EventNamer {
    std::string operator()(const ExecutionStartedEvent&) const { return "execution_started"; }
    std::string operator()(const ExecutionCompletedEvent&) const { return "execution_completed"; }
    std::string operator()(const ExecutionInterruptedEvent&) const { return "execution_interrupted"; }
    std::string operator()(const StepStartedEvent&) const { return "step_started"; }
    std::string operator()(const StepCompletedEvent&) const { return "step_completed"; }
    std::string operator()(const ToolExecutionStartedEvent&) const { return "tool_execution_started"; }
    std::string operator()(const ToolExecutionUpdatedEvent&) const { return "tool_execution_updated"; }
    std::string operator()(const ToolExecutionCompletedEvent&) const { return "tool_execution_completed"; }
    std::string operator()(const AgentThinkingEvent&) const { return "agent_thinking"; }
    std::string operator()(const TokenUsageUpdatedEvent&) const { return "token_usage_updated"; }
    std::string operator()(const StatusUpdateEvent&) const { return "status_update"; }
    std::string operator()(const MessageEvent&) const { return "message"; }
    std::string operator()(const CompressionStartedEvent&) const { return "compression_started"; }
    std::string operator()(const CompressionCompletedEvent&) const { return "compression_completed"; }
    std::string operator()(const CompressionFailedEvent&) const { return "compression_failed"; }
};

}  // namespace

std::string event_name(const AgentEvent& event) {
    return std::visit(EventNamer{}, event);
}

std::string to_string(const ToolExecutionStatus status) {
    switch (status) {
        case ToolExecutionStatus::Executing:
            return "executing";
        case ToolExecutionStatus::Success:
            return "success";
        case ToolExecutionStatus::Error:
            return "error";
        default:
            return "unknown";
    }
}

std::string to_string(const MessageLevel level) {
    switch (level) {
        case MessageLevel::Debug:
            return "debug";
        case MessageLevel::Normal:
            return "normal";
        case MessageLevel::Info:
            return "info";
        case MessageLevel::Warning:
            return "warning";
        case MessageLevel::Error:
            return "error";
        default:
            return "unknown";
    }
}

}  // namespace stride::protocol

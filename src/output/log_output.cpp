#include "output/log_output.hpp"

#include <iostream>
#include <variant>
#include "core/logging/logger.hpp"

namespace stride::output {

using core::logging::Logger;
using core::logging::LogLevel;
using namespace stride::protocol;

namespace {

std::string format_usage(const TokenUsage& usage) {
    return std::to_string(usage.input_tokens) + " input + " +
           std::to_string(usage.output_tokens) + " output = " +
           std::to_string(usage.total_tokens) + " total";
}

std::string shorten(const std::string& text) {
    constexpr std::size_t kMaxLength = 240;
    if (text.size() <= kMaxLength) {
        return text;
    }
    return text.substr(0, kMaxLength) + "...";
}

struct EventLogger {
    void operator()(const ExecutionStartedEvent& e) const {
        Logger::get().log(LogLevel::INFO, "Task started: " + e.context.current_task);
        Logger::get().log(LogLevel::DEBUG, "Original goal: " + e.context.original_goal);
        Logger::get().log(LogLevel::DEBUG, "Project path: " + e.context.project_path);
    }
    void operator()(const ExecutionCompletedEvent& e) const {
        Logger::get().log(e.success ? LogLevel::INFO : LogLevel::WARN,
                          std::string(e.success ? "Task completed: " : "Task failed: ") +
                              e.summary);
        Logger::get().log(LogLevel::INFO,
                          "Executed " + std::to_string(e.context.current_step) + " steps in " +
                              std::to_string(e.context.execution_time.count()) + " ms");
        if (e.context.token_usage.total_tokens > 0) {
            Logger::get().log(LogLevel::INFO, "Tokens: " + format_usage(e.context.token_usage));
        }
    }
    void operator()(const ExecutionInterruptedEvent& e) const {
        Logger::get().log(LogLevel::WARN, "Task interrupted: " + e.reason + " (after " +
                                              std::to_string(e.context.current_step) +
                                              " steps)");
    }
    void operator()(const StepStartedEvent& e) const {
        Logger::get().log(LogLevel::DEBUG, "Step " + std::to_string(e.step_number) + ": " + e.task);
    }
    void operator()(const StepCompletedEvent& e) const {
        Logger::get().log(LogLevel::DEBUG, "Step " + std::to_string(e.step_number) +
                                               (e.success ? " done" : " failed"));
    }
    void operator()(const ToolExecutionStartedEvent& e) const {
        std::string line = "Tool " + e.tool_info.tool_name + " started";
        if (Logger::get().enabled(LogLevel::DEBUG)) {
            line += " with " + shorten(e.tool_info.parameters.dump());
        }
        Logger::get().log(LogLevel::INFO, line);
    }
    void operator()(const ToolExecutionUpdatedEvent& e) const {
        Logger::get().log(LogLevel::DEBUG, "Tool " + e.tool_info.tool_name + " " +
                                               to_string(e.tool_info.status));
    }
    void operator()(const ToolExecutionCompletedEvent& e) const {
        const auto level =
            e.tool_info.status == ToolExecutionStatus::Success ? LogLevel::INFO : LogLevel::WARN;
        std::string line = "Tool " + e.tool_info.tool_name + " " + to_string(e.tool_info.status);
        if (e.tool_info.result.has_value()) {
            line += ": " + shorten(e.tool_info.result->content);
        }
        Logger::get().log(level, line);
    }
    void operator()(const AgentThinkingEvent& e) const {
        Logger::get().log(LogLevel::INFO, "Thinking: " + e.thinking);
    }
    void operator()(const TokenUsageUpdatedEvent& e) const {
        Logger::get().log(LogLevel::DEBUG, "Tokens: " + format_usage(e.token_usage));
    }
    void operator()(const StatusUpdateEvent& e) const {
        Logger::get().log(LogLevel::INFO, "Status: " + e.status);
    }
    void operator()(const MessageEvent& e) const {
        switch (e.level) {
            case MessageLevel::Debug:
                Logger::get().log(LogLevel::DEBUG, e.content);
                break;
            case MessageLevel::Warning:
                Logger::get().log(LogLevel::WARN, e.content);
                break;
            case MessageLevel::Error:
                Logger::get().log(LogLevel::ERROR, e.content);
                break;
            default:
                Logger::get().log(LogLevel::INFO, e.content);
                break;
        }
    }
    void operator()(const CompressionStartedEvent& e) const {
        Logger::get().log(LogLevel::INFO, "Compressing history (" + e.level + "): " + e.reason);
    }
    void operator()(const CompressionCompletedEvent& e) const {
        Logger::get().log(LogLevel::INFO,
                          "History compressed " + std::to_string(e.messages_before) + " -> " +
                              std::to_string(e.messages_after) + " messages, saved " +
                              std::to_string(e.tokens_saved) + " tokens");
    }
    void operator()(const CompressionFailedEvent& e) const {
        Logger::get().log(LogLevel::WARN,
                          "History compression failed: " + e.error + "; " + e.fallback_action);
    }
};

}  // namespace

LogOutput::LogOutput(const bool auto_approve) : auto_approve_(auto_approve) {}

core::errors::Status LogOutput::emit(const AgentEvent& event) {
    std::visit(EventLogger{}, event);
    return core::errors::ok();
}

core::errors::Result<ConfirmationDecision> LogOutput::request_confirmation(
    const ConfirmationRequest& request) {
    STRIDE_LOG_INFO(request.title + (auto_approve_ ? ": auto-approved" : ": denied"));
    if (auto_approve_) {
        return ConfirmationDecision{true, std::nullopt};
    }
    return ConfirmationDecision{false, std::string("Confirmation requires --yes")};
}

core::errors::Status LogOutput::flush() {
    std::cout.flush();
    return core::errors::ok();
}

}  // namespace stride::output

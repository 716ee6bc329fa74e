#include "model/model_client.hpp"

namespace stride::model {

std::string to_string(const FinishReason reason) {
    switch (reason) {
        case FinishReason::Stop:
            return "stop";
        case FinishReason::ToolUse:
            return "tool_use";
        case FinishReason::MaxTokens:
            return "max_tokens";
        case FinishReason::ContentFilter:
            return "content_filter";
        default:
            return "unknown";
    }
}

std::optional<FinishReason> finish_reason_from_string(const std::string& value) {
    if (value == "stop") {
        return FinishReason::Stop;
    }
    if (value == "tool_use") {
        return FinishReason::ToolUse;
    }
    if (value == "max_tokens") {
        return FinishReason::MaxTokens;
    }
    if (value == "content_filter") {
        return FinishReason::ContentFilter;
    }
    return std::nullopt;
}

}  // namespace stride::model

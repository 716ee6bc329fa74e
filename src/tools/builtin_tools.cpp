#include "tools/builtin_tools.hpp"

#include <algorithm>

namespace stride::tools {

using nlohmann::json;
using protocol::ToolCall;
using protocol::ToolResult;

std::string TaskDoneTool::description() const {
    return "Report that the task is complete. Call this only after the work has been "
           "verified.";
}

json TaskDoneTool::parameters_schema() const {
    return json{{"type", "object"},
                {"properties",
                 {{"summary", {{"type", "string"},
                               {"description", "Short description of what was done"}}}}},
                {"required", json::array()}};
}

ToolTraits TaskDoneTool::traits() const {
    ToolTraits traits;
    traits.completion_signal = true;
    return traits;
}

core::errors::Result<ToolResult> TaskDoneTool::execute(const ToolCall& call) {
    std::string summary = "Task done.";
    if (call.parameters.contains("summary") && call.parameters.at("summary").is_string()) {
        summary = call.parameters.at("summary").get<std::string>();
    }
    auto result = ToolResult::ok(call.id, summary);
    result.data = json{{"summary", summary}};
    return result;
}

std::string SequentialThinkingTool::description() const {
    return "Think through a problem one numbered thought at a time. Each call records "
           "a single thought.";
}

json SequentialThinkingTool::parameters_schema() const {
    return json{{"type", "object"},
                {"properties",
                 {{"thought", {{"type", "string"}}},
                  {"thought_number", {{"type", "integer"}, {"minimum", 1}}},
                  {"total_thoughts", {{"type", "integer"}, {"minimum", 1}}},
                  {"next_thought_needed", {{"type", "boolean"}}}}},
                {"required", json::array({"thought"})}};
}

ToolTraits SequentialThinkingTool::traits() const {
    ToolTraits traits;
    traits.thought_stream = true;
    return traits;
}

core::errors::Result<ToolResult> SequentialThinkingTool::execute(const ToolCall& call) {
    const auto& params = call.parameters;
    if (!params.contains("thought") || !params.at("thought").is_string() ||
        params.at("thought").get<std::string>().empty()) {
        return ToolResult::error(call.id, "Invalid thought: a non-empty string is required.");
    }

    const auto thought = params.at("thought").get<std::string>();
    const int number = params.value("thought_number", 1);
    const int total = std::max(params.value("total_thoughts", number), number);
    const bool next_needed = params.value("next_thought_needed", false);

    auto result = ToolResult::ok(
        call.id, "Thought: " + thought + "\n\nThought " + std::to_string(number) + "/" +
                     std::to_string(total) +
                     (next_needed ? ", more thoughts needed." : ", thinking complete."));
    result.data = json{{"thought", thought},
                       {"thought_number", number},
                       {"total_thoughts", total},
                       {"next_thought_needed", next_needed}};
    return result;
}

}  // namespace stride::tools

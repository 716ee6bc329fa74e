#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace stride::protocol {

    // How the model asks the tool layer to do something
    struct ToolCall {
        std::string id;
        std::string name;                                       // e.g. "task_done"
        nlohmann::json parameters = nlohmann::json::object();
    };

    // How the tool layer replies back
    struct ToolResult {
        std::string tool_call_id;
        bool success = false;
        std::string content;                  // text handed back to the model
        std::optional<nlohmann::json> data;   // structured output, when the tool has any
        double duration_ms = 0.0;

        static ToolResult ok(std::string tool_call_id, std::string content);
        static ToolResult error(std::string tool_call_id, std::string message);
    };

    // Schema advertised to the model
    struct ToolDefinition {
        std::string name;
        std::string description;
        nlohmann::json parameters = nlohmann::json::object();
    };

    void to_json(nlohmann::json& j, const ToolCall& call);
    void from_json(const nlohmann::json& j, ToolCall& call);
    void to_json(nlohmann::json& j, const ToolResult& result);
    void from_json(const nlohmann::json& j, ToolResult& result);
    void to_json(nlohmann::json& j, const ToolDefinition& definition);

} // namespace stride::protocol

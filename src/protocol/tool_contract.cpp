#include "protocol/tool_contract.hpp"

#include <utility>

namespace stride::protocol {

using nlohmann::json;

ToolResult ToolResult::ok(std::string tool_call_id, std::string content) {
    ToolResult result;
    result.tool_call_id = std::move(tool_call_id);
    result.success = true;
    result.content = std::move(content);
    return result;
}

ToolResult ToolResult::error(std::string tool_call_id, std::string message) {
    ToolResult result;
    result.tool_call_id = std::move(tool_call_id);
    result.success = false;
    result.content = std::move(message);
    return result;
}

void to_json(json& j, const ToolCall& call) {
    j = json{{"id", call.id}, {"name", call.name}, {"parameters", call.parameters}};
}

void from_json(const json& j, ToolCall& call) {
    call.id = j.at("id").get<std::string>();
    call.name = j.at("name").get<std::string>();
    call.parameters = j.value("parameters", json::object());
}

void to_json(json& j, const ToolResult& result) {
    j = json{{"tool_call_id", result.tool_call_id},
             {"success", result.success},
             {"content", result.content},
             {"duration_ms", result.duration_ms}};
    j["data"] = result.data.has_value() ? result.data.value() : json();
}

void from_json(const json& j, ToolResult& result) {
    result.tool_call_id = j.at("tool_call_id").get<std::string>();
    result.success = j.at("success").get<bool>();
    result.content = j.at("content").get<std::string>();
    result.duration_ms = j.value("duration_ms", 0.0);
    result.data.reset();
    if (j.contains("data") && !j.at("data").is_null()) {
        result.data = j.at("data");
    }
}

void to_json(json& j, const ToolDefinition& definition) {
    j = json{{"name", definition.name},
             {"description", definition.description},
             {"parameters", definition.parameters}};
}

}  // namespace stride::protocol

#include "tools/tool_registry.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/builtin_tools.hpp"

namespace stride::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolCall;
using protocol::ToolResult;

ToolExecutor::ToolExecutor(std::vector<std::shared_ptr<Tool>> tools)
    : tools_(std::move(tools)) {}

void ToolExecutor::add_tool(std::shared_ptr<Tool> tool) {
    if (tool == nullptr) {
        return;
    }
    for (auto& existing : tools_) {
        if (existing->name() == tool->name()) {
            existing = std::move(tool);
            return;
        }
    }
    tools_.push_back(std::move(tool));
}

std::shared_ptr<Tool> ToolExecutor::get_tool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->name() == name) {
            return tool;
        }
    }
    return nullptr;
}

core::errors::Result<ToolResult> ToolExecutor::execute(const ToolCall& call) const {
    auto tool = get_tool(call.name);
    if (tool == nullptr) {
        return AgentError{ErrorCategory::Execution, "Tool not found: " + call.name,
                          "unknown_tool"};
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = tool->execute(call);
    if (core::errors::is_error(result)) {
        return result;
    }

    auto tool_result = core::errors::take_value(std::move(result));
    tool_result.tool_call_id = call.id;
    tool_result.duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();
    return tool_result;
}

bool ToolExecutor::requires_confirmation(const std::string& name) const {
    auto tool = get_tool(name);
    return tool != nullptr && tool->requires_confirmation();
}

ToolTraits ToolExecutor::traits(const std::string& name) const {
    auto tool = get_tool(name);
    return tool == nullptr ? ToolTraits{} : tool->traits();
}

std::vector<protocol::ToolDefinition> ToolExecutor::list_definitions() const {
    std::vector<protocol::ToolDefinition> definitions;
    definitions.reserve(tools_.size());
    for (const auto& tool : tools_) {
        definitions.push_back(tool->definition());
    }
    return definitions;
}

std::vector<std::string> ToolExecutor::list_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool->name());
    }
    return names;
}

void ToolRegistry::register_factory(const std::string& name, ToolFactory factory) {
    factories_[name] = std::move(factory);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::vector<std::string> names;
    for (const auto& entry : factories_) {
        names.push_back(entry.first);
    }
    return names;
}

ToolExecutor ToolRegistry::create_executor(const std::vector<std::string>& names) const {
    ToolExecutor executor;
    for (const auto& name : names) {
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            STRIDE_LOG_WARN("ToolRegistry: unknown tool '" + name + "' skipped");
            continue;
        }
        executor.add_tool(it->second());
    }
    return executor;
}

ToolRegistry ToolRegistry::with_builtin_tools() {
    ToolRegistry registry;
    registry.register_factory(TaskDoneTool::kName,
                              []() { return std::make_shared<TaskDoneTool>(); });
    registry.register_factory(SequentialThinkingTool::kName,
                              []() { return std::make_shared<SequentialThinkingTool>(); });
    return registry;
}

}  // namespace stride::tools

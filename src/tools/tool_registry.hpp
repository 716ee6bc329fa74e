#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool.hpp"

namespace stride::tools {

// The set of tools enabled for one engine.
class ToolExecutor {
public:
    ToolExecutor() = default;
    explicit ToolExecutor(std::vector<std::shared_ptr<Tool>> tools);

    void add_tool(std::shared_ptr<Tool> tool);

    core::errors::Result<protocol::ToolResult> execute(const protocol::ToolCall& call) const;

    // Unknown tools never require confirmation; executing them fails anyway.
    bool requires_confirmation(const std::string& name) const;
    ToolTraits traits(const std::string& name) const;

    std::shared_ptr<Tool> get_tool(const std::string& name) const;
    std::vector<protocol::ToolDefinition> list_definitions() const;
    std::vector<std::string> list_names() const;

private:
    std::vector<std::shared_ptr<Tool>> tools_;
};

using ToolFactory = std::function<std::shared_ptr<Tool>()>;

// Name -> factory map from which executors are assembled.
class ToolRegistry {
public:
    void register_factory(const std::string& name, ToolFactory factory);
    bool has_tool(const std::string& name) const;
    std::vector<std::string> tool_names() const;

    // Builds an executor with the requested tools, in request order.
    // Unknown names are skipped with a warning.
    ToolExecutor create_executor(const std::vector<std::string>& names) const;

    // Registry preloaded with task_done and sequentialthinking
    static ToolRegistry with_builtin_tools();

private:
    std::map<std::string, ToolFactory> factories_;
};

}  // namespace stride::tools

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "tools/tool.hpp"

namespace stride::tools {

// Lets the model declare the task finished. A successful call ends the run.
class TaskDoneTool : public Tool {
public:
    static constexpr const char* kName = "task_done";

    std::string name() const override { return kName; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    ToolTraits traits() const override;

    core::errors::Result<protocol::ToolResult> execute(
        const protocol::ToolCall& call) override;
};

// Scratchpad for step-by-step reasoning. Echoes the thought back both as
// structured data and as "Thought: ..." text.
class SequentialThinkingTool : public Tool {
public:
    static constexpr const char* kName = "sequentialthinking";

    std::string name() const override { return kName; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    ToolTraits traits() const override;

    core::errors::Result<protocol::ToolResult> execute(
        const protocol::ToolCall& call) override;
};

}  // namespace stride::tools

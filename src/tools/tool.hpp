#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace stride::tools {

// Capabilities a tool declares about itself. The engine reacts to these
// flags instead of to particular tool names.
struct ToolTraits {
    bool completion_signal = false;   // a successful call ends the task
    bool thought_stream = false;      // output carries the model's reasoning
};

class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual nlohmann::json parameters_schema() const = 0;

    virtual bool requires_confirmation() const { return false; }
    virtual ToolTraits traits() const { return {}; }

    // Returning an error (or throwing) is converted by the engine into an
    // error result for the model; it never aborts the task.
    virtual core::errors::Result<protocol::ToolResult> execute(
        const protocol::ToolCall& call) = 0;

    protocol::ToolDefinition definition() const {
        return {name(), description(), parameters_schema()};
    }
};

}  // namespace stride::tools

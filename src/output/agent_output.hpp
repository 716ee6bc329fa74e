#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"

namespace stride::output {

enum class ConfirmationKind {
    ToolExecution
};

struct ConfirmationRequest {
    std::string id;
    ConfirmationKind kind = ConfirmationKind::ToolExecution;
    std::string title;
    std::string message;
    nlohmann::json metadata = nlohmann::json::object();
};

struct ConfirmationDecision {
    bool approved = false;
    std::optional<std::string> note;
};

// Event sink consumed by the engine. Renderers (terminal, UI bridge, logs)
// implement this; the engine never depends on how events are shown.
class AgentOutput {
public:
    virtual ~AgentOutput() = default;

    virtual core::errors::Status emit(const protocol::AgentEvent& event) = 0;

    virtual core::errors::Result<ConfirmationDecision> request_confirmation(
        const ConfirmationRequest& request) = 0;

    virtual core::errors::Status flush() { return core::errors::ok(); }
};

// Discards every event and denies every confirmation.
class NullOutput : public AgentOutput {
public:
    core::errors::Status emit(const protocol::AgentEvent& /*event*/) override {
        return core::errors::ok();
    }

    core::errors::Result<ConfirmationDecision> request_confirmation(
        const ConfirmationRequest& /*request*/) override {
        return ConfirmationDecision{false, std::string("No confirmation channel")};
    }
};

}  // namespace stride::output

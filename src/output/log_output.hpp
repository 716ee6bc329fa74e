#pragma once

#include "output/agent_output.hpp"

namespace stride::output {

// Renders events as log lines. Confirmation requests are answered from a
// fixed policy since a log has nobody to ask.
class LogOutput : public AgentOutput {
public:
    explicit LogOutput(bool auto_approve = false);

    core::errors::Status emit(const protocol::AgentEvent& event) override;

    core::errors::Result<ConfirmationDecision> request_confirmation(
        const ConfirmationRequest& request) override;

    core::errors::Status flush() override;

private:
    bool auto_approve_;
};

}  // namespace stride::output

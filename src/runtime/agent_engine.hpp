#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "context/conversation_manager.hpp"
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "model/model_client.hpp"
#include "output/agent_output.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/cancellation.hpp"
#include "session/context_snapshot.hpp"
#include "tools/tool_registry.hpp"
#include "trajectory/trajectory_recorder.hpp"

namespace stride::runtime {

// Drives one agent: calls the model, runs the tools it asks for and folds
// the results back into the conversation until the task completes, fails or
// is cancelled. Not synchronized; run at most one task at a time per engine.
class AgentEngine {
public:
    static constexpr const char* kAgentType = "stride_agent";
    static constexpr std::size_t kFallbackMaxMessages = 50;

    AgentEngine(core::config::AgentConfig config, std::shared_ptr<model::ModelClient> model,
                tools::ToolExecutor tool_executor, std::shared_ptr<output::AgentOutput> output);

    // Runs against the current working directory
    core::errors::Result<protocol::AgentExecution> execute_task(const std::string& task);

    // Keeps history and original goal from earlier tasks on this engine.
    // Only an empty task is reported as an error; every other outcome,
    // including model failures and cancellation, is in the AgentExecution.
    core::errors::Result<protocol::AgentExecution> execute_task_with_context(
        const std::string& task, const std::filesystem::path& project_path);

    // Cancels the task in flight through the current controller
    void cancel();

    // Scopes cancellation to the next task. The old controller can still
    // cancel whatever it was handed to.
    void set_cancellation_controller(CancellationController controller);
    const CancellationController& cancellation_controller() const { return cancellation_; }

    void set_trajectory_recorder(std::shared_ptr<trajectory::TrajectoryRecorder> recorder);
    std::shared_ptr<trajectory::TrajectoryRecorder> trajectory_recorder() const {
        return recorder_;
    }

    // Overrides the configured prompt; nullopt restores the built-in one
    void set_system_prompt(std::optional<std::string> system_prompt);

    // Model used to summarize history when it has to be compressed
    void set_summarizer(std::shared_ptr<model::ModelClient> summarizer);

    const std::vector<protocol::Message>& history() const { return history_; }
    const std::optional<protocol::ExecutionContext>& execution_context() const {
        return context_;
    }
    const core::config::AgentConfig& config() const { return config_; }
    std::string agent_type() const { return kAgentType; }

    // --- Persisted context ---

    session::PersistedContext export_snapshot() const;
    std::string export_snapshot_json() const;
    core::errors::Status export_snapshot_to_file(const std::filesystem::path& path) const;

    // Adopts the snapshot config only when it carries one
    void restore(session::PersistedContext snapshot);
    core::errors::Status restore_from_json(const std::string& text);
    core::errors::Status restore_from_file(const std::filesystem::path& path);

    // Replaces the history and forgets the execution context
    void restore_history_only(std::vector<protocol::Message> messages);

private:
    enum class StepOutcome {
        Continue,
        Completed,
        Interrupted
    };

    core::errors::Result<StepOutcome> execute_step(std::uint32_t step,
                                                   const CancellationRegistration& registration,
                                                   const std::string& project_path);

    core::errors::Result<model::ModelResponse> call_model(
        const std::vector<protocol::Message>& messages,
        const CancellationRegistration& registration);
    protocol::ToolResult invoke_tool(const protocol::ToolCall& call);
    bool confirm_tool(const protocol::ToolCall& call);
    void emit_thinking(std::uint32_t step, const protocol::ToolResult& result);

    void apply_compression();
    void repair_dangling_tool_uses();
    std::string system_prompt(const std::string& project_path) const;

    // Failures here are logged and never change the outcome of a task
    void emit(const protocol::AgentEvent& event);
    void record(std::uint32_t step, trajectory::EntryType entry);

    core::config::AgentConfig config_;
    std::shared_ptr<model::ModelClient> model_;
    tools::ToolExecutor tools_;
    std::shared_ptr<output::AgentOutput> output_;
    std::shared_ptr<model::ModelClient> summarizer_;
    context::ConversationManager conversation_;
    CancellationController cancellation_;
    std::shared_ptr<trajectory::TrajectoryRecorder> recorder_;

    std::vector<protocol::Message> history_;
    std::optional<protocol::ExecutionContext> context_;
};

}  // namespace stride::runtime

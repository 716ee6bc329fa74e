#include <cstddef>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/agent_config.hpp"
#include "core/config/ids.hpp"
#include "core/errors/agent_errors.hpp"
#include "model/scripted_model_client.hpp"
#include "output/agent_output.hpp"
#include "runtime/agent_engine.hpp"
#include "runtime/cancellation.hpp"
#include "tools/tool_registry.hpp"
#include "trajectory/trajectory_recorder.hpp"

namespace {

using nlohmann::json;
using stride::core::config::AgentConfig;
using stride::core::errors::AgentError;
using stride::core::errors::ErrorCategory;
using stride::core::errors::get_error;
using stride::core::errors::get_value;
using stride::core::errors::is_error;
using stride::core::errors::Result;
using stride::core::errors::Status;
using stride::model::ChatOptions;
using stride::model::ModelClient;
using stride::model::ModelResponse;
using stride::model::ScriptedModelClient;
using stride::output::AgentOutput;
using stride::output::ConfirmationDecision;
using stride::output::ConfirmationRequest;
using stride::protocol::AgentEvent;
using stride::protocol::AgentExecution;
using stride::protocol::ContentBlock;
using stride::protocol::Message;
using stride::protocol::Role;
using stride::protocol::RunOutcome;
using stride::protocol::TokenUsage;
using stride::protocol::ToolCall;
using stride::protocol::ToolDefinition;
using stride::protocol::ToolResult;
using stride::protocol::ToolResultBlock;
using stride::protocol::ToolUseBlock;
using stride::runtime::AgentEngine;
using stride::runtime::CancellationController;
using stride::tools::Tool;
using stride::tools::ToolExecutor;
using stride::tools::ToolRegistry;
using stride::trajectory::TrajectoryRecorder;

namespace events = stride::protocol;

// Keeps every event; can be told to fail or throw on emit.
class RecordingOutput : public AgentOutput {
public:
    enum class EmitMode { Ok, Fail, Throw };

    explicit RecordingOutput(bool approve = false) : approve_(approve) {}

    Status emit(const AgentEvent& event) override {
        emitted.push_back(event);
        if (mode == EmitMode::Fail) {
            return AgentError{ErrorCategory::Internal, "sink closed", "emit_failed"};
        }
        if (mode == EmitMode::Throw) {
            throw std::runtime_error("renderer crashed");
        }
        return stride::core::errors::ok();
    }

    Result<ConfirmationDecision> request_confirmation(const ConfirmationRequest& request) override {
        confirmations.push_back(request);
        return ConfirmationDecision{approve_, std::nullopt};
    }

    template <typename T>
    std::size_t count() const {
        std::size_t n = 0;
        for (const auto& event : emitted) {
            if (std::holds_alternative<T>(event)) {
                ++n;
            }
        }
        return n;
    }

    template <typename T>
    const T* last() const {
        for (auto it = emitted.rbegin(); it != emitted.rend(); ++it) {
            if (const auto* match = std::get_if<T>(&*it)) {
                return match;
            }
        }
        return nullptr;
    }

    std::size_t terminal_count() const {
        return count<events::ExecutionCompletedEvent>() +
               count<events::ExecutionInterruptedEvent>();
    }

    std::vector<AgentEvent> emitted;
    std::vector<ConfirmationRequest> confirmations;
    EmitMode mode = EmitMode::Ok;

private:
    bool approve_;
};

class ThrowingTool : public Tool {
public:
    std::string name() const override { return "explode"; }
    std::string description() const override { return "Always throws"; }
    json parameters_schema() const override { return json{{"type", "object"}}; }

    Result<ToolResult> execute(const ToolCall& /*call*/) override {
        throw std::runtime_error("boom");
    }
};

// Returns bytes that are not valid UTF-8, like raw shell output.
class BinaryTool : public Tool {
public:
    std::string name() const override { return "dump_blob"; }
    std::string description() const override { return "Prints raw bytes"; }
    json parameters_schema() const override { return json{{"type", "object"}}; }

    Result<ToolResult> execute(const ToolCall& call) override {
        return ToolResult::ok(call.id, "\xff\xfe binary");
    }
};

class GuardedTool : public Tool {
public:
    std::string name() const override { return "deploy"; }
    std::string description() const override { return "Needs a human"; }
    json parameters_schema() const override { return json{{"type", "object"}}; }
    bool requires_confirmation() const override { return true; }

    Result<ToolResult> execute(const ToolCall& call) override {
        ++runs;
        return ToolResult::ok(call.id, "deployed");
    }

    int runs = 0;
};

// Cancels the given controller from inside a tool call.
class CancellingTool : public Tool {
public:
    explicit CancellingTool(CancellationController controller)
        : controller_(std::move(controller)) {}

    std::string name() const override { return "stop_button"; }
    std::string description() const override { return "Presses stop"; }
    json parameters_schema() const override { return json{{"type", "object"}}; }

    Result<ToolResult> execute(const ToolCall& call) override {
        controller_.cancel();
        return ToolResult::ok(call.id, "stopped");
    }

private:
    CancellationController controller_;
};

// Cancels while the model request is in flight, then answers anyway.
class CancellingModel : public ModelClient {
public:
    CancellingModel(CancellationController controller, ModelResponse response)
        : controller_(std::move(controller)), response_(std::move(response)) {}

    Result<ModelResponse> complete(const std::vector<Message>& /*messages*/,
                                   const std::vector<ToolDefinition>& /*tools*/,
                                   const ChatOptions& /*options*/) override {
        controller_.cancel();
        return response_;
    }

    std::string model_name() const override { return "cancelling"; }
    std::string provider_name() const override { return "test"; }

private:
    CancellationController controller_;
    ModelResponse response_;
};

// Blocks like a stalled transport until the request is cancelled.
class StalledModel : public ModelClient {
public:
    Result<ModelResponse> complete(const std::vector<Message>& /*messages*/,
                                   const std::vector<ToolDefinition>& /*tools*/,
                                   const ChatOptions& options) override {
        saw_cancel_hook = static_cast<bool>(options.cancelled);
        for (int i = 0; i < 5000 && saw_cancel_hook; ++i) {
            if (options.cancelled()) {
                return stride::model::network_error("request abandoned");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return stride::model::network_error("request timed out");
    }

    std::string model_name() const override { return "stalled"; }
    std::string provider_name() const override { return "test"; }

    bool saw_cancel_hook = false;
};

class ThrowingModel : public ModelClient {
public:
    Result<ModelResponse> complete(const std::vector<Message>& /*messages*/,
                                   const std::vector<ToolDefinition>& /*tools*/,
                                   const ChatOptions& /*options*/) override {
        throw std::runtime_error("socket closed");
    }

    std::string model_name() const override { return "throwing"; }
    std::string provider_name() const override { return "test"; }
};

ModelResponse tool_turn(std::vector<ToolUseBlock> uses,
                        std::optional<TokenUsage> usage = std::nullopt) {
    std::vector<ContentBlock> blocks;
    for (auto& use : uses) {
        blocks.emplace_back(std::move(use));
    }
    ModelResponse response;
    response.message = Message::assistant(std::move(blocks));
    response.usage = usage;
    response.finish_reason = stride::model::FinishReason::ToolUse;
    return response;
}

ModelResponse done_turn(const std::string& id = "done-1") {
    return tool_turn({ToolUseBlock{id, "task_done", json{{"summary", "All good"}}}});
}

std::shared_ptr<ScriptedModelClient> script(std::vector<Result<ModelResponse>> turns) {
    return std::make_shared<ScriptedModelClient>(std::move(turns));
}

ToolExecutor builtin_tools() {
    return ToolRegistry::with_builtin_tools().create_executor({"task_done", "sequentialthinking"});
}

AgentConfig config_with_steps(const std::uint32_t max_steps) {
    AgentConfig config;
    config.max_steps = max_steps;
    return config;
}

const ToolResultBlock* tool_result_of(const Message& message) {
    if (const auto* blocks = std::get_if<std::vector<ContentBlock>>(&message.content)) {
        for (const auto& block : *blocks) {
            if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
                return result;
            }
        }
    }
    return nullptr;
}

TEST(AgentEngineTest, CompletesWhenModelCallsTaskDone) {
    auto output = std::make_shared<RecordingOutput>();
    auto model = script({done_turn()});
    AgentEngine engine(AgentConfig{}, model, builtin_tools(), output);

    auto result = engine.execute_task_with_context("Print hello", "/work/demo");
    ASSERT_FALSE(is_error(result));
    const auto& execution = get_value(result);
    EXPECT_EQ(execution.outcome, RunOutcome::Completed);
    EXPECT_TRUE(execution.success());
    EXPECT_EQ(execution.steps, 1u);
    EXPECT_EQ(execution.final_result, "Task completed successfully");

    ASSERT_TRUE(engine.execution_context().has_value());
    EXPECT_EQ(engine.execution_context()->current_step, 1u);
    EXPECT_EQ(engine.execution_context()->project_path, "/work/demo");
    EXPECT_EQ(engine.execution_context()->agent_id, "stride_agent");

    const auto& history = engine.history();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].role, Role::System);
    EXPECT_NE(history[0].text().value().find("Project root path: /work/demo"), std::string::npos);
    EXPECT_EQ(history[1], Message::user("Print hello"));
    EXPECT_TRUE(history[2].has_tool_use());
    ASSERT_NE(tool_result_of(history[3]), nullptr);
    EXPECT_EQ(tool_result_of(history[3])->tool_use_id, "done-1");

    ASSERT_FALSE(output->emitted.empty());
    EXPECT_TRUE(std::holds_alternative<events::ExecutionStartedEvent>(output->emitted.front()));
    ASSERT_TRUE(std::holds_alternative<events::ExecutionCompletedEvent>(output->emitted.back()));
    EXPECT_TRUE(std::get<events::ExecutionCompletedEvent>(output->emitted.back()).success);
    EXPECT_EQ(output->terminal_count(), 1u);
    EXPECT_EQ(output->count<events::StepStartedEvent>(), 1u);
}

TEST(AgentEngineTest, StopsAtStepLimitWhenToolNeverResolves) {
    auto output = std::make_shared<RecordingOutput>();
    auto model = script({tool_turn({ToolUseBlock{"x-1", "missing_tool", json::object()}})});
    model->set_repeat_last(true);
    AgentEngine engine(config_with_steps(3), model, builtin_tools(), output);

    auto result = engine.execute_task_with_context("Loop forever", "/work/demo");
    ASSERT_FALSE(is_error(result));
    const auto& execution = get_value(result);
    EXPECT_EQ(execution.outcome, RunOutcome::Failed);
    EXPECT_EQ(execution.steps, 3u);
    EXPECT_EQ(execution.final_result, "Task incomplete after 3 steps");
    EXPECT_EQ(engine.execution_context()->current_step, 3u);
    EXPECT_EQ(model->call_count(), 3u);

    const auto* failed = tool_result_of(engine.history().back());
    ASSERT_NE(failed, nullptr);
    EXPECT_TRUE(failed->is_error.value_or(false));
    EXPECT_EQ(failed->content.rfind("Tool execution failed: ", 0), 0u);

    const auto* completed = output->last<events::ExecutionCompletedEvent>();
    ASSERT_NE(completed, nullptr);
    EXPECT_FALSE(completed->success);
    EXPECT_EQ(output->terminal_count(), 1u);
}

TEST(AgentEngineTest, CancelBeforeStartInterruptsWithoutModelCall) {
    auto output = std::make_shared<RecordingOutput>();
    auto model = script({done_turn()});
    AgentEngine engine(AgentConfig{}, model, builtin_tools(), output);
    engine.cancel();

    auto result = engine.execute_task_with_context("Anything", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Interrupted);
    EXPECT_EQ(get_value(result).steps, 0u);
    EXPECT_EQ(get_value(result).final_result, "Execution interrupted");
    EXPECT_EQ(engine.execution_context()->current_step, 0u);
    EXPECT_EQ(model->call_count(), 0u);

    EXPECT_EQ(output->count<events::ExecutionInterruptedEvent>(), 1u);
    EXPECT_EQ(output->count<events::ExecutionCompletedEvent>(), 0u);
    EXPECT_EQ(output->last<events::ExecutionInterruptedEvent>()->reason,
              "Execution interrupted by user");
}

TEST(AgentEngineTest, CancelReachesModelRequestInFlight) {
    auto output = std::make_shared<RecordingOutput>();
    auto model = std::make_shared<StalledModel>();
    AgentEngine engine(AgentConfig{}, model, builtin_tools(), output);

    std::thread canceller([&engine]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        engine.cancel();
    });
    auto result = engine.execute_task_with_context("Wait on the network", "/work/demo");
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(model->saw_cancel_hook);
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Interrupted);
    EXPECT_EQ(output->count<events::MessageEvent>(), 0u);
    EXPECT_EQ(output->terminal_count(), 1u);
}

TEST(AgentEngineTest, DropsResponseThatArrivesAfterCancellation) {
    auto output = std::make_shared<RecordingOutput>();
    CancellationController controller;
    auto model = std::make_shared<CancellingModel>(controller, done_turn());
    AgentEngine engine(AgentConfig{}, model, builtin_tools(), output);
    engine.set_cancellation_controller(controller);

    auto result = engine.execute_task_with_context("Race", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Interrupted);
    EXPECT_EQ(get_value(result).steps, 1u);
    EXPECT_EQ(engine.history().back(), Message::user("Race"));
    EXPECT_EQ(output->count<events::ToolExecutionStartedEvent>(), 0u);
    EXPECT_EQ(output->terminal_count(), 1u);
}

TEST(AgentEngineTest, NextTaskAnswersToolCallsLeftOpenByInterruption) {
    auto output = std::make_shared<RecordingOutput>();
    CancellationController first_controller;
    ToolExecutor tools = builtin_tools();
    tools.add_tool(std::make_shared<CancellingTool>(first_controller));

    auto model = script({tool_turn({ToolUseBlock{"c-1", "stop_button", json::object()},
                                    ToolUseBlock{"c-2", "task_done", json::object()}}),
                         done_turn("done-2")});
    AgentEngine engine(AgentConfig{}, model, std::move(tools), output);
    engine.set_cancellation_controller(first_controller);

    auto interrupted = engine.execute_task_with_context("First", "/work/demo");
    ASSERT_FALSE(is_error(interrupted));
    EXPECT_EQ(get_value(interrupted).outcome, RunOutcome::Interrupted);
    const auto open_size = engine.history().size();
    ASSERT_NE(tool_result_of(engine.history().back()), nullptr);
    EXPECT_EQ(tool_result_of(engine.history().back())->tool_use_id, "c-1");

    engine.set_cancellation_controller(CancellationController{});
    auto resumed = engine.execute_task_with_context("Second", "/work/demo");
    ASSERT_FALSE(is_error(resumed));
    EXPECT_EQ(get_value(resumed).outcome, RunOutcome::Completed);

    const auto& history = engine.history();
    const auto* synthetic = tool_result_of(history[open_size]);
    ASSERT_NE(synthetic, nullptr);
    EXPECT_EQ(synthetic->tool_use_id, "c-2");
    EXPECT_TRUE(synthetic->is_error.value_or(false));
    EXPECT_EQ(synthetic->content, "Previous task interrupted or incomplete");
    EXPECT_EQ(history[open_size + 1], Message::user("Second"));

    // Every tool use is answered before the next non-tool message
    for (std::size_t i = 0; i < history.size(); ++i) {
        if (!history[i].has_tool_use()) {
            continue;
        }
        std::size_t answered = 0;
        std::size_t j = i + 1;
        while (j < history.size() && history[j].role == Role::Tool) {
            answered += history[j].tool_result_ids().size();
            ++j;
        }
        EXPECT_EQ(answered, history[i].tool_uses().size()) << "message " << i;
    }
}

TEST(AgentEngineTest, DeniedConfirmationSkipsTool) {
    auto output = std::make_shared<RecordingOutput>(false);
    auto guarded = std::make_shared<GuardedTool>();
    ToolExecutor tools = builtin_tools();
    tools.add_tool(guarded);
    auto model = script({tool_turn({ToolUseBlock{"d-1", "deploy", json{{"env", "prod"}}}}),
                         done_turn()});
    AgentEngine engine(AgentConfig{}, model, std::move(tools), output);

    auto result = engine.execute_task_with_context("Deploy", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(guarded->runs, 0);

    ASSERT_EQ(output->confirmations.size(), 1u);
    EXPECT_EQ(output->confirmations[0].title, "Execute tool: deploy");
    EXPECT_EQ(output->confirmations[0].metadata.at("tool_call_id"), "d-1");
    EXPECT_EQ(output->confirmations[0].metadata.at("parameters").at("env"), "prod");

    const auto* denied = tool_result_of(engine.history()[3]);
    ASSERT_NE(denied, nullptr);
    EXPECT_EQ(denied->content, "Execution cancelled by user");
    EXPECT_TRUE(denied->is_error.value_or(false));
}

TEST(AgentEngineTest, ApprovedConfirmationRunsTool) {
    auto output = std::make_shared<RecordingOutput>(true);
    auto guarded = std::make_shared<GuardedTool>();
    ToolExecutor tools = builtin_tools();
    tools.add_tool(guarded);
    auto model = script({tool_turn({ToolUseBlock{"d-1", "deploy", json::object()}}),
                         done_turn()});
    AgentEngine engine(AgentConfig{}, model, std::move(tools), output);

    auto result = engine.execute_task_with_context("Deploy", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(guarded->runs, 1);
    EXPECT_EQ(tool_result_of(engine.history()[3])->content, "deployed");
}

TEST(AgentEngineTest, ThrowingToolBecomesErrorResult) {
    auto output = std::make_shared<RecordingOutput>();
    ToolExecutor tools = builtin_tools();
    tools.add_tool(std::make_shared<ThrowingTool>());
    auto model = script({tool_turn({ToolUseBlock{"e-1", "explode", json::object()}}),
                         done_turn()});
    AgentEngine engine(AgentConfig{}, model, std::move(tools), output);

    auto result = engine.execute_task_with_context("Risky", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(get_value(result).steps, 2u);

    const auto* failed = tool_result_of(engine.history()[3]);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->content, "Tool execution failed: boom");
    EXPECT_TRUE(failed->is_error.value_or(false));
}

TEST(AgentEngineTest, OutputFailuresDoNotChangeOutcome) {
    for (const auto mode : {RecordingOutput::EmitMode::Fail, RecordingOutput::EmitMode::Throw}) {
        auto output = std::make_shared<RecordingOutput>();
        output->mode = mode;
        AgentEngine engine(AgentConfig{}, script({done_turn()}), builtin_tools(), output);

        auto result = engine.execute_task_with_context("Render badly", "/work/demo");
        ASSERT_FALSE(is_error(result));
        EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
        EXPECT_EQ(output->terminal_count(), 1u);
    }
}

TEST(AgentEngineTest, ThoughtToolEmitsThinkingAndUsageAccumulates) {
    auto output = std::make_shared<RecordingOutput>();
    auto model = script(
        {tool_turn({ToolUseBlock{"t-1", "sequentialthinking",
                                 json{{"thought", "Check the logs"}, {"thought_number", 1},
                                      {"total_thoughts", 2}, {"next_thought_needed", true}}}},
                   TokenUsage{10, 5, 15}),
         tool_turn({ToolUseBlock{"done-1", "task_done", json::object()}}, TokenUsage{20, 5, 25})});
    AgentEngine engine(AgentConfig{}, model, builtin_tools(), output);

    auto result = engine.execute_task_with_context("Investigate", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);

    const auto* thinking = output->last<events::AgentThinkingEvent>();
    ASSERT_NE(thinking, nullptr);
    EXPECT_EQ(thinking->thinking, "Check the logs");
    EXPECT_EQ(thinking->step_number, 1u);

    EXPECT_EQ(output->count<events::TokenUsageUpdatedEvent>(), 2u);
    const auto* usage = output->last<events::TokenUsageUpdatedEvent>();
    EXPECT_EQ(usage->token_usage.input_tokens, 30u);
    EXPECT_EQ(usage->token_usage.total_tokens, 40u);
    EXPECT_EQ(engine.execution_context()->token_usage.total_tokens, 40u);
}

TEST(AgentEngineTest, ModelErrorFailsTaskWithStepSummary) {
    auto output = std::make_shared<RecordingOutput>();
    auto model = script({stride::model::remote_rejected(500, "boom")});
    AgentEngine engine(AgentConfig{}, model, builtin_tools(), output);

    auto result = engine.execute_task_with_context("Call the model", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Failed);
    EXPECT_EQ(get_value(result).steps, 1u);
    EXPECT_EQ(get_value(result).final_result,
              "Error in step 1: Remote rejected request (status 500): boom");

    const auto* message = output->last<events::MessageEvent>();
    ASSERT_NE(message, nullptr);
    EXPECT_EQ(message->level, events::MessageLevel::Error);
    EXPECT_EQ(message->content.rfind("LLM request failed: ", 0), 0u);

    const auto* step = output->last<events::StepCompletedEvent>();
    ASSERT_NE(step, nullptr);
    EXPECT_FALSE(step->success);
    EXPECT_EQ(output->terminal_count(), 1u);
}

TEST(AgentEngineTest, ThrowingModelIsReportedAsStepError) {
    AgentEngine engine(AgentConfig{}, std::make_shared<ThrowingModel>(), builtin_tools(),
                       nullptr);

    auto result = engine.execute_task_with_context("Call the model", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Failed);
    EXPECT_NE(get_value(result).final_result.find("socket closed"), std::string::npos);
}

TEST(AgentEngineTest, BlankTaskIsRejectedBeforeAnyEvent) {
    auto output = std::make_shared<RecordingOutput>();
    AgentEngine engine(AgentConfig{}, script({done_turn()}), builtin_tools(), output);

    auto result = engine.execute_task_with_context("   \n", "/work/demo");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "empty_task");
    EXPECT_TRUE(output->emitted.empty());
    EXPECT_TRUE(engine.history().empty());
}

TEST(AgentEngineTest, FailingSummarizerFallsBackToTrimming) {
    auto output = std::make_shared<RecordingOutput>();
    AgentConfig config;
    config.token_budget = 10;
    AgentEngine engine(config, script({done_turn()}), builtin_tools(), output);
    engine.set_summarizer(script({}));

    std::vector<Message> history = {Message::system("You are terse.")};
    for (int i = 0; i < 10; ++i) {
        history.push_back(i % 2 == 0 ? Message::user("question " + std::to_string(i))
                                     : Message::assistant("answer " + std::to_string(i)));
    }
    engine.restore_history_only(history);

    auto result = engine.execute_task_with_context("Keep going", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);

    const auto* failed = output->last<events::CompressionFailedEvent>();
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->fallback_action, "Simple message trimming applied");
    EXPECT_NE(failed->error.find("script_exhausted"), std::string::npos);
    EXPECT_EQ(output->count<events::CompressionCompletedEvent>(), 0u);
}

TEST(AgentEngineTest, CompressionEventsDescribeAppliedLevel) {
    auto output = std::make_shared<RecordingOutput>();
    AgentConfig config;
    config.token_budget = 10;
    AgentEngine engine(config, script({done_turn()}), builtin_tools(), output);

    std::vector<Message> history = {Message::system("You are terse.")};
    for (int i = 0; i < 10; ++i) {
        history.push_back(i % 2 == 0 ? Message::user("question " + std::to_string(i))
                                     : Message::assistant("answer " + std::to_string(i)));
    }
    engine.restore_history_only(history);

    auto result = engine.execute_task_with_context("Keep going", "/work/demo");
    ASSERT_FALSE(is_error(result));

    const auto* started = output->last<events::CompressionStartedEvent>();
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->level, "critical");
    EXPECT_EQ(started->target_tokens, 6u);
    EXPECT_EQ(started->reason, "Token usage requires critical compression");
    const auto* completed = output->last<events::CompressionCompletedEvent>();
    ASSERT_NE(completed, nullptr);
    EXPECT_LT(completed->messages_after, completed->messages_before);
}

TEST(AgentEngineTest, OriginalGoalSurvivesFollowUpTasks) {
    AgentEngine engine(AgentConfig{}, script({done_turn("done-1"), done_turn("done-2")}),
                       builtin_tools(), nullptr);

    ASSERT_FALSE(is_error(engine.execute_task_with_context("Build the feature", "/work/demo")));
    ASSERT_FALSE(is_error(engine.execute_task_with_context("Now add docs", "/work/demo")));

    const auto& context = engine.execution_context().value();
    EXPECT_EQ(context.original_goal, "Build the feature");
    EXPECT_EQ(context.current_task, "Now add docs");
    EXPECT_EQ(context.current_step, 1u);

    std::size_t system_messages = 0;
    for (const auto& message : engine.history()) {
        if (message.role == Role::System) {
            ++system_messages;
        }
    }
    EXPECT_EQ(system_messages, 1u);
    EXPECT_EQ(engine.history().size(), 7u);
}

TEST(AgentEngineTest, SnapshotRestoresIntoFreshEngine) {
    AgentConfig config;
    config.max_steps = 9;
    AgentEngine source(config, script({done_turn()}), builtin_tools(), nullptr);
    ASSERT_FALSE(is_error(source.execute_task_with_context("Remember me", "/work/demo")));

    AgentEngine target(AgentConfig{}, script({}), builtin_tools(), nullptr);
    ASSERT_FALSE(is_error(target.restore_from_json(source.export_snapshot_json())));
    EXPECT_EQ(target.history(), source.history());
    EXPECT_EQ(target.execution_context(), source.execution_context());
    EXPECT_EQ(target.config().max_steps, 9u);

    auto broken = target.restore_from_json("{}");
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_snapshot_format");
    EXPECT_EQ(target.history(), source.history());
}

TEST(AgentEngineTest, RestoreHistoryOnlyForgetsContext) {
    AgentEngine engine(AgentConfig{}, script({done_turn()}), builtin_tools(), nullptr);
    ASSERT_FALSE(is_error(engine.execute_task_with_context("Start", "/work/demo")));
    ASSERT_TRUE(engine.execution_context().has_value());

    engine.restore_history_only({Message::system("fresh"), Message::user("hi")});
    EXPECT_FALSE(engine.execution_context().has_value());
    EXPECT_EQ(engine.history().size(), 2u);
}

TEST(AgentEngineTest, RecordsTrajectoryOfSuccessfulTask) {
    auto recorder = std::make_shared<TrajectoryRecorder>();
    AgentEngine engine(AgentConfig{}, script({done_turn()}), builtin_tools(), nullptr);
    engine.set_trajectory_recorder(recorder);

    ASSERT_FALSE(is_error(engine.execute_task_with_context("Trace me", "/work/demo")));

    const auto trajectory = recorder->build_trajectory();
    std::vector<std::string> names;
    for (const auto& entry : trajectory.entries) {
        names.push_back(stride::trajectory::entry_type_name(entry.entry_type));
    }
    const std::vector<std::string> expected = {"task_start", "llm_request", "llm_response",
                                               "tool_call",  "tool_result", "step_complete",
                                               "task_complete"};
    EXPECT_EQ(names, expected);
    EXPECT_EQ(trajectory.metadata.task.value(), "Trace me");
    EXPECT_TRUE(trajectory.metadata.success.value());
    EXPECT_EQ(trajectory.metadata.total_steps, 1u);
}

TEST(AgentEngineTest, BinaryToolOutputDoesNotBreakFileTrajectory) {
    const auto root = std::filesystem::current_path() /
                      (".tmp_engine_" + stride::core::config::generate_run_id());
    auto recorder = TrajectoryRecorder::with_file(root / "trajectory.json");

    auto output = std::make_shared<RecordingOutput>();
    auto tools = builtin_tools();
    tools.add_tool(std::make_shared<BinaryTool>());
    auto model = script({tool_turn({ToolUseBlock{"bin-1", "dump_blob", json::object()}}),
                         done_turn("done-2")});
    AgentEngine engine(AgentConfig{}, model, std::move(tools), output);
    engine.set_trajectory_recorder(recorder);

    auto result = engine.execute_task_with_context("Read the blob", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(output->terminal_count(), 1u);
    EXPECT_EQ(output->count<events::MessageEvent>(), 0u);

    auto loaded = TrajectoryRecorder::load(root / "trajectory.json");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_TRUE(get_value(loaded).metadata.success.value());

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

}  // namespace

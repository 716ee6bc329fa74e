#include "runtime/agent_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/prompt.hpp"

namespace stride::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::AgentEvent;
using protocol::AgentExecution;
using protocol::ExecutionContext;
using protocol::Message;
using protocol::MessageEvent;
using protocol::MessageLevel;
using protocol::Role;
using protocol::ToolCall;
using protocol::ToolExecutionInfo;
using protocol::ToolExecutionStatus;
using protocol::ToolResult;

namespace {

const std::string kInterruptedToolResult = "Previous task interrupted or incomplete";
const std::string kThoughtPrefix = "Thought: ";

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](const unsigned char c) { return std::isspace(c) != 0; });
}

std::uint64_t elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now() - started)
                                          .count());
}

}  // namespace

AgentEngine::AgentEngine(core::config::AgentConfig config,
                         std::shared_ptr<model::ModelClient> model,
                         tools::ToolExecutor tool_executor,
                         std::shared_ptr<output::AgentOutput> output)
    : config_(std::move(config)),
      model_(std::move(model)),
      tools_(std::move(tool_executor)),
      output_(output != nullptr ? std::move(output) : std::make_shared<output::NullOutput>()),
      conversation_(config_.token_budget) {}

core::errors::Result<AgentExecution> AgentEngine::execute_task(const std::string& task) {
    std::error_code ec;
    auto project_path = std::filesystem::current_path(ec);
    if (ec) {
        project_path = ".";
    }
    return execute_task_with_context(task, project_path);
}

core::errors::Result<AgentExecution> AgentEngine::execute_task_with_context(
    const std::string& task, const std::filesystem::path& project_path) {
    if (is_blank(task)) {
        return AgentError{ErrorCategory::Input, "Task cannot be empty.", "empty_task"};
    }

    const auto started = std::chrono::steady_clock::now();
    const std::string project = project_path.string();

    if (!context_.has_value()) {
        ExecutionContext context;
        context.agent_id = kAgentType;
        context.original_goal = task;
        context.current_task = task;
        context.project_path = project;
        context.max_steps = config_.max_steps;
        context_ = std::move(context);
    } else {
        context_->current_task = task;
        context_->current_step = 0;
        context_->project_path = project;
        context_->max_steps = config_.max_steps;
    }

    STRIDE_LOG_INFO("AgentEngine: task started (max " + std::to_string(config_.max_steps) +
                    " steps): " + task);
    emit(protocol::ExecutionStartedEvent{*context_});
    record(0, trajectory::TaskStartEntry{task, nlohmann::json(config_)});

    if (history_.empty()) {
        history_.push_back(Message::system(system_prompt(project)));
    }
    repair_dangling_tool_uses();
    history_.push_back(Message::user(task));

    const auto registration = cancellation_.subscribe();
    std::uint32_t step = 0;
    bool completed = false;
    bool interrupted = false;
    std::optional<AgentError> step_error;

    while (step < config_.max_steps) {
        if (registration.is_cancelled()) {
            interrupted = true;
            break;
        }

        apply_compression();

        if (registration.is_cancelled()) {
            interrupted = true;
            break;
        }

        ++step;
        context_->current_step = step;
        STRIDE_LOG_DEBUG("AgentEngine: step " + std::to_string(step) + " started");
        emit(protocol::StepStartedEvent{step, task});

        auto outcome = execute_step(step, registration, project);
        if (core::errors::is_error(outcome)) {
            step_error = core::errors::get_error(outcome);
            emit(protocol::StepCompletedEvent{step, false});
            record(step, trajectory::ErrorEntry{core::errors::describe(*step_error),
                                                "Step " + std::to_string(step)});
            break;
        }

        const auto result = core::errors::get_value(outcome);
        if (result == StepOutcome::Interrupted) {
            emit(protocol::StepCompletedEvent{step, false});
            interrupted = true;
            break;
        }

        emit(protocol::StepCompletedEvent{step, true});
        record(step, trajectory::StepCompleteEntry{"Step " + std::to_string(step) + " completed",
                                                   true});
        if (result == StepOutcome::Completed) {
            completed = true;
            break;
        }
    }

    const auto duration_ms = elapsed_ms(started);
    context_->current_step = step;
    context_->execution_time = std::chrono::milliseconds(duration_ms);

    if (interrupted) {
        const std::string summary = "Execution interrupted";
        STRIDE_LOG_WARN("AgentEngine: task interrupted after " + std::to_string(step) + " steps");
        record(step, trajectory::TaskCompleteEntry{false, summary, step, duration_ms});
        emit(protocol::ExecutionInterruptedEvent{*context_, "Execution interrupted by user"});
        return AgentExecution::interrupted(summary, step, duration_ms);
    }

    std::string summary;
    if (step_error.has_value()) {
        summary = "Error in step " + std::to_string(step) + ": " + step_error->message;
    } else if (completed) {
        summary = "Task completed successfully";
    } else {
        summary = "Task incomplete after " + std::to_string(step) + " steps";
    }

    if (completed) {
        STRIDE_LOG_INFO("AgentEngine: " + summary + " in " + std::to_string(step) + " steps");
    } else {
        STRIDE_LOG_WARN("AgentEngine: " + summary);
    }
    record(step, trajectory::TaskCompleteEntry{completed, summary, step, duration_ms});
    emit(protocol::ExecutionCompletedEvent{*context_, completed, summary});

    if (completed) {
        return AgentExecution::completed(summary, step, duration_ms);
    }
    return AgentExecution::failed(summary, step, duration_ms);
}

core::errors::Result<AgentEngine::StepOutcome> AgentEngine::execute_step(
    const std::uint32_t step, const CancellationRegistration& registration,
    const std::string& project_path) {
    std::vector<Message> messages;
    messages.reserve(history_.size() + 1);
    if (history_.empty() || history_.front().role != Role::System) {
        messages.push_back(Message::system(system_prompt(project_path)));
    }
    messages.insert(messages.end(), history_.begin(), history_.end());

    record(step, trajectory::LlmRequestEntry{
                     messages, model_ != nullptr ? model_->model_name() : std::string(),
                     model_ != nullptr ? model_->provider_name() : std::string()});

    auto response_result = call_model(messages, registration);

    // The step lost the race; its response or transport error is dropped unseen
    if (registration.is_cancelled()) {
        return StepOutcome::Interrupted;
    }

    if (core::errors::is_error(response_result)) {
        const auto& err = core::errors::get_error(response_result);
        STRIDE_LOG_ERROR("AgentEngine: LLM request failed for step " + std::to_string(step) +
                         ": " + core::errors::describe(err));
        emit(MessageEvent{MessageLevel::Error, "LLM request failed: " + err.message});
        return err;
    }

    auto response = core::errors::take_value(std::move(response_result));
    if (response.usage.has_value()) {
        context_->token_usage += response.usage.value();
        emit(protocol::TokenUsageUpdatedEvent{context_->token_usage});
    }

    std::optional<std::string> finish_reason;
    if (response.finish_reason.has_value()) {
        finish_reason = model::to_string(response.finish_reason.value());
    }
    record(step, trajectory::LlmResponseEntry{response.message, response.usage, finish_reason});

    history_.push_back(response.message);

    if (response.message.has_tool_use()) {
        for (const auto& use : response.message.tool_uses()) {
            if (registration.is_cancelled()) {
                return StepOutcome::Interrupted;
            }

            const ToolCall call{use.id, use.name, use.input};
            ToolExecutionInfo info{use.id, use.name, use.input, ToolExecutionStatus::Executing,
                                   std::nullopt};
            emit(protocol::ToolExecutionStartedEvent{info});
            record(step, trajectory::ToolCallEntry{call});

            ToolResult result;
            if (tools_.requires_confirmation(use.name)) {
                const bool approved = confirm_tool(call);
                if (registration.is_cancelled()) {
                    return StepOutcome::Interrupted;
                }
                result = approved ? invoke_tool(call)
                                  : ToolResult::error(use.id, "Execution cancelled by user");
            } else {
                result = invoke_tool(call);
            }

            info.status = result.success ? ToolExecutionStatus::Success : ToolExecutionStatus::Error;
            info.result = result;
            emit(protocol::ToolExecutionCompletedEvent{info});

            const auto traits = tools_.traits(use.name);
            if (traits.thought_stream) {
                emit_thinking(step, result);
            }
            record(step, trajectory::ToolResultEntry{result});

            history_.push_back(Message::tool_result(use.id, result.content, !result.success));

            if (traits.completion_signal && result.success) {
                return StepOutcome::Completed;
            }
        }
        return StepOutcome::Continue;
    }

    const auto text = response.message.text();
    if (text.has_value() && !is_blank(text.value())) {
        emit(MessageEvent{MessageLevel::Normal, text.value()});
    }
    return StepOutcome::Continue;
}

core::errors::Result<model::ModelResponse> AgentEngine::call_model(
    const std::vector<Message>& messages, const CancellationRegistration& registration) {
    if (model_ == nullptr) {
        return AgentError{ErrorCategory::Setup, "No model client configured.", "missing_model"};
    }
    try {
        model::ChatOptions options;
        options.cancelled = [registration]() { return registration.is_cancelled(); };
        return model_->complete(messages, tools_.list_definitions(), options);
    } catch (const std::exception& ex) {
        return AgentError{ErrorCategory::Internal,
                          std::string("Model client threw: ") + ex.what(),
                          "model_client_exception"};
    }
}

ToolResult AgentEngine::invoke_tool(const ToolCall& call) {
    try {
        auto result = tools_.execute(call);
        if (core::errors::is_error(result)) {
            const auto& err = core::errors::get_error(result);
            STRIDE_LOG_WARN("AgentEngine: tool " + call.name + " failed: " +
                            core::errors::describe(err));
            return ToolResult::error(call.id, "Tool execution failed: " + err.message);
        }
        auto value = core::errors::take_value(std::move(result));
        value.tool_call_id = call.id;
        return value;
    } catch (const std::exception& ex) {
        STRIDE_LOG_WARN("AgentEngine: tool " + call.name + " threw: " + ex.what());
        return ToolResult::error(call.id, std::string("Tool execution failed: ") + ex.what());
    }
}

bool AgentEngine::confirm_tool(const ToolCall& call) {
    output::ConfirmationRequest request;
    request.id = call.id;
    request.kind = output::ConfirmationKind::ToolExecution;
    request.title = "Execute tool: " + call.name;
    request.message = "This tool requires confirmation before execution.";
    request.metadata = nlohmann::json{{"tool_name", call.name},
                                      {"parameters", call.parameters},
                                      {"tool_call_id", call.id}};

    try {
        auto decision = output_->request_confirmation(request);
        if (core::errors::is_error(decision)) {
            STRIDE_LOG_WARN("AgentEngine: confirmation for " + call.name + " failed: " +
                            core::errors::describe(core::errors::get_error(decision)));
            return false;
        }
        const auto& value = core::errors::get_value(decision);
        if (!value.approved) {
            STRIDE_LOG_INFO("AgentEngine: " + call.name + " not approved" +
                            (value.note.has_value() ? ": " + value.note.value() : ""));
        }
        return value.approved;
    } catch (const std::exception& ex) {
        STRIDE_LOG_WARN("AgentEngine: confirmation for " + call.name + " threw: " + ex.what());
        return false;
    }
}

void AgentEngine::emit_thinking(const std::uint32_t step, const ToolResult& result) {
    std::string thought;
    if (result.data.has_value() && result.data->is_object() && result.data->contains("thought") &&
        result.data->at("thought").is_string()) {
        thought = result.data->at("thought").get<std::string>();
    } else {
        const auto start = result.content.find(kThoughtPrefix);
        if (start == std::string::npos) {
            return;
        }
        const auto from = start + kThoughtPrefix.size();
        const auto end = result.content.find("\n\n", from);
        thought = result.content.substr(from, end == std::string::npos ? std::string::npos
                                                                        : end - from);
    }

    if (!thought.empty()) {
        emit(protocol::AgentThinkingEvent{step, thought});
    }
}

void AgentEngine::apply_compression() {
    auto result =
        conversation_.maybe_compress(history_, context_.has_value() ? &context_.value() : nullptr);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        STRIDE_LOG_WARN("AgentEngine: compression failed: " + core::errors::describe(err) +
                        ". Falling back to simple trimming.");
        history_ = context::ConversationManager::simple_trim(history_, kFallbackMaxMessages);
        emit(protocol::CompressionFailedEvent{core::errors::describe(err),
                                              "Simple message trimming applied"});
        return;
    }

    auto compressed = core::errors::take_value(std::move(result));
    history_ = std::move(compressed.messages);
    if (!compressed.compression_applied.has_value()) {
        return;
    }

    const auto& summary = compressed.compression_applied.value();
    const auto level = context::to_string(summary.level);
    emit(protocol::CompressionStartedEvent{
        level, summary.tokens_before,
        static_cast<std::size_t>(static_cast<double>(conversation_.token_budget()) *
                                 conversation_.policy().target_ratio),
        "Token usage requires " + level + " compression"});
    emit(protocol::CompressionCompletedEvent{summary.summary, summary.tokens_saved,
                                             summary.messages_before, summary.messages_after});
    STRIDE_LOG_INFO("AgentEngine: " + level + " compression saved " +
                    std::to_string(summary.tokens_saved) + " tokens (" +
                    std::to_string(summary.messages_before) + " -> " +
                    std::to_string(summary.messages_after) + " messages)");
}

void AgentEngine::repair_dangling_tool_uses() {
    std::size_t index = history_.size();
    while (index > 0 && history_[index - 1].role == Role::Tool) {
        --index;
    }
    if (index == 0 || history_[index - 1].role != Role::Assistant ||
        !history_[index - 1].has_tool_use()) {
        return;
    }

    std::set<std::string> answered;
    for (std::size_t i = index; i < history_.size(); ++i) {
        for (const auto& id : history_[i].tool_result_ids()) {
            answered.insert(id);
        }
    }

    std::vector<Message> synthetic;
    for (const auto& use : history_[index - 1].tool_uses()) {
        if (answered.count(use.id) == 0) {
            synthetic.push_back(Message::tool_result(use.id, kInterruptedToolResult, true));
        }
    }
    if (synthetic.empty()) {
        return;
    }

    STRIDE_LOG_WARN("AgentEngine: added " + std::to_string(synthetic.size()) +
                    " synthetic tool results for calls left open by a previous task");
    history_.insert(history_.end(), std::make_move_iterator(synthetic.begin()),
                    std::make_move_iterator(synthetic.end()));
}

std::string AgentEngine::system_prompt(const std::string& project_path) const {
    return build_system_prompt(config_.system_prompt, project_path, tools_.list_names());
}

void AgentEngine::emit(const AgentEvent& event) {
    try {
        const auto status = output_->emit(event);
        if (core::errors::is_error(status)) {
            STRIDE_LOG_WARN("AgentEngine: failed to emit " + protocol::event_name(event) + ": " +
                            core::errors::describe(core::errors::get_error(status)));
        }
    } catch (const std::exception& ex) {
        STRIDE_LOG_WARN("AgentEngine: output threw while emitting " +
                        protocol::event_name(event) + ": " + ex.what());
    }
}

void AgentEngine::record(const std::uint32_t step, trajectory::EntryType entry) {
    if (recorder_ == nullptr) {
        return;
    }
    const auto name = trajectory::entry_type_name(entry);
    std::string failure;
    try {
        const auto status =
            recorder_->record(trajectory::TrajectoryEntry::make(step, std::move(entry)));
        if (core::errors::is_error(status)) {
            const auto& err = core::errors::get_error(status);
            STRIDE_LOG_WARN("AgentEngine: failed to record " + name + ": " +
                            core::errors::describe(err));
            failure = err.message;
        }
    } catch (const std::exception& ex) {
        STRIDE_LOG_WARN("AgentEngine: recorder threw while recording " + name + ": " + ex.what());
        failure = ex.what();
    }
    if (!failure.empty()) {
        emit(MessageEvent{MessageLevel::Warning, "Trajectory recording failed: " + failure});
    }
}

void AgentEngine::cancel() {
    if (cancellation_.cancel()) {
        STRIDE_LOG_INFO("AgentEngine: cancellation requested");
    }
}

void AgentEngine::set_cancellation_controller(CancellationController controller) {
    cancellation_ = std::move(controller);
}

void AgentEngine::set_trajectory_recorder(
    std::shared_ptr<trajectory::TrajectoryRecorder> recorder) {
    recorder_ = std::move(recorder);
}

void AgentEngine::set_system_prompt(std::optional<std::string> system_prompt) {
    config_.system_prompt = std::move(system_prompt);
}

void AgentEngine::set_summarizer(std::shared_ptr<model::ModelClient> summarizer) {
    summarizer_ = std::move(summarizer);
    conversation_.set_summarizer(summarizer_);
}

session::PersistedContext AgentEngine::export_snapshot() const {
    return session::PersistedContext::capture(kAgentType, config_, history_, context_);
}

std::string AgentEngine::export_snapshot_json() const {
    return export_snapshot().to_json_string();
}

core::errors::Status AgentEngine::export_snapshot_to_file(
    const std::filesystem::path& path) const {
    return export_snapshot().to_file(path);
}

void AgentEngine::restore(session::PersistedContext snapshot) {
    if (snapshot.agent_type != kAgentType) {
        STRIDE_LOG_WARN("AgentEngine: restoring a snapshot written by '" + snapshot.agent_type +
                        "'");
    }
    if (snapshot.config.has_value()) {
        config_ = std::move(snapshot.config.value());
        conversation_ = context::ConversationManager(config_.token_budget);
        conversation_.set_summarizer(summarizer_);
    }
    history_ = std::move(snapshot.conversation_history);
    context_ = std::move(snapshot.execution_context);
    STRIDE_LOG_INFO("AgentEngine: restored " + std::to_string(history_.size()) + " messages");
}

core::errors::Status AgentEngine::restore_from_json(const std::string& text) {
    auto snapshot = session::PersistedContext::from_json_string(text);
    if (core::errors::is_error(snapshot)) {
        return core::errors::get_error(snapshot);
    }
    restore(core::errors::take_value(std::move(snapshot)));
    return core::errors::ok();
}

core::errors::Status AgentEngine::restore_from_file(const std::filesystem::path& path) {
    auto snapshot = session::PersistedContext::from_file(path);
    if (core::errors::is_error(snapshot)) {
        return core::errors::get_error(snapshot);
    }
    restore(core::errors::take_value(std::move(snapshot)));
    return core::errors::ok();
}

void AgentEngine::restore_history_only(std::vector<Message> messages) {
    history_ = std::move(messages);
    context_.reset();
}

}  // namespace stride::runtime

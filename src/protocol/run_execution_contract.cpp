#include "protocol/run_execution_contract.hpp"

#include <utility>

namespace stride::protocol {

using nlohmann::json;

namespace {

AgentExecution make_execution(const RunOutcome outcome, std::string summary,
                              const std::uint32_t steps, const std::uint64_t duration_ms) {
    AgentExecution execution;
    execution.outcome = outcome;
    execution.final_result = std::move(summary);
    execution.steps = steps;
    execution.duration_ms = duration_ms;
    return execution;
}

}  // namespace

AgentExecution AgentExecution::completed(std::string summary, const std::uint32_t steps,
                                         const std::uint64_t duration_ms) {
    return make_execution(RunOutcome::Completed, std::move(summary), steps, duration_ms);
}

AgentExecution AgentExecution::failed(std::string summary, const std::uint32_t steps,
                                      const std::uint64_t duration_ms) {
    return make_execution(RunOutcome::Failed, std::move(summary), steps, duration_ms);
}

AgentExecution AgentExecution::interrupted(std::string summary, const std::uint32_t steps,
                                           const std::uint64_t duration_ms) {
    return make_execution(RunOutcome::Interrupted, std::move(summary), steps, duration_ms);
}

bool operator==(const TokenUsage& lhs, const TokenUsage& rhs) {
    return lhs.input_tokens == rhs.input_tokens &&
           lhs.output_tokens == rhs.output_tokens &&
           lhs.total_tokens == rhs.total_tokens;
}

bool operator==(const ExecutionContext& lhs, const ExecutionContext& rhs) {
    return lhs.agent_id == rhs.agent_id && lhs.original_goal == rhs.original_goal &&
           lhs.current_task == rhs.current_task &&
           lhs.project_path == rhs.project_path && lhs.max_steps == rhs.max_steps &&
           lhs.current_step == rhs.current_step &&
           lhs.execution_time == rhs.execution_time &&
           lhs.token_usage == rhs.token_usage;
}

std::string to_string(const RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed:
            return "completed";
        case RunOutcome::Failed:
            return "failed";
        case RunOutcome::Interrupted:
            return "interrupted";
        default:
            return "unknown";
    }
}

void to_json(json& j, const TokenUsage& usage) {
    j = json{{"input_tokens", usage.input_tokens},
             {"output_tokens", usage.output_tokens},
             {"total_tokens", usage.total_tokens}};
}

void from_json(const json& j, TokenUsage& usage) {
    usage.input_tokens = j.value("input_tokens", std::uint64_t{0});
    usage.output_tokens = j.value("output_tokens", std::uint64_t{0});
    usage.total_tokens = j.value("total_tokens", std::uint64_t{0});
}

void to_json(json& j, const ExecutionContext& context) {
    json usage;
    to_json(usage, context.token_usage);
    j = json{{"agent_id", context.agent_id},
             {"original_goal", context.original_goal},
             {"current_task", context.current_task},
             {"project_path", context.project_path},
             {"max_steps", context.max_steps},
             {"current_step", context.current_step},
             {"execution_time_ms", context.execution_time.count()},
             {"token_usage", usage}};
}

void from_json(const json& j, ExecutionContext& context) {
    context.agent_id = j.at("agent_id").get<std::string>();
    context.original_goal = j.at("original_goal").get<std::string>();
    context.current_task = j.at("current_task").get<std::string>();
    context.project_path = j.value("project_path", std::string());
    context.max_steps = j.value("max_steps", std::uint32_t{0});
    context.current_step = j.value("current_step", std::uint32_t{0});
    context.execution_time =
        std::chrono::milliseconds(j.value("execution_time_ms", std::int64_t{0}));
    context.token_usage = TokenUsage{};
    if (j.contains("token_usage")) {
        from_json(j.at("token_usage"), context.token_usage);
    }
}

}  // namespace stride::protocol

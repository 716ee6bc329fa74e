#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace stride::protocol {

struct TokenUsage {
    std::uint64_t input_tokens = 0;
    std::uint64_t output_tokens = 0;
    std::uint64_t total_tokens = 0;

    TokenUsage& operator+=(const TokenUsage& other) {
        input_tokens += other.input_tokens;
        output_tokens += other.output_tokens;
        total_tokens += other.total_tokens;
        return *this;
    }
};

// Run metadata owned by the engine. original_goal survives across tasks;
// current_task and current_step are reset for every task.
struct ExecutionContext {
    std::string agent_id;
    std::string original_goal;
    std::string current_task;
    std::string project_path;
    std::uint32_t max_steps = 0;
    std::uint32_t current_step = 0;
    std::chrono::milliseconds execution_time{0};
    TokenUsage token_usage;
};

enum class RunOutcome {
    Completed,
    Failed,
    Interrupted
};

struct AgentExecution {
    RunOutcome outcome = RunOutcome::Failed;
    std::string final_result;
    std::uint32_t steps = 0;
    std::uint64_t duration_ms = 0;

    bool success() const { return outcome == RunOutcome::Completed; }

    static AgentExecution completed(std::string summary, std::uint32_t steps,
                                    std::uint64_t duration_ms);
    static AgentExecution failed(std::string summary, std::uint32_t steps,
                                 std::uint64_t duration_ms);
    static AgentExecution interrupted(std::string summary, std::uint32_t steps,
                                      std::uint64_t duration_ms);
};

bool operator==(const TokenUsage& lhs, const TokenUsage& rhs);
bool operator==(const ExecutionContext& lhs, const ExecutionContext& rhs);

std::string to_string(RunOutcome outcome);

void to_json(nlohmann::json& j, const TokenUsage& usage);
void from_json(const nlohmann::json& j, TokenUsage& usage);
void to_json(nlohmann::json& j, const ExecutionContext& context);
void from_json(const nlohmann::json& j, ExecutionContext& context);

}  // namespace stride::protocol

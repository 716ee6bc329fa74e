#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace stride::core::config {

enum class OutputMode {
    Debug,   // verbose logging of every event
    Normal
};

// Engine configuration, produced by the caller and consumed as-is.
struct AgentConfig {
    std::uint32_t max_steps = 200;
    bool enable_extended_view = true;
    std::vector<std::string> tools = {"task_done", "sequentialthinking"};
    OutputMode output_mode = OutputMode::Normal;
    std::optional<std::string> system_prompt;

    // Context budget handed to the conversation manager
    std::size_t token_budget = 8192;
};

bool operator==(const AgentConfig& lhs, const AgentConfig& rhs);

std::string to_string(OutputMode mode);

void to_json(nlohmann::json& j, const AgentConfig& config);
// Missing keys keep their defaults; wrong types throw nlohmann::json::exception.
void from_json(const nlohmann::json& j, AgentConfig& config);

core::errors::Result<AgentConfig> parse_agent_config(const std::string& text);
core::errors::Result<AgentConfig> load_agent_config(const std::filesystem::path& path);

}  // namespace stride::core::config

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"

namespace stride::session {

// Versioned copy of an agent's conversation state. Holds no live resources,
// so it can be written out by one process and restored by another.
struct PersistedContext {
    static constexpr std::uint32_t kCurrentVersion = 1;

    std::uint32_t version = kCurrentVersion;
    std::string agent_type;
    std::int64_t saved_at = 0;   // unix ms
    std::optional<core::config::AgentConfig> config;
    std::vector<protocol::Message> conversation_history;
    std::optional<protocol::ExecutionContext> execution_context;

    // Stamped with the current version and time
    static PersistedContext capture(std::string agent_type,
                                    std::optional<core::config::AgentConfig> config,
                                    std::vector<protocol::Message> conversation_history,
                                    std::optional<protocol::ExecutionContext> execution_context);

    std::string to_json_string() const;
    static core::errors::Result<PersistedContext> from_json_string(const std::string& text);

    // Creates parent directories as needed
    core::errors::Status to_file(const std::filesystem::path& path) const;
    static core::errors::Result<PersistedContext> from_file(const std::filesystem::path& path);
};

void to_json(nlohmann::json& j, const PersistedContext& snapshot);
void from_json(const nlohmann::json& j, PersistedContext& snapshot);

}  // namespace stride::session

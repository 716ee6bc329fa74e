#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace stride::trajectory {

    struct TaskStartEntry {
        std::string task;
        nlohmann::json agent_config = nlohmann::json::object();
    };

    struct LlmRequestEntry {
        std::vector<protocol::Message> messages;
        std::string model;
        std::string provider;
    };

    struct LlmResponseEntry {
        protocol::Message message;
        std::optional<protocol::TokenUsage> usage;
        std::optional<std::string> finish_reason;
    };

    struct ToolCallEntry { protocol::ToolCall call; };
    struct ToolResultEntry { protocol::ToolResult result; };

    struct StepCompleteEntry {
        std::string summary;
        bool success = false;
    };

    struct ErrorEntry {
        std::string error;
        std::optional<std::string> context;
    };

    struct TaskCompleteEntry {
        bool success = false;
        std::string final_result;
        std::uint32_t total_steps = 0;
        std::uint64_t duration_ms = 0;
    };

    using EntryType = std::variant<
        TaskStartEntry,
        LlmRequestEntry,
        LlmResponseEntry,
        ToolCallEntry,
        ToolResultEntry,
        StepCompleteEntry,
        ErrorEntry,
        TaskCompleteEntry
    >;

    // One immutable journal line. timestamp is unix milliseconds.
    struct TrajectoryEntry {
        std::string id;
        std::int64_t timestamp = 0;
        std::uint32_t step = 0;
        EntryType entry_type;

        // Fresh id and timestamp
        static TrajectoryEntry make(std::uint32_t step, EntryType entry_type);
    };

    // "task_start", "llm_request", ...
    std::string entry_type_name(const EntryType& entry_type);

    // JSON shape: {"id", "timestamp", "step", "entry_type": {"type": "tool_call", ...}}
    void to_json(nlohmann::json& j, const EntryType& entry_type);
    void from_json(const nlohmann::json& j, EntryType& entry_type);
    void to_json(nlohmann::json& j, const TrajectoryEntry& entry);
    void from_json(const nlohmann::json& j, TrajectoryEntry& entry);

} // namespace stride::trajectory

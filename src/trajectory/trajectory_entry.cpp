#include "trajectory/trajectory_entry.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include "core/config/ids.hpp"

namespace stride::trajectory {

using nlohmann::json;

namespace {

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

template <typename T>
json nullable(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json();
}

struct EntryTypeNamer {
    std::string operator()(const TaskStartEntry&) const { return "task_start"; }
    std::string operator()(const LlmRequestEntry&) const { return "llm_request"; }
    std::string operator()(const LlmResponseEntry&) const { return "llm_response"; }
    std::string operator()(const ToolCallEntry&) const { return "tool_call"; }
    std::string operator()(const ToolResultEntry&) const { return "tool_result"; }
    std::string operator()(const StepCompleteEntry&) const { return "step_complete"; }
    std::string operator()(const ErrorEntry&) const { return "error"; }
    std::string operator()(const TaskCompleteEntry&) const { return "task_complete"; }
};

}  // namespace

TrajectoryEntry TrajectoryEntry::make(const std::uint32_t step, EntryType entry_type) {
    TrajectoryEntry entry;
    entry.id = core::config::generate_uuid();
    entry.timestamp = core::config::now_unix_ms();
    entry.step = step;
    entry.entry_type = std::move(entry_type);
    return entry;
}

std::string entry_type_name(const EntryType& entry_type) {
    return std::visit(EntryTypeNamer{}, entry_type);
}

void to_json(json& j, const EntryType& entry_type) {
    std::visit(
        [&j](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, TaskStartEntry>) {
                j = json{{"task", e.task}, {"agent_config", e.agent_config}};
            } else if constexpr (std::is_same_v<T, LlmRequestEntry>) {
                j = json{{"messages", e.messages}, {"model", e.model}, {"provider", e.provider}};
            } else if constexpr (std::is_same_v<T, LlmResponseEntry>) {
                j = json{{"message", e.message},
                         {"usage", nullable(e.usage)},
                         {"finish_reason", nullable(e.finish_reason)}};
            } else if constexpr (std::is_same_v<T, ToolCallEntry>) {
                j = json{{"call", e.call}};
            } else if constexpr (std::is_same_v<T, ToolResultEntry>) {
                j = json{{"result", e.result}};
            } else if constexpr (std::is_same_v<T, StepCompleteEntry>) {
                j = json{{"summary", e.summary}, {"success", e.success}};
            } else if constexpr (std::is_same_v<T, ErrorEntry>) {
                j = json{{"error", e.error}, {"context", nullable(e.context)}};
            } else {
                j = json{{"success", e.success},
                         {"final_result", e.final_result},
                         {"total_steps", e.total_steps},
                         {"duration_ms", e.duration_ms}};
            }
        },
        entry_type);
    j["type"] = entry_type_name(entry_type);
}

void from_json(const json& j, EntryType& entry_type) {
    const auto type = j.at("type").get<std::string>();
    if (type == "task_start") {
        entry_type = TaskStartEntry{j.at("task").get<std::string>(),
                                    j.value("agent_config", json::object())};
    } else if (type == "llm_request") {
        entry_type = LlmRequestEntry{j.at("messages").get<std::vector<protocol::Message>>(),
                                     j.value("model", std::string()),
                                     j.value("provider", std::string())};
    } else if (type == "llm_response") {
        entry_type = LlmResponseEntry{j.at("message").get<protocol::Message>(),
                                      optional_field<protocol::TokenUsage>(j, "usage"),
                                      optional_field<std::string>(j, "finish_reason")};
    } else if (type == "tool_call") {
        entry_type = ToolCallEntry{j.at("call").get<protocol::ToolCall>()};
    } else if (type == "tool_result") {
        entry_type = ToolResultEntry{j.at("result").get<protocol::ToolResult>()};
    } else if (type == "step_complete") {
        entry_type = StepCompleteEntry{j.at("summary").get<std::string>(),
                                       j.at("success").get<bool>()};
    } else if (type == "error") {
        entry_type = ErrorEntry{j.at("error").get<std::string>(),
                                optional_field<std::string>(j, "context")};
    } else if (type == "task_complete") {
        entry_type = TaskCompleteEntry{j.at("success").get<bool>(),
                                       j.at("final_result").get<std::string>(),
                                       j.at("total_steps").get<std::uint32_t>(),
                                       j.at("duration_ms").get<std::uint64_t>()};
    } else {
        throw std::invalid_argument("Unknown trajectory entry type: " + type);
    }
}

void to_json(json& j, const TrajectoryEntry& entry) {
    j = json{{"id", entry.id},
             {"timestamp", entry.timestamp},
             {"step", entry.step},
             {"entry_type", entry.entry_type}};
}

void from_json(const json& j, TrajectoryEntry& entry) {
    entry.id = j.at("id").get<std::string>();
    entry.timestamp = j.at("timestamp").get<std::int64_t>();
    entry.step = j.at("step").get<std::uint32_t>();
    entry.entry_type = j.at("entry_type").get<EntryType>();
}

}  // namespace stride::trajectory

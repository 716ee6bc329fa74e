#include "session/context_snapshot.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace stride::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

void to_json(json& j, const PersistedContext& snapshot) {
    j = json{{"version", snapshot.version},
             {"agent_type", snapshot.agent_type},
             {"saved_at", snapshot.saved_at},
             {"conversation_history", snapshot.conversation_history}};
    j["config"] = snapshot.config.has_value() ? json(snapshot.config.value()) : json();
    j["execution_context"] = snapshot.execution_context.has_value()
                                 ? json(snapshot.execution_context.value())
                                 : json();
}

void from_json(const json& j, PersistedContext& snapshot) {
    snapshot.version = j.at("version").get<std::uint32_t>();
    snapshot.agent_type = j.at("agent_type").get<std::string>();
    snapshot.saved_at = j.at("saved_at").get<std::int64_t>();
    snapshot.conversation_history =
        j.at("conversation_history").get<std::vector<protocol::Message>>();

    snapshot.config.reset();
    if (j.contains("config") && !j.at("config").is_null()) {
        snapshot.config = j.at("config").get<core::config::AgentConfig>();
    }
    snapshot.execution_context.reset();
    if (j.contains("execution_context") && !j.at("execution_context").is_null()) {
        snapshot.execution_context = j.at("execution_context").get<protocol::ExecutionContext>();
    }
}

PersistedContext PersistedContext::capture(
    std::string agent_type, std::optional<core::config::AgentConfig> config,
    std::vector<protocol::Message> conversation_history,
    std::optional<protocol::ExecutionContext> execution_context) {
    PersistedContext snapshot;
    snapshot.agent_type = std::move(agent_type);
    snapshot.saved_at = core::config::now_unix_ms();
    snapshot.config = std::move(config);
    snapshot.conversation_history = std::move(conversation_history);
    snapshot.execution_context = std::move(execution_context);
    return snapshot;
}

std::string PersistedContext::to_json_string() const {
    return json(*this).dump(2, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<PersistedContext> PersistedContext::from_json_string(
    const std::string& text) {
    PersistedContext snapshot;
    try {
        snapshot = json::parse(text).get<PersistedContext>();
    } catch (const std::exception& ex) {
        return AgentError{ErrorCategory::Persistence,
                          std::string("Invalid snapshot document: ") + ex.what(),
                          "invalid_snapshot_format"};
    }

    if (snapshot.version > kCurrentVersion) {
        return AgentError{ErrorCategory::Persistence,
                          "Unsupported snapshot version " + std::to_string(snapshot.version),
                          "invalid_snapshot_format",
                          "The snapshot was written by a newer release."};
    }
    return snapshot;
}

core::errors::Status PersistedContext::to_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return AgentError{ErrorCategory::Persistence,
                              "Unable to create snapshot directory: " +
                                  path.parent_path().string(),
                              "snapshot_write_failed"};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open snapshot file: " + path.string(),
                          "snapshot_write_failed"};
    }
    out << to_json_string() << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to write snapshot file: " + path.string(),
                          "snapshot_write_failed"};
    }

    STRIDE_LOG_DEBUG("PersistedContext: saved " +
                     std::to_string(conversation_history.size()) + " messages to " +
                     path.string());
    return core::errors::ok();
}

core::errors::Result<PersistedContext> PersistedContext::from_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Snapshot file not found: " + path.string(), "snapshot_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open snapshot file: " + path.string(),
                          "snapshot_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return from_json_string(buffer.str());
}

}  // namespace stride::session

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/agent_engine.hpp"
#include "runtime/cancellation.hpp"

namespace stride::session {

enum class SessionState {
    Idle,
    Running,
    Completed,
    Failed,
    Interrupted
};

std::string to_string(SessionState state);

// Owns one engine and serializes every task on it. Each task gets its own
// cancellation controller, so cancel() only ever stops the task in flight.
class AgentSession {
public:
    explicit AgentSession(std::unique_ptr<runtime::AgentEngine> engine);

    // Blocks while another task runs on this session
    core::errors::Result<protocol::AgentExecution> run_task(
        const std::string& task, const std::filesystem::path& project_path);

    // Returns true if a task was running and this call cancelled it
    bool cancel();

    SessionState state() const;
    std::optional<std::string> current_run_id() const;
    std::size_t tasks_run() const;

    // Exclusive access between tasks, e.g. for snapshots
    void with_engine(const std::function<void(runtime::AgentEngine&)>& fn);

private:
    void transition_locked(SessionState next);

    std::mutex engine_mutex_;            // held for the whole of a task
    std::unique_ptr<runtime::AgentEngine> engine_;

    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::Idle;
    std::optional<runtime::CancellationController> active_controller_;
    std::optional<std::string> run_id_;
    std::size_t tasks_run_ = 0;
};

}  // namespace stride::session

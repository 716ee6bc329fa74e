#include "session/agent_session.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace stride::session {

using protocol::AgentExecution;
using protocol::RunOutcome;

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Running:
            return "running";
        case SessionState::Completed:
            return "completed";
        case SessionState::Failed:
            return "failed";
        case SessionState::Interrupted:
            return "interrupted";
        default:
            return "unknown";
    }
}

AgentSession::AgentSession(std::unique_ptr<runtime::AgentEngine> engine)
    : engine_(std::move(engine)) {}

core::errors::Result<AgentExecution> AgentSession::run_task(
    const std::string& task, const std::filesystem::path& project_path) {
    std::lock_guard<std::mutex> engine_lock(engine_mutex_);

    const runtime::CancellationController controller;
    engine_->set_cancellation_controller(controller);

    std::string run_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        run_id = core::config::generate_run_id();
        run_id_ = run_id;
        active_controller_ = controller;
        transition_locked(SessionState::Running);
    }

    auto result = engine_->execute_task_with_context(task, project_path);

    SessionState next = SessionState::Failed;
    if (!core::errors::is_error(result)) {
        switch (core::errors::get_value(result).outcome) {
            case RunOutcome::Completed:
                next = SessionState::Completed;
                break;
            case RunOutcome::Interrupted:
                next = SessionState::Interrupted;
                break;
            default:
                next = SessionState::Failed;
                break;
        }
    } else {
        STRIDE_LOG_WARN("AgentSession: run " + run_id + " rejected: " +
                        core::errors::describe(core::errors::get_error(result)));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_controller_.reset();
        ++tasks_run_;
        transition_locked(next);
    }
    return result;
}

bool AgentSession::cancel() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!active_controller_.has_value()) {
        return false;
    }
    const bool cancelled = active_controller_->cancel();
    if (cancelled) {
        STRIDE_LOG_INFO("AgentSession: run " + run_id_.value_or("?") + " cancellation requested");
    }
    return cancelled;
}

SessionState AgentSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<std::string> AgentSession::current_run_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return run_id_;
}

std::size_t AgentSession::tasks_run() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tasks_run_;
}

void AgentSession::with_engine(const std::function<void(runtime::AgentEngine&)>& fn) {
    std::lock_guard<std::mutex> engine_lock(engine_mutex_);
    fn(*engine_);
}

void AgentSession::transition_locked(const SessionState next) {
    const std::string prev = to_string(state_);
    state_ = next;
    STRIDE_LOG_INFO("AgentSession: run " + run_id_.value_or("?") + " transition " + prev +
                    " -> " + to_string(next));
}

}  // namespace stride::session

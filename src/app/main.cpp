#include <pthread.h>
#include <signal.h>

#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include "app/cli_parser.hpp"
#include "core/config/agent_config.hpp"
#include "core/config/ids.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "model/model_registry.hpp"
#include "output/log_output.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/agent_engine.hpp"
#include "session/agent_session.hpp"
#include "tools/tool_registry.hpp"
#include "trajectory/trajectory_recorder.hpp"

namespace {

using stride::core::errors::AgentError;
using stride::core::errors::ErrorCategory;

constexpr int kExitSuccess = 0;
constexpr int kExitTaskFailed = 1;
constexpr int kExitInterrupted = 130;

int exit_code_for(const AgentError& err) {
    switch (err.category) {
        case ErrorCategory::Input:
            return 2;
        case ErrorCategory::Setup:
            return 3;
        case ErrorCategory::Persistence:
            return 4;
        default:
            return kExitTaskFailed;
    }
}

int report(const std::string& what, const AgentError& err) {
    STRIDE_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        STRIDE_LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

// Turns SIGINT/SIGTERM into a session cancel. SIGUSR1 ends the watcher.
class SignalWatcher {
public:
    explicit SignalWatcher(stride::session::AgentSession& session) : session_(session) {
        thread_ = std::thread([this]() { run(); });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Must run before any thread starts so every thread inherits the mask
    static void block_signals() {
        sigset_t set = watched_set();
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
    }

private:
    static sigset_t watched_set() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGUSR1);
        return set;
    }

    void run() {
        const sigset_t set = watched_set();
        while (true) {
            int signal_number = 0;
            if (sigwait(&set, &signal_number) != 0 || signal_number == SIGUSR1) {
                return;
            }
            STRIDE_LOG_WARN("Signal " + std::to_string(signal_number) + " received, cancelling");
            session_.cancel();
        }
    }

    stride::session::AgentSession& session_;
    std::thread thread_;
};

}  // namespace

int main(int argc, char* argv[]) {
    SignalWatcher::block_signals();

    // 1. Tag every log line with the id of this invocation
    auto& logger = stride::core::logging::Logger::get();
    logger.set_context(stride::core::config::generate_run_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = stride::app::cli::parse_and_validate(argc, argv);
    if (stride::core::errors::is_error(parsed)) {
        return report("Input error", stride::core::errors::get_error(parsed));
    }
    const auto& req = stride::core::errors::get_value(parsed);
    if (req.verbose) {
        logger.set_level(stride::core::logging::LogLevel::DEBUG);
    }

    // 3. Configuration
    stride::core::config::AgentConfig config;
    if (req.config_file.has_value()) {
        auto loaded = stride::core::config::load_agent_config(req.config_file.value());
        if (stride::core::errors::is_error(loaded)) {
            return report("Invalid configuration", stride::core::errors::get_error(loaded));
        }
        config = stride::core::errors::take_value(std::move(loaded));
    }
    if (req.max_steps.has_value()) {
        config.max_steps = req.max_steps.value();
    }
    if (req.verbose) {
        config.output_mode = stride::core::config::OutputMode::Debug;
    }

    // 4. Collaborators
    stride::model::ModelSettings settings;
    settings.provider = "scripted";
    settings.model = "scripted-model";
    settings.extra = nlohmann::json{{"script", req.script_file.string()}};
    auto model = stride::model::ModelRegistry::with_builtin_providers().create(settings);
    if (stride::core::errors::is_error(model)) {
        return report("Model setup failed", stride::core::errors::get_error(model));
    }

    auto tools = stride::tools::ToolRegistry::with_builtin_tools().create_executor(config.tools);
    auto output = std::make_shared<stride::output::LogOutput>(req.auto_approve);
    auto engine = std::make_unique<stride::runtime::AgentEngine>(
        config, stride::core::errors::get_value(model), std::move(tools), output);

    if (req.trajectory_file.has_value()) {
        engine->set_trajectory_recorder(
            stride::trajectory::TrajectoryRecorder::with_file(req.trajectory_file.value()));
    }
    if (req.resume_file.has_value()) {
        const auto restored = engine->restore_from_file(req.resume_file.value());
        if (stride::core::errors::is_error(restored)) {
            return report("Unable to resume", stride::core::errors::get_error(restored));
        }
    }

    // 5. Run
    stride::session::AgentSession session(std::move(engine));
    stride::core::errors::Result<stride::protocol::AgentExecution> result =
        AgentError{ErrorCategory::Internal, "Task did not run.", "not_run"};
    {
        SignalWatcher watcher(session);
        result = session.run_task(req.task, req.working_directory);
    }
    if (stride::core::errors::is_error(result)) {
        return report("Task rejected", stride::core::errors::get_error(result));
    }
    const auto& execution = stride::core::errors::get_value(result);
    STRIDE_LOG_INFO("Run " + stride::protocol::to_string(execution.outcome) + ": " +
                    execution.final_result + " (" + std::to_string(execution.steps) +
                    " steps, " + std::to_string(execution.duration_ms) + " ms)");

    // 6. Persist
    if (req.save_file.has_value()) {
        stride::core::errors::Status saved = stride::core::errors::ok();
        session.with_engine([&](stride::runtime::AgentEngine& e) {
            saved = e.export_snapshot_to_file(req.save_file.value());
        });
        if (stride::core::errors::is_error(saved)) {
            return report("Unable to save snapshot", stride::core::errors::get_error(saved));
        }
        STRIDE_LOG_INFO("Snapshot saved: " + req.save_file->string());
    }
    const auto flushed = output->flush();
    if (stride::core::errors::is_error(flushed)) {
        STRIDE_LOG_WARN("Output flush failed: " + stride::core::errors::get_error(flushed).message);
    }

    switch (execution.outcome) {
        case stride::protocol::RunOutcome::Completed:
            return kExitSuccess;
        case stride::protocol::RunOutcome::Interrupted:
            return kExitInterrupted;
        default:
            return kExitTaskFailed;
    }
}

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "model/scripted_model_client.hpp"
#include "runtime/agent_engine.hpp"
#include "session/agent_session.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using stride::core::config::AgentConfig;
using stride::core::errors::get_error;
using stride::core::errors::get_value;
using stride::core::errors::is_error;
using stride::core::errors::Result;
using stride::model::ChatOptions;
using stride::model::ModelClient;
using stride::model::ModelResponse;
using stride::model::ScriptedModelClient;
using stride::protocol::ContentBlock;
using stride::protocol::Message;
using stride::protocol::RunOutcome;
using stride::protocol::ToolDefinition;
using stride::protocol::ToolUseBlock;
using stride::runtime::AgentEngine;
using stride::session::AgentSession;
using stride::session::SessionState;
using stride::tools::ToolRegistry;

ModelResponse done_turn(const std::string& id) {
    ModelResponse response;
    response.message = Message::assistant(
        std::vector<ContentBlock>{ToolUseBlock{id, "task_done", json::object()}});
    return response;
}

// Runs a hook before answering, so tests can poke the session mid-task.
class HookedModel : public ModelClient {
public:
    explicit HookedModel(std::function<void()> hook) : hook_(std::move(hook)) {}

    Result<ModelResponse> complete(const std::vector<Message>& /*messages*/,
                                   const std::vector<ToolDefinition>& /*tools*/,
                                   const ChatOptions& /*options*/) override {
        hook_();
        return done_turn("hooked-1");
    }

    std::string model_name() const override { return "hooked"; }
    std::string provider_name() const override { return "test"; }

private:
    std::function<void()> hook_;
};

std::unique_ptr<AgentEngine> make_engine(std::shared_ptr<ModelClient> model) {
    return std::make_unique<AgentEngine>(
        AgentConfig{}, std::move(model),
        ToolRegistry::with_builtin_tools().create_executor({"task_done"}), nullptr);
}

TEST(AgentSessionTest, StartsIdleAndRejectsCancelWithoutTask) {
    AgentSession session(make_engine(std::make_shared<ScriptedModelClient>(
        std::vector<Result<ModelResponse>>{})));

    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_FALSE(session.current_run_id().has_value());
    EXPECT_FALSE(session.cancel());
    EXPECT_EQ(session.tasks_run(), 0u);
}

TEST(AgentSessionTest, CompletedTaskMovesToCompleted) {
    AgentSession session(make_engine(std::make_shared<ScriptedModelClient>(
        std::vector<Result<ModelResponse>>{done_turn("a"), done_turn("b")})));

    auto first = session.run_task("First", "/work/demo");
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).outcome, RunOutcome::Completed);
    EXPECT_EQ(session.state(), SessionState::Completed);
    const auto first_run = session.current_run_id();
    ASSERT_TRUE(first_run.has_value());
    EXPECT_EQ(first_run->rfind("run-", 0), 0u);

    ASSERT_FALSE(is_error(session.run_task("Second", "/work/demo")));
    EXPECT_EQ(session.tasks_run(), 2u);
    EXPECT_NE(session.current_run_id(), first_run);
    EXPECT_FALSE(session.cancel());
}

TEST(AgentSessionTest, FailedAndRejectedTasksMoveToFailed) {
    AgentSession session(make_engine(std::make_shared<ScriptedModelClient>(
        std::vector<Result<ModelResponse>>{stride::model::network_error("offline")})));

    auto failed = session.run_task("Call out", "/work/demo");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed).outcome, RunOutcome::Failed);
    EXPECT_EQ(session.state(), SessionState::Failed);

    auto rejected = session.run_task("", "/work/demo");
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "empty_task");
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.tasks_run(), 2u);
}

TEST(AgentSessionTest, CancelStopsTaskInFlight) {
    AgentSession* session_ptr = nullptr;
    SessionState seen_state = SessionState::Idle;
    bool cancel_accepted = false;

    auto model = std::make_shared<HookedModel>([&]() {
        seen_state = session_ptr->state();
        cancel_accepted = session_ptr->cancel();
    });
    AgentSession session(make_engine(model));
    session_ptr = &session;

    auto result = session.run_task("Long job", "/work/demo");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Interrupted);
    EXPECT_EQ(seen_state, SessionState::Running);
    EXPECT_TRUE(cancel_accepted);
    EXPECT_EQ(session.state(), SessionState::Interrupted);
    EXPECT_FALSE(session.cancel());
}

TEST(AgentSessionTest, CancellationDoesNotLeakIntoNextTask) {
    int calls = 0;
    AgentSession* session_ptr = nullptr;
    auto model = std::make_shared<HookedModel>([&]() {
        if (++calls == 1) {
            session_ptr->cancel();
        }
    });
    AgentSession session(make_engine(model));
    session_ptr = &session;

    auto interrupted = session.run_task("First", "/work/demo");
    ASSERT_FALSE(is_error(interrupted));
    EXPECT_EQ(get_value(interrupted).outcome, RunOutcome::Interrupted);

    auto completed = session.run_task("Second", "/work/demo");
    ASSERT_FALSE(is_error(completed));
    EXPECT_EQ(get_value(completed).outcome, RunOutcome::Completed);
    EXPECT_EQ(session.state(), SessionState::Completed);
}

TEST(AgentSessionTest, WithEngineGivesAccessBetweenTasks) {
    AgentSession session(make_engine(std::make_shared<ScriptedModelClient>(
        std::vector<Result<ModelResponse>>{done_turn("a")})));
    ASSERT_FALSE(is_error(session.run_task("Snapshot me", "/work/demo")));

    std::size_t history_size = 0;
    std::string snapshot;
    session.with_engine([&](AgentEngine& engine) {
        history_size = engine.history().size();
        snapshot = engine.export_snapshot_json();
    });
    EXPECT_EQ(history_size, 4u);
    EXPECT_NE(snapshot.find("Snapshot me"), std::string::npos);
}

TEST(AgentSessionTest, StateNamesAreStable) {
    EXPECT_EQ(stride::session::to_string(SessionState::Idle), "idle");
    EXPECT_EQ(stride::session::to_string(SessionState::Interrupted), "interrupted");
}

}  // namespace

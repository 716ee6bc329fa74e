#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "model/model_client.hpp"

namespace stride::model {

// Replays a fixed list of model turns in order. Each turn is either a response
// or a transport error. Used by the CLI for deterministic runs and by tests.
//
// Script document:
//   {"model": "name", "repeat_last": false,
//    "responses": [{"message": {...}, "usage": {...}, "finish_reason": "tool_use"},
//                  {"error": {"code": "remote_rejected", "status": 503, "message": "..."}}]}
class ScriptedModelClient : public ModelClient {
public:
    explicit ScriptedModelClient(std::vector<core::errors::Result<ModelResponse>> turns,
                                 std::string model = "scripted-model");

    static core::errors::Result<std::shared_ptr<ScriptedModelClient>> from_json(
        const nlohmann::json& script);
    static core::errors::Result<std::shared_ptr<ScriptedModelClient>> from_file(
        const std::filesystem::path& path);

    // Keep answering with the final turn once the script runs out.
    void set_repeat_last(bool repeat_last);

    core::errors::Result<ModelResponse> complete(
        const std::vector<protocol::Message>& messages,
        const std::vector<protocol::ToolDefinition>& tools,
        const ChatOptions& options) override;

    std::string model_name() const override;
    std::string provider_name() const override;

    std::size_t call_count() const;
    std::vector<std::vector<protocol::Message>> requests() const;

private:
    std::vector<core::errors::Result<ModelResponse>> turns_;
    std::string model_;
    bool repeat_last_ = false;

    mutable std::mutex mutex_;
    std::size_t next_turn_ = 0;
    std::vector<std::vector<protocol::Message>> requests_;
};

}  // namespace stride::model

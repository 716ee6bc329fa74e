#include "model/scripted_model_client.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace stride::model {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError turn_error_from_json(const json& error) {
    const auto code = error.value("code", std::string("network_error"));
    const auto message = error.value("message", std::string("scripted failure"));
    if (code == "remote_rejected") {
        return remote_rejected(error.value("status", 500), message);
    }
    if (code == "authentication_failed") {
        return authentication_error(message);
    }
    if (code == "malformed_request") {
        return malformed_request(message);
    }
    if (code == "unsupported_capability") {
        return unsupported_capability(message);
    }
    return AgentError{ErrorCategory::Transport, message, code};
}

core::errors::Result<ModelResponse> turn_from_json(const json& turn,
                                                   const std::string& model) {
    if (turn.contains("error")) {
        return turn_error_from_json(turn.at("error"));
    }

    ModelResponse response;
    response.model = model;
    response.message = turn.at("message").get<protocol::Message>();
    if (turn.contains("usage") && !turn.at("usage").is_null()) {
        response.usage = turn.at("usage").get<protocol::TokenUsage>();
    }
    if (turn.contains("finish_reason") && turn.at("finish_reason").is_string()) {
        response.finish_reason =
            finish_reason_from_string(turn.at("finish_reason").get<std::string>());
    }
    return response;
}

}  // namespace

ScriptedModelClient::ScriptedModelClient(
    std::vector<core::errors::Result<ModelResponse>> turns, std::string model)
    : turns_(std::move(turns)), model_(std::move(model)) {}

core::errors::Result<std::shared_ptr<ScriptedModelClient>> ScriptedModelClient::from_json(
    const json& script) {
    try {
        const auto model = script.value("model", std::string("scripted-model"));
        std::vector<core::errors::Result<ModelResponse>> turns;
        for (const auto& turn : script.at("responses")) {
            turns.push_back(turn_from_json(turn, model));
        }
        auto client = std::make_shared<ScriptedModelClient>(std::move(turns), model);
        client->set_repeat_last(script.value("repeat_last", false));
        return client;
    } catch (const std::exception& e) {
        return AgentError{ErrorCategory::Setup,
                          std::string("Invalid model script: ") + e.what(),
                          "invalid_script"};
    }
}

core::errors::Result<std::shared_ptr<ScriptedModelClient>> ScriptedModelClient::from_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return AgentError{ErrorCategory::Setup, "Model script not found: " + path.string(),
                          "script_not_found"};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Setup,
                          "Unable to open model script: " + path.string(),
                          "script_not_found"};
    }

    const json script = json::parse(in, nullptr, false);
    if (script.is_discarded()) {
        return AgentError{ErrorCategory::Setup,
                          "Model script is not valid JSON: " + path.string(),
                          "invalid_script"};
    }
    return from_json(script);
}

void ScriptedModelClient::set_repeat_last(const bool repeat_last) {
    std::lock_guard<std::mutex> lock(mutex_);
    repeat_last_ = repeat_last;
}

core::errors::Result<ModelResponse> ScriptedModelClient::complete(
    const std::vector<protocol::Message>& messages,
    const std::vector<protocol::ToolDefinition>& /*tools*/,
    const ChatOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(messages);

    if (next_turn_ >= turns_.size()) {
        if (!repeat_last_ || turns_.empty()) {
            return AgentError{ErrorCategory::Transport,
                              "Model script exhausted after " +
                                  std::to_string(turns_.size()) + " responses.",
                              "script_exhausted"};
        }
        return turns_.back();
    }
    return turns_[next_turn_++];
}

std::string ScriptedModelClient::model_name() const {
    return model_;
}

std::string ScriptedModelClient::provider_name() const {
    return "scripted";
}

std::size_t ScriptedModelClient::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::vector<std::vector<protocol::Message>> ScriptedModelClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

}  // namespace stride::model

#include "core/config/agent_config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace stride::core::config {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

bool operator==(const AgentConfig& lhs, const AgentConfig& rhs) {
    return lhs.max_steps == rhs.max_steps &&
           lhs.enable_extended_view == rhs.enable_extended_view &&
           lhs.tools == rhs.tools && lhs.output_mode == rhs.output_mode &&
           lhs.system_prompt == rhs.system_prompt &&
           lhs.token_budget == rhs.token_budget;
}

std::string to_string(const OutputMode mode) {
    switch (mode) {
        case OutputMode::Debug:
            return "debug";
        case OutputMode::Normal:
            return "normal";
        default:
            return "unknown";
    }
}

void to_json(json& j, const AgentConfig& config) {
    j = json{{"max_steps", config.max_steps},
             {"enable_extended_view", config.enable_extended_view},
             {"tools", config.tools},
             {"output_mode", to_string(config.output_mode)},
             {"token_budget", config.token_budget}};
    j["system_prompt"] =
        config.system_prompt.has_value() ? json(config.system_prompt.value()) : json();
}

void from_json(const json& j, AgentConfig& config) {
    const AgentConfig defaults;
    config.max_steps = j.value("max_steps", defaults.max_steps);
    config.enable_extended_view =
        j.value("enable_extended_view", defaults.enable_extended_view);
    config.tools = j.value("tools", defaults.tools);
    config.token_budget = j.value("token_budget", defaults.token_budget);

    const auto mode = j.value("output_mode", to_string(defaults.output_mode));
    config.output_mode =
        (mode == "debug" || mode == "Debug") ? OutputMode::Debug : OutputMode::Normal;

    config.system_prompt.reset();
    if (j.contains("system_prompt") && !j.at("system_prompt").is_null()) {
        config.system_prompt = j.at("system_prompt").get<std::string>();
    }
}

core::errors::Result<AgentConfig> parse_agent_config(const std::string& text) {
    try {
        const auto document = json::parse(text);
        if (!document.is_object()) {
            return AgentError{ErrorCategory::Input,
                              "Agent configuration must be a JSON object.",
                              "invalid_config"};
        }
        AgentConfig config = document.get<AgentConfig>();
        if (config.max_steps == 0) {
            return AgentError{ErrorCategory::Input, "max_steps must be positive.",
                              "invalid_config"};
        }
        return config;
    } catch (const json::exception& e) {
        return AgentError{ErrorCategory::Input,
                          std::string("Malformed agent configuration: ") + e.what(),
                          "invalid_config"};
    }
}

core::errors::Result<AgentConfig> load_agent_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Configuration file not found: " + path.string(),
                          "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open configuration file: " + path.string(),
                          "config_not_found"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_agent_config(buffer.str());
}

}  // namespace stride::core::config

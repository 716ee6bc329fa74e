#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stride::runtime {

// Host facts the model may need: operating system, architecture, date.
// Never includes paths.
std::string build_environment_context();

// Built-in agent prompt anchored to the project root
std::string build_default_prompt(const std::string& project_path);

// custom_prompt replaces the built-in prompt and drops every project-specific
// line; the tool list is appended in both cases.
std::string build_system_prompt(const std::optional<std::string>& custom_prompt,
                                const std::string& project_path,
                                const std::vector<std::string>& tool_names);

}  // namespace stride::runtime

#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace stride::protocol {

    // Validated command line input for one task run
    struct RunRequest {
        std::string task;
        std::filesystem::path script_file;       // scripted model responses
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::optional<std::uint32_t> max_steps;  // overrides the config file
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> trajectory_file;
        std::optional<std::filesystem::path> resume_file;
        std::optional<std::filesystem::path> save_file;
        bool auto_approve = false;
        bool verbose = false;
    };

} // namespace stride::protocol

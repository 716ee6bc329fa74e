#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace stride::app::cli {

    using namespace stride::core::errors;
    using stride::protocol::RunRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> script;
        std::optional<std::string> cwd;
        std::optional<std::string> max_steps;
        std::optional<std::string> config;
        std::optional<std::string> trajectory;
        std::optional<std::string> resume;
        std::optional<std::string> save;
        bool yes = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: stride_cli run --task \"...\" --script responses.json [--max-steps N] "
               "[--config agent.json] [--trajectory out.json] [--resume snapshot.json] "
               "[--save snapshot.json] [--cwd DIR] [--yes] [--verbose]";
    }

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        std::string command = argv[1];
        if (command != "run") {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // Flags that take a value, and where it goes
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--task", &raw.task},         {"--script", &raw.script},
            {"--cwd", &raw.cwd},           {"--max-steps", &raw.max_steps},
            {"--config", &raw.config},     {"--trajectory", &raw.trajectory},
            {"--resume", &raw.resume},     {"--save", &raw.save}};

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--yes") {
                raw.yes = true;
                continue;
            }
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : valued) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunRequest req;
        req.verbose = raw.verbose;
        req.auto_approve = raw.yes;

        if (!raw.task.has_value() || raw.task->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide a non-empty --task", "missing_required_flag"};
        }
        if (!raw.script.has_value() || raw.script->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide --script", "missing_required_flag", "The script file lists the model responses to replay."};
        }
        req.task = raw.task.value();
        req.script_file = std::filesystem::path(raw.script.value());

        // Exception-free integer parsing
        if (raw.max_steps) {
            uint32_t steps = 0;
            const char* begin = raw.max_steps->data();
            const char* end = raw.max_steps->data() + raw.max_steps->size();
            auto [ptr, ec] = std::from_chars(begin, end, steps);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-steps", "invalid_integer", "Provide a positive integer."};
            }
            if (steps == 0 || steps > 1000) {
                return AgentError{ErrorCategory::Input, "--max-steps out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            req.max_steps = steps;
        }

        if (raw.config) req.config_file = std::filesystem::path(raw.config.value());
        if (raw.trajectory) req.trajectory_file = std::filesystem::path(raw.trajectory.value());
        if (raw.resume) req.resume_file = std::filesystem::path(raw.resume.value());
        if (raw.save) req.save_file = std::filesystem::path(raw.save.value());

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return req;
    }

} // namespace stride::app::cli

#include "runtime/prompt.hpp"

#include <sys/utsname.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stride::runtime {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += item;
    }
    return out;
}

}  // namespace

std::string build_environment_context() {
    std::ostringstream out;

    struct utsname host {};
    if (uname(&host) == 0) {
        out << "Operating System: " << host.sysname << " " << host.release << "\n"
            << "Architecture: " << host.machine << "\n";
    } else {
        out << "Operating System: unknown\n";
    }

    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    out << "Current Date: " << std::put_time(&utc, "%Y-%m-%d") << " (UTC)";
    return out.str();
}

std::string build_default_prompt(const std::string& project_path) {
    std::ostringstream out;
    out << "You are an expert AI software engineering agent. You work inside a code "
           "repository, read and change files through the tools you are given, and verify "
           "your changes before reporting that the task is done.\n\n"
        << "Project root path: " << project_path << "\n"
        << "IMPORTANT: When using tools that require file paths, use absolute paths under "
           "the project root.\n\n"
        << "Work step by step. Call task_done only once the task is complete.\n\n"
        << "[System Context]:\n"
        << build_environment_context();
    return out.str();
}

std::string build_system_prompt(const std::optional<std::string>& custom_prompt,
                                const std::string& project_path,
                                const std::vector<std::string>& tool_names) {
    std::string base;
    if (custom_prompt.has_value()) {
        base = custom_prompt.value() + "\n\n[System Context]:\n" + build_environment_context();
    } else {
        base = build_default_prompt(project_path);
    }
    return base + "\n\nAvailable tools: " + join(tool_names, ", ");
}

}  // namespace stride::runtime

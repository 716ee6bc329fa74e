#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "trajectory/trajectory_entry.hpp"

namespace stride::trajectory {

// Derived from the entries every time it is built, never stored on its own.
struct TrajectoryMetadata {
    std::string id;
    std::int64_t started_at = 0;
    std::optional<std::int64_t> completed_at;
    std::string version = "1.0";
    std::string agent_type;
    std::optional<std::string> task;
    std::optional<bool> success;
    std::uint32_t total_steps = 0;
    std::optional<std::uint64_t> duration_ms;
};

struct Trajectory {
    TrajectoryMetadata metadata;
    std::vector<TrajectoryEntry> entries;
};

void to_json(nlohmann::json& j, const TrajectoryMetadata& metadata);
void from_json(const nlohmann::json& j, TrajectoryMetadata& metadata);
void to_json(nlohmann::json& j, const Trajectory& trajectory);
void from_json(const nlohmann::json& j, Trajectory& trajectory);

// Append-only journal of one agent's execution. Safe to share between
// threads; with a file attached every record() rewrites the whole document.
class TrajectoryRecorder {
public:
    static constexpr const char* kDefaultAgentType = "stride_agent";

    // In-memory only
    TrajectoryRecorder();
    // Auto-saves to path after every record
    explicit TrajectoryRecorder(std::filesystem::path path);

    static std::shared_ptr<TrajectoryRecorder> with_file(std::filesystem::path path);

    // trajectories/trajectory_YYYYMMDD_HHMMSS.json under the given root
    static std::shared_ptr<TrajectoryRecorder> with_auto_filename(
        const std::filesystem::path& root = std::filesystem::path("."));

    core::errors::Status record(TrajectoryEntry entry);

    std::vector<TrajectoryEntry> entries() const;
    std::size_t entry_count() const;
    void clear();

    // No-op without a file
    core::errors::Status save() const;

    Trajectory build_trajectory() const;

    const std::optional<std::filesystem::path>& file_path() const { return file_path_; }
    bool auto_save() const { return auto_save_; }

    // trajectory_not_found vs. invalid_trajectory_format
    static core::errors::Result<Trajectory> load(const std::filesystem::path& path);

private:
    Trajectory build_locked() const;
    core::errors::Status save_locked() const;

    mutable std::mutex mutex_;
    std::vector<TrajectoryEntry> entries_;
    std::optional<std::filesystem::path> file_path_;
    bool auto_save_ = false;
    std::string trajectory_id_;
};

}  // namespace stride::trajectory

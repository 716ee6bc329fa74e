#include "trajectory/trajectory_recorder.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace stride::trajectory {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

template <typename T>
json nullable(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json();
}

std::string utc_stamp() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y%m%d_%H%M%S");
    return out.str();
}

}  // namespace

void to_json(json& j, const TrajectoryMetadata& metadata) {
    j = json{{"id", metadata.id},
             {"started_at", metadata.started_at},
             {"completed_at", nullable(metadata.completed_at)},
             {"version", metadata.version},
             {"agent_type", metadata.agent_type},
             {"task", nullable(metadata.task)},
             {"success", nullable(metadata.success)},
             {"total_steps", metadata.total_steps},
             {"duration_ms", nullable(metadata.duration_ms)}};
}

void from_json(const json& j, TrajectoryMetadata& metadata) {
    metadata.id = j.at("id").get<std::string>();
    metadata.started_at = j.at("started_at").get<std::int64_t>();
    metadata.completed_at = optional_field<std::int64_t>(j, "completed_at");
    metadata.version = j.at("version").get<std::string>();
    metadata.agent_type = j.at("agent_type").get<std::string>();
    metadata.task = optional_field<std::string>(j, "task");
    metadata.success = optional_field<bool>(j, "success");
    metadata.total_steps = j.value("total_steps", 0U);
    metadata.duration_ms = optional_field<std::uint64_t>(j, "duration_ms");
}

void to_json(json& j, const Trajectory& trajectory) {
    j = json{{"metadata", trajectory.metadata}, {"entries", trajectory.entries}};
}

void from_json(const json& j, Trajectory& trajectory) {
    trajectory.metadata = j.at("metadata").get<TrajectoryMetadata>();
    trajectory.entries = j.at("entries").get<std::vector<TrajectoryEntry>>();
}

TrajectoryRecorder::TrajectoryRecorder() : trajectory_id_(core::config::generate_uuid()) {}

TrajectoryRecorder::TrajectoryRecorder(std::filesystem::path path)
    : file_path_(std::move(path)),
      auto_save_(true),
      trajectory_id_(core::config::generate_uuid()) {}

std::shared_ptr<TrajectoryRecorder> TrajectoryRecorder::with_file(std::filesystem::path path) {
    return std::make_shared<TrajectoryRecorder>(std::move(path));
}

std::shared_ptr<TrajectoryRecorder> TrajectoryRecorder::with_auto_filename(
    const std::filesystem::path& root) {
    return with_file(root / "trajectories" / ("trajectory_" + utc_stamp() + ".json"));
}

core::errors::Status TrajectoryRecorder::record(TrajectoryEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    if (!auto_save_) {
        return core::errors::ok();
    }
    return save_locked();
}

std::vector<TrajectoryEntry> TrajectoryRecorder::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t TrajectoryRecorder::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TrajectoryRecorder::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

core::errors::Status TrajectoryRecorder::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

Trajectory TrajectoryRecorder::build_trajectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_locked();
}

Trajectory TrajectoryRecorder::build_locked() const {
    Trajectory trajectory;
    trajectory.entries = entries_;

    auto& metadata = trajectory.metadata;
    metadata.id = trajectory_id_;
    metadata.agent_type = kDefaultAgentType;
    metadata.started_at =
        entries_.empty() ? core::config::now_unix_ms() : entries_.front().timestamp;

    for (const auto& entry : entries_) {
        metadata.total_steps = std::max(metadata.total_steps, entry.step);
        if (const auto* start = std::get_if<TaskStartEntry>(&entry.entry_type)) {
            metadata.task = start->task;
        } else if (const auto* done = std::get_if<TaskCompleteEntry>(&entry.entry_type)) {
            metadata.success = done->success;
        }
    }

    if (metadata.success.has_value()) {
        const auto end = entries_.back().timestamp;
        metadata.completed_at = end;
        metadata.duration_ms =
            end > metadata.started_at ? static_cast<std::uint64_t>(end - metadata.started_at) : 0;
    }
    return trajectory;
}

core::errors::Status TrajectoryRecorder::save_locked() const {
    if (!file_path_.has_value()) {
        return core::errors::ok();
    }
    const auto& path = file_path_.value();

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return AgentError{ErrorCategory::Persistence,
                              "Unable to create trajectory directory: " +
                                  path.parent_path().string(),
                              "trajectory_write_failed"};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open trajectory file: " + path.string(),
                          "trajectory_write_failed"};
    }
    out << json(build_locked()).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to write trajectory file: " + path.string(),
                          "trajectory_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<Trajectory> TrajectoryRecorder::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Trajectory file not found: " + path.string(),
                          "trajectory_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open trajectory file: " + path.string(),
                          "trajectory_not_found"};
    }

    try {
        return json::parse(in).get<Trajectory>();
    } catch (const std::exception& ex) {
        STRIDE_LOG_DEBUG("TrajectoryRecorder: rejected " + path.string() + ": " + ex.what());
        return AgentError{ErrorCategory::Persistence,
                          "Invalid trajectory format: " + path.string(),
                          "invalid_trajectory_format"};
    }
}

}  // namespace stride::trajectory

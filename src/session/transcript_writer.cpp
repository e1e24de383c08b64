#include "session/transcript_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace forge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

TranscriptWriter::TranscriptWriter(std::filesystem::path workspace_root,
                                   std::filesystem::path session_subdir)
    : workspace_root_(std::move(workspace_root)), session_subdir_(std::move(session_subdir)) {}

core::errors::Result<std::filesystem::path> TranscriptWriter::transcript_path(
    const std::string& task_id) const {
    if (task_id.empty()) {
        return ForgeError{ErrorCategory::Input, "Task ID cannot be empty.", "invalid_task_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root is not a directory: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto sessions_dir = canonical_root / session_subdir_;
    std::filesystem::create_directories(sessions_dir, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to create session directory: " + sessions_dir.string(),
                          "session_dir_create_failed"};
    }

    return sessions_dir / (task_id + ".jsonl");
}

core::errors::Status TranscriptWriter::save(const std::string& task_id,
                                            const std::vector<protocol::Turn>& turns,
                                            const protocol::TaskState state) {
    auto path_result = transcript_path(task_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t& written = written_turns_[task_id];
    // A new task on the same conversation starts its transcript at the
    // first turn not yet recorded under any earlier task.
    if (written == 0) {
        for (const auto& entry : written_turns_) {
            if (entry.first != task_id && entry.second > written) {
                written = entry.second;
            }
        }
    }
    if (written > turns.size()) {
        written = turns.size();
    }

    std::vector<std::string> lines;
    for (std::size_t i = written; i < turns.size(); ++i) {
        json event;
        event["ts_unix_ms"] = now_unix_ms();
        event["event"] = "turn";
        event["task_id"] = task_id;
        event["index"] = i;
        event["payload"] = protocol::turn_to_json(turns[i]);
        lines.push_back(event.dump());
    }

    json state_event;
    state_event["ts_unix_ms"] = now_unix_ms();
    state_event["event"] = "state";
    state_event["task_id"] = task_id;
    state_event["payload"] = {{"state", protocol::to_string(state)}};
    lines.push_back(state_event.dump());

    auto status = append_events(core::errors::get_value(path_result), lines);
    if (core::errors::is_error(status)) {
        return status;
    }
    written = turns.size();
    return core::errors::ok();
}

core::errors::Status TranscriptWriter::append_events(const std::filesystem::path& path,
                                                     const std::vector<std::string>& lines) const {
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Internal, "Unable to open transcript: " + path.string(),
                          "transcript_open_failed"};
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out.good()) {
        return ForgeError{ErrorCategory::Internal,
                          "Unable to write transcript: " + path.string(),
                          "transcript_write_failed"};
    }
    return core::errors::ok();
}

}  // namespace forge::session

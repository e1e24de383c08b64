#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "session/session_store.hpp"

namespace forge::session {

// JSONL transcript per task under <workspace>/.forge_sessions. Each save
// appends only the turns not yet written for that task, then a state event.
class TranscriptWriter : public SessionStore {
public:
    explicit TranscriptWriter(std::filesystem::path workspace_root,
                              std::filesystem::path session_subdir = ".forge_sessions");

    core::errors::Status save(const std::string& task_id,
                              const std::vector<protocol::Turn>& turns,
                              protocol::TaskState state) override;

    core::errors::Result<std::filesystem::path> transcript_path(const std::string& task_id) const;

private:
    core::errors::Status append_events(const std::filesystem::path& path,
                                       const std::vector<std::string>& lines) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path session_subdir_;

    std::mutex mutex_;
    std::map<std::string, std::size_t> written_turns_;
};

}  // namespace forge::session

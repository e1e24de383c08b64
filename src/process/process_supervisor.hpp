#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"
#include "protocol/event_contract.hpp"

namespace forge::process {

using ProcessId = std::uint64_t;

enum class ProcessState {
    Starting,
    Running,
    Completed,
    Killed,
    TimedOut
};

std::string to_string(ProcessState state);
bool is_terminal(ProcessState state);

struct OutputChunk {
    ProcessId process_id = 0;
    protocol::OutputStream stream = protocol::OutputStream::Stdout;
    std::string text;
};

// Invoked on the process's monitor thread, never under a supervisor lock.
using OutputSink = std::function<void(const OutputChunk&)>;

struct SpawnRequest {
    std::string program;  // looked up on PATH
    std::vector<std::string> args;
    std::filesystem::path cwd;
    bool interactive = false;
    OutputSink sink;
};

struct ProcessSnapshot {
    ProcessId id = 0;
    std::string command_line;
    ProcessState state = ProcessState::Starting;
    std::optional<int> exit_code;
    std::string stdout_tail;
    std::string stderr_tail;
    bool interactive = false;
};

struct SupervisorOptions {
    std::size_t tail_bytes = 16384;
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::milliseconds poll_interval{50};
};

// Owns every external process the engine starts. Each process gets a
// monitor thread that streams its output, enforces kill/timeout requests
// and reaps it; callers only ever wait on bounded condition variables.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    core::errors::Result<ProcessId> spawn(SpawnRequest request);

    core::errors::Status send_input(ProcessId id, const std::string& bytes);

    // Closes stdin of an interactive process (EOF for the child).
    core::errors::Status close_input(ProcessId id);

    // Waits at most `timeout` for a terminal state, returning the latest snapshot.
    core::errors::Result<ProcessSnapshot> wait_for(
        ProcessId id, std::chrono::milliseconds timeout,
        const core::concurrency::CancelToken& cancel = nullptr);

    // Idempotent: a terminal process reports its state again without error.
    core::errors::Result<ProcessState> kill(ProcessId id);

    // Arms a deadline; on expiry the process is killed with state TimedOut.
    core::errors::Status timeout(ProcessId id, std::chrono::milliseconds duration);

    // Kills every live process, overlapping their grace periods.
    void kill_all();

    // Kills and reaps everything and joins every monitor thread. Idempotent.
    void shutdown();

    core::errors::Result<ProcessSnapshot> snapshot(ProcessId id) const;
    std::vector<ProcessSnapshot> list() const;
    std::size_t live_count() const;

    // Forgets a terminal process.
    core::errors::Status release(ProcessId id);

    // Forgets every terminal process; returns how many were dropped.
    std::size_t release_finished();

private:
    struct Entry;

    void monitor(const std::shared_ptr<Entry>& entry);
    void publish(const std::shared_ptr<Entry>& entry, protocol::OutputStream stream,
                 std::string text);
    void wait_terminal(const std::vector<std::shared_ptr<Entry>>& entries,
                       std::chrono::milliseconds limit);
    ProcessSnapshot snapshot_locked(const Entry& entry) const;
    std::shared_ptr<Entry> find_locked(ProcessId id) const;

    SupervisorOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::unordered_map<ProcessId, std::shared_ptr<Entry>> processes_;
    ProcessId next_id_ = 1;
    bool shut_down_ = false;
};

}  // namespace forge::process

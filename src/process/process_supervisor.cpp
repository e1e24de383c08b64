#include "process/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace forge::process {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using Clock = std::chrono::steady_clock;

std::string to_string(const ProcessState state) {
    switch (state) {
        case ProcessState::Starting:
            return "starting";
        case ProcessState::Running:
            return "running";
        case ProcessState::Completed:
            return "completed";
        case ProcessState::Killed:
            return "killed";
        case ProcessState::TimedOut:
            return "timed_out";
        default:
            return "unknown";
    }
}

bool is_terminal(const ProcessState state) {
    return state == ProcessState::Completed || state == ProcessState::Killed ||
           state == ProcessState::TimedOut;
}

struct ProcessSupervisor::Entry {
    ProcessId id = 0;
    std::string command_line;
    pid_t pid = -1;
    bool interactive = false;
    OutputSink sink;

    // Guarded by ProcessSupervisor::mutex_.
    ProcessState state = ProcessState::Starting;
    std::optional<int> exit_code;
    std::string stdout_tail;
    std::string stderr_tail;
    bool kill_requested = false;
    ProcessState kill_reason = ProcessState::Killed;
    std::optional<Clock::time_point> deadline;

    // Guarded by input_mutex.
    std::mutex input_mutex;
    int stdin_fd = -1;

    // Owned by the monitor thread.
    int stdout_fd = -1;
    int stderr_fd = -1;

    std::thread monitor_thread;
};

namespace {

constexpr auto kDrainWindow = std::chrono::milliseconds(250);
constexpr auto kReapMargin = std::chrono::milliseconds(2000);
constexpr auto kInputWriteLimit = std::chrono::milliseconds(1000);

// now + duration, saturating at time_point::max() instead of overflowing.
Clock::time_point deadline_after(const std::chrono::milliseconds duration) {
    const auto now = Clock::now();
    if (duration.count() <= 0) {
        return now;
    }
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (duration >= headroom) {
        return Clock::time_point::max();
    }
    return now + duration;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

// Reads whatever is available; closes the fd on EOF or hard error.
void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void append_tail(std::string& tail, const std::string& text, const std::size_t limit) {
    tail += text;
    if (tail.size() > limit) {
        tail.erase(0, tail.size() - limit);
    }
}

std::string join_command_line(const SpawnRequest& request) {
    std::string line = request.program;
    for (const auto& arg : request.args) {
        line += " " + arg;
    }
    return line;
}

void ignore_sigpipe() {
    struct sigaction action {};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    static_cast<void>(sigaction(SIGPIPE, &action, nullptr));
}

ForgeError not_found(const ProcessId id) {
    return ForgeError{ErrorCategory::Execution,
                      "No managed process with id " + std::to_string(id),
                      "process_not_found"};
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options) : options_(options) {
    // Writes to an exited child's stdin must fail with EPIPE, not kill the engine.
    ignore_sigpipe();
}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

core::errors::Result<ProcessId> ProcessSupervisor::spawn(SpawnRequest request) {
    if (request.program.empty()) {
        return ForgeError{ErrorCategory::Validation, "Program cannot be empty.",
                          "empty_program"};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(request.cwd, ec) || ec) {
        return ForgeError{ErrorCategory::Execution,
                          "Working directory does not exist: " + request.cwd.string(),
                          "invalid_cwd"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return ForgeError{ErrorCategory::Execution, "Process supervisor is shut down.",
                              "supervisor_shut_down"};
        }
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};
    const auto close_all = [&]() {
        for (int* fds : {stdout_pipe, stderr_pipe, stdin_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };
    // O_CLOEXEC keeps concurrently spawned children from inheriting each other's pipes.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        (request.interactive && pipe2(stdin_pipe, O_CLOEXEC) != 0)) {
        close_all();
        return ForgeError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    // argv is built before fork so the child does not allocate.
    std::vector<char*> argv;
    argv.reserve(request.args.size() + 2);
    argv.push_back(const_cast<char*>(request.program.c_str()));
    for (auto& arg : request.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = request.cwd.string();

    const pid_t pid = fork();
    if (pid < 0) {
        close_all();
        return ForgeError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        if (request.interactive) {
            static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        } else {
            const int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                static_cast<void>(dup2(devnull, STDIN_FILENO));
            }
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Set from both sides so signals reach the group regardless of scheduling.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdin_pipe[0]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    if (stdin_pipe[1] >= 0) {
        set_nonblocking(stdin_pipe[1]);
    }

    auto entry = std::make_shared<Entry>();
    entry->command_line = join_command_line(request);
    entry->pid = pid;
    entry->interactive = request.interactive;
    entry->sink = std::move(request.sink);
    entry->stdin_fd = stdin_pipe[1];
    entry->stdout_fd = stdout_pipe[0];
    entry->stderr_fd = stderr_pipe[0];
    entry->state = ProcessState::Running;

    ProcessId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        entry->id = id;
        processes_.emplace(id, entry);
        entry->monitor_thread = std::thread([this, entry]() { monitor(entry); });
    }
    FORGE_LOG_INFO("Spawned process " + std::to_string(id) + " (pid " + std::to_string(pid) +
                   "): " + entry->command_line);
    return id;
}

void ProcessSupervisor::publish(const std::shared_ptr<Entry>& entry,
                                const protocol::OutputStream stream, std::string text) {
    if (text.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& tail = stream == protocol::OutputStream::Stdout ? entry->stdout_tail
                                                              : entry->stderr_tail;
        append_tail(tail, text, options_.tail_bytes);
    }
    if (entry->sink) {
        entry->sink(OutputChunk{entry->id, stream, std::move(text)});
    }
}

void ProcessSupervisor::monitor(const std::shared_ptr<Entry>& entry) {
    bool child_exited = false;
    int status = 0;
    std::optional<Clock::time_point> term_sent_at;
    std::optional<Clock::time_point> exited_at;
    bool kill_sent = false;
    bool signalled = false;
    ProcessState reason = ProcessState::Killed;

    while (true) {
        const auto now = Clock::now();
        bool want_kill = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!entry->kill_requested && entry->deadline && now >= *entry->deadline) {
                entry->kill_requested = true;
                entry->kill_reason = ProcessState::TimedOut;
            }
            want_kill = entry->kill_requested;
            reason = entry->kill_reason;
        }

        if (want_kill && !child_exited) {
            if (!term_sent_at) {
                FORGE_LOG_DEBUG("SIGTERM to process group " + std::to_string(entry->pid));
                static_cast<void>(::kill(-entry->pid, SIGTERM));
                term_sent_at = now;
                signalled = true;
            } else if (!kill_sent && now - *term_sent_at >= options_.kill_grace) {
                FORGE_LOG_WARN("Process " + std::to_string(entry->id) +
                               " ignored SIGTERM; sending SIGKILL");
                static_cast<void>(::kill(-entry->pid, SIGKILL));
                kill_sent = true;
            }
        }
        if (want_kill && child_exited && !kill_sent &&
            (entry->stdout_fd >= 0 || entry->stderr_fd >= 0)) {
            // Leader is gone but group members still hold the pipes.
            static_cast<void>(::kill(-entry->pid, SIGKILL));
            kill_sent = true;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (entry->stdout_fd >= 0) {
            fds[nfds].fd = entry->stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (entry->stderr_fd >= 0) {
            fds[nfds].fd = entry->stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds,
                               static_cast<int>(options_.poll_interval.count())));

        std::string out_text;
        std::string err_text;
        drain_pipe(entry->stdout_fd, out_text);
        drain_pipe(entry->stderr_fd, err_text);
        publish(entry, protocol::OutputStream::Stdout, std::move(out_text));
        publish(entry, protocol::OutputStream::Stderr, std::move(err_text));

        if (!child_exited) {
            const pid_t waited = waitpid(entry->pid, &status, WNOHANG);
            if (waited == entry->pid || (waited < 0 && errno == ECHILD)) {
                child_exited = true;
                exited_at = Clock::now();
            }
        }

        const bool pipes_closed = entry->stdout_fd < 0 && entry->stderr_fd < 0;
        if (child_exited && pipes_closed) {
            break;
        }
        if (child_exited && Clock::now() - *exited_at > kDrainWindow) {
            // Background descendants keep the pipes; stop reading them.
            close_fd(entry->stdout_fd);
            close_fd(entry->stderr_fd);
            break;
        }
    }

    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    }

    {
        std::lock_guard<std::mutex> input_lock(entry->input_mutex);
        close_fd(entry->stdin_fd);
    }
    ProcessState final_state = ProcessState::Completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        final_state = signalled ? reason : ProcessState::Completed;
        entry->state = final_state;
        entry->exit_code = exit_code;
    }
    state_cv_.notify_all();
    FORGE_LOG_INFO("Process " + std::to_string(entry->id) + " finished: " +
                   to_string(final_state) + " (exit " + std::to_string(exit_code) + ")");
}

core::errors::Status ProcessSupervisor::send_input(const ProcessId id, const std::string& bytes) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = find_locked(id);
        if (!entry) {
            return not_found(id);
        }
        if (!entry->interactive) {
            return ForgeError{ErrorCategory::Execution,
                              "Process " + std::to_string(id) + " was not started interactive",
                              "not_interactive"};
        }
        if (is_terminal(entry->state)) {
            return ForgeError{ErrorCategory::Execution,
                              "Process " + std::to_string(id) + " is no longer running",
                              "process_not_running"};
        }
    }

    std::lock_guard<std::mutex> input_lock(entry->input_mutex);
    if (entry->stdin_fd < 0) {
        return ForgeError{ErrorCategory::Execution,
                          "Process " + std::to_string(id) + " has no open input",
                          "process_not_running"};
    }
    const auto give_up_at = Clock::now() + kInputWriteLimit;
    std::size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t n = write(entry->stdin_fd, bytes.data() + written, bytes.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (Clock::now() >= give_up_at) {
                return ForgeError{ErrorCategory::Execution,
                                  "Process " + std::to_string(id) + " is not reading its input",
                                  "input_blocked"};
            }
            pollfd pfd{entry->stdin_fd, POLLOUT, 0};
            static_cast<void>(poll(&pfd, 1, 20));
            continue;
        }
        return ForgeError{ErrorCategory::Execution,
                          "Process " + std::to_string(id) + " closed its input",
                          "process_not_running"};
    }
    return core::errors::ok();
}

core::errors::Status ProcessSupervisor::close_input(const ProcessId id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = find_locked(id);
    }
    if (!entry) {
        return not_found(id);
    }
    std::lock_guard<std::mutex> input_lock(entry->input_mutex);
    close_fd(entry->stdin_fd);
    return core::errors::ok();
}

core::errors::Result<ProcessSnapshot> ProcessSupervisor::wait_for(
    const ProcessId id, const std::chrono::milliseconds timeout,
    const core::concurrency::CancelToken& cancel) {
    const auto deadline = deadline_after(timeout);
    std::unique_lock<std::mutex> lock(mutex_);
    const auto entry = find_locked(id);
    if (!entry) {
        return not_found(id);
    }
    while (!is_terminal(entry->state)) {
        if (core::concurrency::is_cancelled(cancel)) {
            break;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        const auto slice = std::min<Clock::duration>(deadline - now, options_.poll_interval);
        state_cv_.wait_for(lock, slice);
    }
    return snapshot_locked(*entry);
}

core::errors::Result<ProcessState> ProcessSupervisor::kill(const ProcessId id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = find_locked(id);
        if (!entry) {
            return not_found(id);
        }
        if (is_terminal(entry->state)) {
            return entry->state;
        }
        if (!entry->kill_requested) {
            entry->kill_requested = true;
            entry->kill_reason = ProcessState::Killed;
        }
    }
    FORGE_LOG_INFO("Killing process " + std::to_string(id));
    wait_terminal({entry}, options_.kill_grace + kReapMargin);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_terminal(entry->state)) {
        return ForgeError{ErrorCategory::Execution,
                          "Process " + std::to_string(id) + " did not exit after SIGKILL",
                          "kill_failed"};
    }
    return entry->state;
}

core::errors::Status ProcessSupervisor::timeout(const ProcessId id,
                                                const std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto entry = find_locked(id);
    if (!entry) {
        return not_found(id);
    }
    if (!is_terminal(entry->state)) {
        entry->deadline = deadline_after(duration);
    }
    return core::errors::ok();
}

void ProcessSupervisor::wait_terminal(const std::vector<std::shared_ptr<Entry>>& entries,
                                      const std::chrono::milliseconds limit) {
    std::unique_lock<std::mutex> lock(mutex_);
    static_cast<void>(state_cv_.wait_for(lock, limit, [&entries]() {
        for (const auto& entry : entries) {
            if (!is_terminal(entry->state)) {
                return false;
            }
        }
        return true;
    }));
}

void ProcessSupervisor::kill_all() {
    std::vector<std::shared_ptr<Entry>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& item : processes_) {
            auto& entry = item.second;
            if (is_terminal(entry->state)) {
                continue;
            }
            if (!entry->kill_requested) {
                entry->kill_requested = true;
                entry->kill_reason = ProcessState::Killed;
            }
            live.push_back(entry);
        }
    }
    if (live.empty()) {
        return;
    }
    FORGE_LOG_INFO("Killing " + std::to_string(live.size()) + " live process(es)");
    wait_terminal(live, options_.kill_grace + kReapMargin);
}

void ProcessSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }
    kill_all();

    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& item : processes_) {
            entries.push_back(item.second);
        }
        processes_.clear();
    }
    for (auto& entry : entries) {
        // Detached descendants of finished commands share the leader's group.
        if (::kill(-entry->pid, 0) == 0) {
            static_cast<void>(::kill(-entry->pid, SIGKILL));
        }
        if (entry->monitor_thread.joinable()) {
            entry->monitor_thread.join();
        }
    }
}

core::errors::Result<ProcessSnapshot> ProcessSupervisor::snapshot(const ProcessId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto entry = find_locked(id);
    if (!entry) {
        return not_found(id);
    }
    return snapshot_locked(*entry);
}

std::vector<ProcessSnapshot> ProcessSupervisor::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProcessSnapshot> out;
    out.reserve(processes_.size());
    for (const auto& item : processes_) {
        out.push_back(snapshot_locked(*item.second));
    }
    std::sort(out.begin(), out.end(),
              [](const ProcessSnapshot& a, const ProcessSnapshot& b) { return a.id < b.id; });
    return out;
}

std::size_t ProcessSupervisor::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& item : processes_) {
        if (!is_terminal(item.second->state)) {
            ++count;
        }
    }
    return count;
}

core::errors::Status ProcessSupervisor::release(const ProcessId id) {
    std::thread monitor_thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto entry = find_locked(id);
        if (!entry) {
            return not_found(id);
        }
        if (!is_terminal(entry->state)) {
            return ForgeError{ErrorCategory::Execution,
                              "Process " + std::to_string(id) + " is still running",
                              "process_running"};
        }
        monitor_thread = std::move(entry->monitor_thread);
        processes_.erase(id);
    }
    if (monitor_thread.joinable()) {
        monitor_thread.join();
    }
    return core::errors::ok();
}

std::size_t ProcessSupervisor::release_finished() {
    std::vector<std::thread> monitors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = processes_.begin(); it != processes_.end();) {
            if (!is_terminal(it->second->state)) {
                ++it;
                continue;
            }
            monitors.push_back(std::move(it->second->monitor_thread));
            it = processes_.erase(it);
        }
    }
    for (auto& monitor_thread : monitors) {
        if (monitor_thread.joinable()) {
            monitor_thread.join();
        }
    }
    return monitors.size();
}

ProcessSnapshot ProcessSupervisor::snapshot_locked(const Entry& entry) const {
    ProcessSnapshot snap;
    snap.id = entry.id;
    snap.command_line = entry.command_line;
    snap.state = entry.state;
    snap.exit_code = entry.exit_code;
    snap.stdout_tail = entry.stdout_tail;
    snap.stderr_tail = entry.stderr_tail;
    snap.interactive = entry.interactive;
    return snap;
}

std::shared_ptr<ProcessSupervisor::Entry> ProcessSupervisor::find_locked(
    const ProcessId id) const {
    const auto it = processes_.find(id);
    return it == processes_.end() ? nullptr : it->second;
}

}  // namespace forge::process

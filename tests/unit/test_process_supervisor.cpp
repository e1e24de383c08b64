#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <gtest/gtest.h>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"
#include "process/process_supervisor.hpp"

namespace {

using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::process::OutputChunk;
using forge::process::ProcessState;
using forge::process::ProcessSupervisor;
using forge::process::SpawnRequest;
using forge::process::SupervisorOptions;
using namespace std::chrono_literals;

SupervisorOptions fast_options() {
    SupervisorOptions options;
    options.kill_grace = 300ms;
    options.poll_interval = 20ms;
    return options;
}

SpawnRequest shell(const std::string& script, bool interactive = false) {
    SpawnRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", script};
    request.cwd = std::filesystem::current_path();
    request.interactive = interactive;
    return request;
}

TEST(ProcessSupervisorTest, CapturesOutputAndExitCode) {
    ProcessSupervisor supervisor(fast_options());
    std::mutex mutex;
    std::string streamed;
    auto request = shell("echo hello; echo oops 1>&2; exit 3");
    request.sink = [&](const OutputChunk& chunk) {
        std::lock_guard<std::mutex> lock(mutex);
        streamed += chunk.text;
    };

    auto spawned = supervisor.spawn(std::move(request));
    ASSERT_FALSE(is_error(spawned));
    auto waited = supervisor.wait_for(get_value(spawned), 5000ms);
    ASSERT_FALSE(is_error(waited));

    const auto& snap = get_value(waited);
    EXPECT_EQ(snap.state, ProcessState::Completed);
    ASSERT_TRUE(snap.exit_code.has_value());
    EXPECT_EQ(snap.exit_code.value(), 3);
    EXPECT_EQ(snap.stdout_tail, "hello\n");
    EXPECT_EQ(snap.stderr_tail, "oops\n");
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_NE(streamed.find("hello"), std::string::npos);
}

TEST(ProcessSupervisorTest, RejectsEmptyProgramAndMissingCwd) {
    ProcessSupervisor supervisor(fast_options());
    SpawnRequest empty;
    empty.cwd = std::filesystem::current_path();
    EXPECT_EQ(get_error(supervisor.spawn(empty)).code, "empty_program");

    auto missing = shell("true");
    missing.cwd = std::filesystem::current_path() / "__forge_missing_cwd__";
    EXPECT_EQ(get_error(supervisor.spawn(missing)).code, "invalid_cwd");
}

TEST(ProcessSupervisorTest, KillIsIdempotent) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("sleep 30"));
    ASSERT_FALSE(is_error(spawned));
    const auto id = get_value(spawned);
    EXPECT_EQ(supervisor.live_count(), 1u);

    auto first = supervisor.kill(id);
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first), ProcessState::Killed);

    auto second = supervisor.kill(id);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second), ProcessState::Killed);
    EXPECT_EQ(supervisor.live_count(), 0u);
}

TEST(ProcessSupervisorTest, TimeoutEndsInTimedOut) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("sleep 30"));
    ASSERT_FALSE(is_error(spawned));
    const auto id = get_value(spawned);
    ASSERT_FALSE(is_error(supervisor.timeout(id, 100ms)));

    auto waited = supervisor.wait_for(id, 5000ms);
    ASSERT_FALSE(is_error(waited));
    EXPECT_EQ(get_value(waited).state, ProcessState::TimedOut);
}

TEST(ProcessSupervisorTest, HugeDurationsDoNotOverflow) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("sleep 0.3; echo done"));
    ASSERT_FALSE(is_error(spawned));
    const auto id = get_value(spawned);
    ASSERT_FALSE(is_error(supervisor.timeout(id, std::chrono::milliseconds::max())));

    auto waited = supervisor.wait_for(id, std::chrono::milliseconds::max());
    ASSERT_FALSE(is_error(waited));
    EXPECT_EQ(get_value(waited).state, ProcessState::Completed);
    EXPECT_EQ(get_value(waited).stdout_tail, "done\n");
}

TEST(ProcessSupervisorTest, WaitForReturnsEarlyOnCancel) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("sleep 30"));
    ASSERT_FALSE(is_error(spawned));
    auto token = forge::core::concurrency::make_cancel_token();
    token->store(true);

    const auto started = std::chrono::steady_clock::now();
    auto waited = supervisor.wait_for(get_value(spawned), 10000ms, token);
    ASSERT_FALSE(is_error(waited));
    EXPECT_EQ(get_value(waited).state, ProcessState::Running);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);
}

TEST(ProcessSupervisorTest, InteractiveProcessReadsInput) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("read line; echo got:$line", true));
    ASSERT_FALSE(is_error(spawned));
    const auto id = get_value(spawned);

    ASSERT_FALSE(is_error(supervisor.send_input(id, "ping\n")));
    auto waited = supervisor.wait_for(id, 5000ms);
    ASSERT_FALSE(is_error(waited));
    EXPECT_EQ(get_value(waited).state, ProcessState::Completed);
    EXPECT_EQ(get_value(waited).stdout_tail, "got:ping\n");
}

TEST(ProcessSupervisorTest, InputToNonInteractiveProcessFails) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("sleep 30"));
    ASSERT_FALSE(is_error(spawned));
    auto sent = supervisor.send_input(get_value(spawned), "x\n");
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "not_interactive");
    EXPECT_EQ(get_error(supervisor.send_input(999, "x")).code, "process_not_found");
}

TEST(ProcessSupervisorTest, ReleaseRequiresTerminalState) {
    ProcessSupervisor supervisor(fast_options());
    auto spawned = supervisor.spawn(shell("sleep 30"));
    ASSERT_FALSE(is_error(spawned));
    const auto id = get_value(spawned);

    EXPECT_EQ(get_error(supervisor.release(id)).code, "process_running");
    ASSERT_FALSE(is_error(supervisor.kill(id)));
    EXPECT_FALSE(is_error(supervisor.release(id)));
    EXPECT_TRUE(supervisor.list().empty());
}

TEST(ProcessSupervisorTest, ReleaseFinishedKeepsLiveProcesses) {
    ProcessSupervisor supervisor(fast_options());
    auto quick = supervisor.spawn(shell("true"));
    auto slow = supervisor.spawn(shell("sleep 30"));
    ASSERT_FALSE(is_error(quick));
    ASSERT_FALSE(is_error(slow));
    auto waited = supervisor.wait_for(get_value(quick), 5000ms);
    ASSERT_FALSE(is_error(waited));
    ASSERT_EQ(get_value(waited).state, ProcessState::Completed);

    EXPECT_EQ(supervisor.release_finished(), 1u);
    ASSERT_EQ(supervisor.list().size(), 1u);
    EXPECT_EQ(supervisor.list()[0].id, get_value(slow));

    supervisor.kill_all();
    EXPECT_EQ(supervisor.release_finished(), 1u);
    EXPECT_TRUE(supervisor.list().empty());
}

TEST(ProcessSupervisorTest, ShutdownLeavesNothingLive) {
    ProcessSupervisor supervisor(fast_options());
    ASSERT_FALSE(is_error(supervisor.spawn(shell("sleep 30"))));
    ASSERT_FALSE(is_error(supervisor.spawn(shell("trap '' TERM; sleep 30"))));
    EXPECT_EQ(supervisor.live_count(), 2u);

    supervisor.shutdown();
    EXPECT_EQ(supervisor.live_count(), 0u);
    EXPECT_EQ(get_error(supervisor.spawn(shell("true"))).code, "supervisor_shut_down");
    supervisor.shutdown();
}

}  // namespace

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/concurrency/channel.hpp"
#include "core/config/id_gen.hpp"
#include "core/errors/forge_errors.hpp"
#include "process/process_supervisor.hpp"
#include "providers/replay_model_client.hpp"
#include "providers/retrying_model_client.hpp"
#include "runtime/task_engine.hpp"
#include "session/transcript_writer.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/dispatcher.hpp"
#include "tools/tool_registry.hpp"
#include "tools/workspace_locks.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::Result;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::protocol::AssistantMessage;
using forge::protocol::ControlEvent;
using forge::protocol::Notice;
using forge::protocol::PermissionMode;
using forge::protocol::TaskState;
using forge::protocol::ToolResult;
using forge::protocol::Turn;
using forge::runtime::EngineDependencies;
using forge::runtime::EngineOptions;
using forge::runtime::TaskEngine;
using nlohmann::json;
using namespace std::chrono_literals;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_task_engine_" + forge::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Mutating tool that only counts how often it ran.
class CountingHandler : public forge::tools::ToolHandler {
public:
    Result<ToolResult> invoke(const forge::tools::ToolContext& context,
                              const json&) override {
        ++invocations;
        return ToolResult::text(context.call_id, "poked");
    }

    std::atomic<int> invocations{0};
};

json tool_call(const std::string& id, const std::string& name, const json& arguments) {
    return {{"type", "tool_call"}, {"id", id}, {"name", name}, {"arguments", arguments}};
}

json text(const std::string& body) {
    return {{"type", "text"}, {"text", body}};
}

json completion() {
    return json::array({tool_call("done", "attempt_completion", {{"result", "All done"}})});
}

std::shared_ptr<forge::providers::ReplayModelClient> script(const std::vector<json>& responses) {
    std::string lines;
    for (const auto& response : responses) {
        lines += response.dump() + "\n";
    }
    auto parsed = forge::providers::ReplayModelClient::parse_script(lines);
    EXPECT_FALSE(is_error(parsed));
    return std::make_shared<forge::providers::ReplayModelClient>(get_value(parsed));
}

const ToolResult* find_result(const std::vector<Turn>& turns, const std::string& call_id) {
    for (const auto& turn : turns) {
        if (const auto* result = std::get_if<ToolResult>(&turn)) {
            if (result->call_id == call_id) {
                return result;
            }
        }
    }
    return nullptr;
}

class TaskEngineTest : public ::testing::Test {
protected:
    TaskEngineTest()
        : processes_(supervisor_options()),
          dispatcher_(registry_, locks_, &processes_, workspace_.root()) {}

    void SetUp() override {
        {
            std::ofstream out(workspace_.root() / "a.txt");
            out << "alpha";
        }
        forge::tools::BuiltinToolOptions builtin;
        builtin.commands.long_running_threshold = 200ms;
        ASSERT_FALSE(is_error(forge::tools::register_builtin_tools(registry_, builtin)));

        counting_ = std::make_shared<CountingHandler>();
        forge::tools::ToolDescriptor poke;
        poke.name = "poke";
        poke.risk_class = forge::protocol::RiskClass::Mutating;
        poke.handler = counting_;
        ASSERT_FALSE(is_error(registry_.register_tool(poke)));
    }

    static forge::process::SupervisorOptions supervisor_options() {
        forge::process::SupervisorOptions options;
        options.kill_grace = 300ms;
        options.poll_interval = 20ms;
        return options;
    }

    EngineDependencies deps(std::shared_ptr<forge::providers::ModelClient> model) {
        EngineDependencies deps;
        deps.model = std::move(model);
        deps.registry = &registry_;
        deps.dispatcher = &dispatcher_;
        deps.processes = &processes_;
        return deps;
    }

    static EngineOptions options(PermissionMode mode, std::uint32_t max_turns = 50) {
        EngineOptions options;
        options.permission_mode = mode;
        options.max_turns = max_turns;
        return options;
    }

    TempWorkspace workspace_;
    forge::tools::ToolRegistry registry_;
    forge::tools::WorkspaceLocks locks_;
    forge::process::ProcessSupervisor processes_;
    forge::tools::Dispatcher dispatcher_;
    std::shared_ptr<CountingHandler> counting_;
};

TEST_F(TaskEngineTest, RejectsEmptyInstructionAndDoubleStart) {
    TaskEngine engine(deps(script({completion()})), options(PermissionMode::ManualApproval));
    auto empty = engine.start_task("   ");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_instruction");
    EXPECT_EQ(engine.state(), TaskState::Idle);

    ASSERT_FALSE(is_error(engine.start_task("finish up")));
    auto again = engine.start_task("another");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
}

TEST_F(TaskEngineTest, DenyAllNeverInvokesMutatingHandler) {
    TaskEngine engine(deps(script({json::array({tool_call("c1", "poke", json::object())}),
                                   completion()})),
                      options(PermissionMode::DenyAll));
    ASSERT_FALSE(is_error(engine.start_task("poke it")));
    ASSERT_FALSE(is_error(engine.run_until_settled()));

    EXPECT_EQ(counting_->invocations.load(), 0);
    EXPECT_EQ(engine.state(), TaskState::Completed);
    const auto turns = engine.conversation().snapshot();
    const auto* denied = find_result(turns, "c1");
    ASSERT_NE(denied, nullptr);
    EXPECT_TRUE(denied->is_error);
    EXPECT_NE(denied->text_content().find("permission_denied"), std::string::npos);
}

TEST_F(TaskEngineTest, ManualApprovalRunsSafeToolsWithoutPausing) {
    TaskEngine engine(deps(script({json::array({tool_call("c1", "list_files", {{"path", "."}})})})),
                      options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("list files in workspace root")));
    ASSERT_FALSE(is_error(engine.step()));

    EXPECT_EQ(engine.state(), TaskState::Running);
    EXPECT_FALSE(engine.pending_approval().has_value());
    const auto listed_turns = engine.conversation().snapshot();
    const auto* listed = find_result(listed_turns, "c1");
    ASSERT_NE(listed, nullptr);
    EXPECT_FALSE(listed->is_error);
    EXPECT_EQ(listed->text_content(), "a.txt");
}

TEST_F(TaskEngineTest, RejectedDestructiveCommandNeverSpawns) {
    TaskEngine engine(
        deps(script({json::array({tool_call("c1", "execute_command", {{"command", "rm -rf ."}})})})),
        options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("clean up")));
    ASSERT_FALSE(is_error(engine.step()));

    ASSERT_EQ(engine.state(), TaskState::WaitingApproval);
    ASSERT_TRUE(engine.pending_approval().has_value());
    EXPECT_EQ(engine.pending_approval()->id, "c1");
    EXPECT_EQ(get_error(engine.step()).code, "task_not_running");

    ASSERT_FALSE(is_error(engine.reject("c1", "unsafe")));
    EXPECT_EQ(engine.state(), TaskState::Running);
    const auto rejected_turns = engine.conversation().snapshot();
    const auto* rejected = find_result(rejected_turns, "c1");
    ASSERT_NE(rejected, nullptr);
    EXPECT_TRUE(rejected->is_error);
    EXPECT_EQ(rejected->text_content(), "unsafe");
    EXPECT_TRUE(processes_.list().empty());
    EXPECT_TRUE(std::filesystem::exists(workspace_.root() / "a.txt"));
}

TEST_F(TaskEngineTest, ApprovalLaunchesTheCall) {
    TaskEngine engine(deps(script({json::array({tool_call(
                          "c1", "write_to_file", {{"path", "b.txt"}, {"content", "beta"}})})})),
                      options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("write b")));
    ASSERT_FALSE(is_error(engine.step()));
    ASSERT_EQ(engine.state(), TaskState::WaitingApproval);

    EXPECT_TRUE(is_error(engine.approve("other")));
    ASSERT_FALSE(is_error(engine.approve("c1")));
    EXPECT_EQ(engine.state(), TaskState::Running);
    EXPECT_TRUE(std::filesystem::exists(workspace_.root() / "b.txt"));
    EXPECT_TRUE(engine.conversation().is_settled());
}

TEST_F(TaskEngineTest, LongRunningCommandIsKilledOnCancel) {
    TaskEngine engine(deps(script({json::array({tool_call(
                          "c1", "execute_command", {{"command", "echo started; sleep 30"}})})})),
                      options(PermissionMode::FullAutonomous));
    ASSERT_FALSE(is_error(engine.start_task("start the server")));
    ASSERT_FALSE(is_error(engine.step()));

    const auto started_turns = engine.conversation().snapshot();
    const auto* started = find_result(started_turns, "c1");
    ASSERT_NE(started, nullptr);
    const auto payload = json::parse(started->text_content());
    EXPECT_TRUE(payload.at("exit_code").is_null());
    EXPECT_TRUE(payload.contains("managed_process_id"));
    EXPECT_EQ(processes_.live_count(), 1u);
    EXPECT_EQ(engine.state(), TaskState::Running);

    ASSERT_FALSE(is_error(engine.cancel()));
    EXPECT_EQ(engine.state(), TaskState::Cancelled);
    EXPECT_EQ(processes_.live_count(), 0u);
    EXPECT_TRUE(processes_.list().empty());
    EXPECT_EQ(get_error(engine.cancel()).code, "no_active_task");
}

TEST_F(TaskEngineTest, CompletedTaskCommandsDieWithTheEngine) {
    {
        TaskEngine engine(
            deps(script({json::array(
                {tool_call("c1", "execute_command",
                           {{"command", "while true; do echo tick; sleep 0.05; done"}}),
                 tool_call("done", "attempt_completion", {{"result", "Started the ticker"}})})})),
            options(PermissionMode::FullAutonomous));
        ASSERT_FALSE(is_error(engine.start_task("start a ticker and finish")));
        ASSERT_FALSE(is_error(engine.run_until_settled()));
        EXPECT_EQ(engine.state(), TaskState::Completed);
        EXPECT_EQ(processes_.live_count(), 1u);
    }
    EXPECT_EQ(processes_.live_count(), 0u);
    EXPECT_TRUE(processes_.list().empty());
}

TEST_F(TaskEngineTest, CancelResolvesEveryIssuedCall) {
    TaskEngine engine(
        deps(script({json::array({tool_call("c1", "list_files", {{"path", "."}}),
                                  tool_call("c2", "write_to_file", {{"path", "x"}, {"content", ""}}),
                                  tool_call("c3", "read_file", {{"path", "a.txt"}})})})),
        options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("do three things")));
    ASSERT_FALSE(is_error(engine.step()));
    ASSERT_EQ(engine.state(), TaskState::WaitingApproval);

    ASSERT_FALSE(is_error(engine.cancel()));
    EXPECT_EQ(engine.state(), TaskState::Cancelled);
    EXPECT_TRUE(engine.conversation().is_settled());
    EXPECT_FALSE(engine.pending_approval().has_value());

    const auto turns = engine.conversation().snapshot();
    EXPECT_NE(find_result(turns, "c1"), nullptr);
    ASSERT_NE(find_result(turns, "c2"), nullptr);
    EXPECT_EQ(find_result(turns, "c2")->text_content(), "Cancelled by operator");
    ASSERT_NE(find_result(turns, "c3"), nullptr);
    EXPECT_TRUE(find_result(turns, "c3")->is_error);
    EXPECT_FALSE(std::filesystem::exists(workspace_.root() / "x"));
}

TEST_F(TaskEngineTest, TransportFailureLeavesNoticeAndIdle) {
    const json failure = {{"type", "error"}, {"message", "connection reset"}};
    forge::core::config::RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_backoff_ms = 1;
    policy.max_backoff_ms = 2;
    auto model = std::make_shared<forge::providers::RetryingModelClient>(
        script({json::array({failure}), json::array({text("par"), failure})}), policy);

    TaskEngine engine(deps(model), options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("hello")));
    ASSERT_FALSE(is_error(engine.step()));

    EXPECT_EQ(engine.state(), TaskState::Idle);
    const auto turns = engine.conversation().snapshot();
    ASSERT_EQ(turns.size(), 3u);
    const auto* partial = std::get_if<AssistantMessage>(&turns[1]);
    ASSERT_NE(partial, nullptr);
    EXPECT_EQ(partial->text, "par");
    const auto* notice = std::get_if<Notice>(&turns[2]);
    ASSERT_NE(notice, nullptr);
    EXPECT_EQ(notice->category, ErrorCategory::Transport);
    EXPECT_NE(notice->message.find("connection reset"), std::string::npos);
}

TEST_F(TaskEngineTest, TurnBudgetExhaustionFailsTask) {
    const json listing = json::array({tool_call("c1", "list_files", {{"path", "."}})});
    const json listing_again = json::array({tool_call("c2", "list_files", {{"path", "."}})});
    TaskEngine engine(deps(script({listing, listing_again})),
                      options(PermissionMode::ManualApproval, 2));
    ASSERT_FALSE(is_error(engine.start_task("keep listing")));
    ASSERT_FALSE(is_error(engine.run_until_settled()));

    EXPECT_EQ(engine.state(), TaskState::Failed);
    ASSERT_TRUE(engine.failure_reason().has_value());
    EXPECT_EQ(engine.failure_reason().value(), "turn budget exhausted");
    const auto turns = engine.conversation().snapshot();
    EXPECT_NE(std::get_if<Notice>(&turns.back()), nullptr);
}

TEST_F(TaskEngineTest, CompletionSignalCompletesAndPersists) {
    auto engine_deps = deps(script({json::array({text("Finished."),
                                                 tool_call("done", "attempt_completion",
                                                           {{"result", "All done"}})})}));
    engine_deps.session_store =
        std::make_shared<forge::session::TranscriptWriter>(workspace_.root());
    TaskEngine engine(engine_deps, options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("wrap up")));
    ASSERT_FALSE(is_error(engine.run_until_settled()));

    EXPECT_EQ(engine.state(), TaskState::Completed);
    const auto transcript =
        workspace_.root() / ".forge_sessions" / (engine.task_id() + ".jsonl");
    ASSERT_TRUE(std::filesystem::exists(transcript));
    std::ifstream in(transcript);
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        last = line;
    }
    const auto event = json::parse(last);
    EXPECT_EQ(event.at("event"), "state");
    EXPECT_EQ(event.at("payload").at("state"), "completed");
}

TEST_F(TaskEngineTest, TextOnlyTurnReturnsToIdleAndStreamsDeltas) {
    TaskEngine engine(deps(script({json::array({text("Hello "), text("there")})})),
                      options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("greet me")));
    ASSERT_FALSE(is_error(engine.step()));
    EXPECT_EQ(engine.state(), TaskState::Idle);

    std::string streamed;
    while (auto event = engine.events().try_recv()) {
        if (const auto* delta = std::get_if<forge::protocol::TextDeltaEvent>(&*event)) {
            streamed += delta->delta_text;
        }
    }
    EXPECT_EQ(streamed, "Hello there");
}

TEST_F(TaskEngineTest, UnknownToolsAndBrokenArgumentsBecomeErrorResults) {
    const json response = json::array(
        {tool_call("c1", "nope", json::object()),
         {{"type", "tool_call_begin"}, {"id", "c2"}, {"name", "read_file"}},
         {{"type", "tool_args"}, {"text", "{\"path\":"}},
         {{"type", "tool_call_end"}}});
    TaskEngine engine(deps(script({response})), options(PermissionMode::FullAutonomous));
    ASSERT_FALSE(is_error(engine.start_task("try things")));
    ASSERT_FALSE(is_error(engine.step()));

    const auto turns = engine.conversation().snapshot();
    ASSERT_NE(find_result(turns, "c1"), nullptr);
    EXPECT_NE(find_result(turns, "c1")->text_content().find("unknown_tool"), std::string::npos);
    ASSERT_NE(find_result(turns, "c2"), nullptr);
    EXPECT_NE(find_result(turns, "c2")->text_content().find("malformed_arguments"),
              std::string::npos);
    EXPECT_EQ(engine.state(), TaskState::Running);
}

TEST_F(TaskEngineTest, ClashingCallIdsAreRenamed) {
    TaskEngine engine(deps(script({json::array({tool_call("c1", "list_files", {{"path", "."}}),
                                                tool_call("c1", "read_file", {{"path", "a.txt"}})})})),
                      options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("look around")));
    ASSERT_FALSE(is_error(engine.step()));

    EXPECT_TRUE(engine.conversation().is_settled());
    const auto turns = engine.conversation().snapshot();
    const auto* assistant = std::get_if<AssistantMessage>(&turns[1]);
    ASSERT_NE(assistant, nullptr);
    ASSERT_EQ(assistant->tool_calls.size(), 2u);
    EXPECT_EQ(assistant->tool_calls[0].id, "c1");
    EXPECT_NE(assistant->tool_calls[1].id, "c1");
    EXPECT_EQ(find_result(turns, assistant->tool_calls[1].id)->text_content(), "alpha");
}

TEST_F(TaskEngineTest, PauseBlocksSteppingUntilResume) {
    TaskEngine engine(deps(script({completion()})), options(PermissionMode::ManualApproval));
    ASSERT_FALSE(is_error(engine.start_task("finish")));
    ASSERT_FALSE(is_error(engine.pause()));
    EXPECT_EQ(engine.state(), TaskState::Paused);
    EXPECT_EQ(get_error(engine.step()).code, "task_not_running");

    ASSERT_FALSE(is_error(engine.resume()));
    ASSERT_FALSE(is_error(engine.run_until_settled()));
    EXPECT_EQ(engine.state(), TaskState::Completed);
}

TEST_F(TaskEngineTest, RunServesControlEventsUntilShutdown) {
    TaskEngine engine(deps(script({completion()})), options(PermissionMode::ManualApproval));
    forge::core::concurrency::Channel<ControlEvent> control;
    control.send(forge::protocol::SendMessageCommand{"finish the job"});
    control.send(forge::protocol::ShutdownCommand{});

    std::thread loop([&]() { engine.run(control); });
    loop.join();

    EXPECT_EQ(engine.state(), TaskState::Completed);
    bool saw_completed = false;
    while (auto event = engine.events().recv()) {
        if (const auto* changed = std::get_if<forge::protocol::TaskStateChangedEvent>(&*event)) {
            saw_completed = saw_completed || changed->state == TaskState::Completed;
        }
    }
    EXPECT_TRUE(saw_completed);
}

TEST_F(TaskEngineTest, ShutdownCancelsTaskWaitingForApproval) {
    TaskEngine engine(deps(script({json::array({tool_call("c1", "poke", json::object())})})),
                      options(PermissionMode::ManualApproval));
    forge::core::concurrency::Channel<ControlEvent> control;
    control.send(forge::protocol::SendMessageCommand{"poke it"});

    std::thread loop([&]() { engine.run(control); });
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (engine.state() != TaskState::WaitingApproval &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    control.send(forge::protocol::ShutdownCommand{});
    loop.join();

    EXPECT_EQ(engine.state(), TaskState::Cancelled);
    EXPECT_EQ(counting_->invocations.load(), 0);
    EXPECT_TRUE(engine.conversation().is_settled());
}

}  // namespace

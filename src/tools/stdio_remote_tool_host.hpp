#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "process/process_supervisor.hpp"
#include "protocol/remote_tool_contract.hpp"

namespace forge::tools {

struct StdioHostOptions {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path cwd;
    std::chrono::milliseconds request_timeout{30000};
};

// RemoteToolHost over newline-delimited JSON-RPC 2.0 on a child process's
// stdin/stdout. The child is owned by the supervisor like any command.
class StdioRemoteToolHost : public protocol::RemoteToolHost {
public:
    StdioRemoteToolHost(StdioHostOptions options, process::ProcessSupervisor& supervisor);
    ~StdioRemoteToolHost() override;

    StdioRemoteToolHost(const StdioRemoteToolHost&) = delete;
    StdioRemoteToolHost& operator=(const StdioRemoteToolHost&) = delete;

    const std::string& host_name() const override { return options_.name; }

    core::errors::Result<std::vector<protocol::RemoteToolDescriptor>> initialize() override;

    core::errors::Result<protocol::RemoteResponse> call(
        const protocol::RemoteRequest& request,
        const core::concurrency::CancelToken& cancel) override;

    // MCP resources/read.
    core::errors::Result<protocol::RemoteResponse> read_resource(
        const std::string& uri, const core::concurrency::CancelToken& cancel) override;

    void shutdown() override;

    // Replies received but not yet claimed by a waiting caller.
    std::size_t buffered_replies() const;

private:
    core::errors::Result<nlohmann::json> round_trip(const std::string& method,
                                                    const nlohmann::json& params,
                                                    const core::concurrency::CancelToken& cancel);
    core::errors::Status notify(const std::string& method, const nlohmann::json& params);
    core::errors::Status write_message(const nlohmann::json& message);
    void on_output(const process::OutputChunk& chunk);
    bool host_exited() const;

    StdioHostOptions options_;
    process::ProcessSupervisor& supervisor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string line_buffer_;
    std::map<std::int64_t, nlohmann::json> responses_;
    // Requests whose caller gave up; their late replies are dropped.
    std::set<std::int64_t> abandoned_;
    std::int64_t next_request_id_ = 1;
    std::optional<process::ProcessId> process_id_;
};

}  // namespace forge::tools

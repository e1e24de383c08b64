#include "tools/stdio_remote_tool_host.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

protocol::RemoteResponse to_remote_response(const json& message) {
    protocol::RemoteResponse response;
    if (message.contains("error") && message.at("error").is_object()) {
        const auto& error = message.at("error");
        protocol::RemoteError remote_error;
        remote_error.code = error.contains("code") && error.at("code").is_number_integer()
                                ? error.at("code").get<int>()
                                : -1;
        remote_error.message = error.value("message", std::string("unknown error"));
        response.error = remote_error;
    } else {
        response.result = message.contains("result") ? message.at("result") : json(nullptr);
    }
    return response;
}

}  // namespace

StdioRemoteToolHost::StdioRemoteToolHost(StdioHostOptions options,
                                         process::ProcessSupervisor& supervisor)
    : options_(std::move(options)), supervisor_(supervisor) {}

StdioRemoteToolHost::~StdioRemoteToolHost() {
    shutdown();
}

core::errors::Result<std::vector<protocol::RemoteToolDescriptor>>
StdioRemoteToolHost::initialize() {
    if (!process_id_) {
        process::SpawnRequest request;
        request.program = options_.command;
        request.args = options_.args;
        request.cwd = options_.cwd;
        request.interactive = true;
        request.sink = [this](const process::OutputChunk& chunk) { on_output(chunk); };
        auto spawned = supervisor_.spawn(std::move(request));
        if (core::errors::is_error(spawned)) {
            return core::errors::get_error(spawned);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        process_id_ = core::errors::get_value(spawned);
    }

    const json client_params = {{"protocolVersion", kProtocolVersion},
                                {"capabilities", json::object()},
                                {"clientInfo", {{"name", "forge"}, {"version", "0.1.0"}}}};
    auto handshake = round_trip("initialize", client_params, nullptr);
    if (core::errors::is_error(handshake)) {
        return core::errors::get_error(handshake);
    }
    if (core::errors::get_value(handshake).contains("error")) {
        return ForgeError{ErrorCategory::Transport,
                          options_.name + " rejected initialize: " +
                              core::errors::get_value(handshake).at("error").dump(),
                          "remote_handshake_failed"};
    }
    auto notified = notify("notifications/initialized", json::object());
    if (core::errors::is_error(notified)) {
        return core::errors::get_error(notified);
    }

    auto listed = round_trip("tools/list", json::object(), nullptr);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    const json& reply = core::errors::get_value(listed);
    if (!reply.contains("result") || !reply.at("result").is_object() ||
        !reply.at("result").contains("tools") || !reply.at("result").at("tools").is_array()) {
        return ForgeError{ErrorCategory::Transport,
                          options_.name + " returned a malformed tools/list reply",
                          "remote_protocol_error"};
    }

    std::vector<protocol::RemoteToolDescriptor> descriptors;
    for (const auto& tool : reply.at("result").at("tools")) {
        if (!tool.is_object() || !tool.contains("name") || !tool.at("name").is_string()) {
            FORGE_LOG_WARN(options_.name + " advertised a tool without a name; skipped");
            continue;
        }
        protocol::RemoteToolDescriptor descriptor;
        descriptor.name = tool.at("name").get<std::string>();
        if (tool.contains("description") && tool.at("description").is_string()) {
            descriptor.description = tool.at("description").get<std::string>();
        }
        if (tool.contains("inputSchema") && tool.at("inputSchema").is_object()) {
            descriptor.input_schema = tool.at("inputSchema");
        }
        descriptor.usage_hint = "Provided by " + options_.name + ".";
        descriptors.push_back(std::move(descriptor));
    }
    FORGE_LOG_INFO(options_.name + " advertised " + std::to_string(descriptors.size()) +
                   " tool(s)");
    return descriptors;
}

core::errors::Result<protocol::RemoteResponse> StdioRemoteToolHost::call(
    const protocol::RemoteRequest& request, const core::concurrency::CancelToken& cancel) {
    auto reply = round_trip("tools/call",
                            {{"name", request.method}, {"arguments", request.params}}, cancel);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return to_remote_response(core::errors::get_value(reply));
}

core::errors::Result<protocol::RemoteResponse> StdioRemoteToolHost::read_resource(
    const std::string& uri, const core::concurrency::CancelToken& cancel) {
    auto reply = round_trip("resources/read", {{"uri", uri}}, cancel);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return to_remote_response(core::errors::get_value(reply));
}

void StdioRemoteToolHost::shutdown() {
    std::optional<process::ProcessId> id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = process_id_;
        process_id_.reset();
        responses_.clear();
        abandoned_.clear();
    }
    cv_.notify_all();
    if (!id) {
        return;
    }
    // The sink captures this; the monitor thread must be gone before we are.
    auto killed = supervisor_.kill(*id);
    if (core::errors::is_error(killed)) {
        FORGE_LOG_WARN(core::errors::describe(core::errors::get_error(killed)));
    }
    auto released = supervisor_.release(*id);
    if (core::errors::is_error(released)) {
        FORGE_LOG_WARN(core::errors::describe(core::errors::get_error(released)));
    }
    FORGE_LOG_INFO("Remote tool host " + options_.name + " stopped");
}

core::errors::Result<json> StdioRemoteToolHost::round_trip(
    const std::string& method, const json& params,
    const core::concurrency::CancelToken& cancel) {
    std::int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_request_id_++;
    }
    auto written =
        write_message({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const auto it = responses_.find(id);
        if (it != responses_.end()) {
            json message = std::move(it->second);
            responses_.erase(it);
            return message;
        }
        if (!process_id_) {
            return ForgeError{ErrorCategory::Transport, options_.name + " was shut down",
                              "remote_host_closed"};
        }
        if (core::concurrency::is_cancelled(cancel)) {
            abandoned_.insert(id);
            return ForgeError{ErrorCategory::Execution, method + " cancelled", "cancelled"};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            abandoned_.insert(id);
            return ForgeError{ErrorCategory::Transport,
                              options_.name + " did not answer " + method + " in time",
                              "remote_timeout"};
        }
        lock.unlock();
        const bool exited = host_exited();
        lock.lock();
        if (exited && responses_.find(id) == responses_.end()) {
            return ForgeError{ErrorCategory::Transport,
                              options_.name + " exited before answering " + method,
                              "remote_host_exited"};
        }
        cv_.wait_for(lock, kWaitSlice);
    }
}

core::errors::Status StdioRemoteToolHost::notify(const std::string& method, const json& params) {
    return write_message({{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
}

core::errors::Status StdioRemoteToolHost::write_message(const json& message) {
    std::optional<process::ProcessId> id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = process_id_;
    }
    if (!id) {
        return ForgeError{ErrorCategory::Transport, options_.name + " is not running",
                          "remote_host_closed"};
    }
    auto sent = supervisor_.send_input(*id, message.dump() + "\n");
    if (core::errors::is_error(sent)) {
        const auto& error = core::errors::get_error(sent);
        return ForgeError{ErrorCategory::Transport,
                          options_.name + ": " + error.message, "remote_host_exited"};
    }
    return core::errors::ok();
}

void StdioRemoteToolHost::on_output(const process::OutputChunk& chunk) {
    if (chunk.stream == protocol::OutputStream::Stderr) {
        FORGE_LOG_DEBUG(options_.name + " stderr: " + chunk.text);
        return;
    }
    bool delivered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        line_buffer_ += chunk.text;
        std::size_t newline = 0;
        while ((newline = line_buffer_.find('\n')) != std::string::npos) {
            const std::string line = line_buffer_.substr(0, newline);
            line_buffer_.erase(0, newline + 1);
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            json message = json::parse(line, nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                FORGE_LOG_WARN(options_.name + " wrote a non-JSON line; ignored");
                continue;
            }
            if (!message.contains("id") || !message.at("id").is_number_integer() ||
                message.contains("method")) {
                // Notifications and server-initiated requests are not used.
                continue;
            }
            const auto reply_id = message.at("id").get<std::int64_t>();
            if (abandoned_.erase(reply_id) > 0) {
                FORGE_LOG_DEBUG(options_.name + " answered abandoned request " +
                                std::to_string(reply_id) + "; dropped");
                continue;
            }
            responses_[reply_id] = std::move(message);
            delivered = true;
        }
    }
    if (delivered) {
        cv_.notify_all();
    }
}

std::size_t StdioRemoteToolHost::buffered_replies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

bool StdioRemoteToolHost::host_exited() const {
    std::optional<process::ProcessId> id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = process_id_;
    }
    if (!id) {
        return true;
    }
    auto snapshot = supervisor_.snapshot(*id);
    return core::errors::is_error(snapshot) ||
           process::is_terminal(core::errors::get_value(snapshot).state);
}

}  // namespace forge::tools

#include "providers/replay_model_client.hpp"

#include <fstream>
#include <sstream>
#include <cstdint>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace forge::providers {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

ForgeError script_error(std::size_t line_no, const std::string& message) {
    return ForgeError{ErrorCategory::Input,
                      "Script line " + std::to_string(line_no) + ": " + message,
                      "invalid_script"};
}

std::string string_field(const json& chunk, const char* key) {
    if (chunk.contains(key) && chunk.at(key).is_string()) {
        return chunk.at(key).get<std::string>();
    }
    return "";
}

}  // namespace

ReplayModelClient::ReplayModelClient(std::vector<ScriptedResponse> responses,
                                     std::chrono::milliseconds chunk_delay)
    : responses_(std::move(responses)), chunk_delay_(chunk_delay) {}

core::errors::Result<std::vector<ScriptedResponse>> ReplayModelClient::parse_script(
    const std::string& text) {
    std::vector<ScriptedResponse> responses;
    std::istringstream lines(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(lines, line)) {
        ++line_no;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const json doc = json::parse(line, nullptr, false);
        if (doc.is_discarded() || !doc.is_array()) {
            return script_error(line_no, "expected a JSON array of chunks");
        }

        ScriptedResponse response;
        for (const auto& chunk : doc) {
            if (!chunk.is_object()) {
                return script_error(line_no, "chunks must be objects");
            }
            const std::string type = string_field(chunk, "type");
            if (type == "text") {
                response.chunks.emplace_back(protocol::TextChunk{string_field(chunk, "text")});
            } else if (type == "tool_call") {
                const std::string id = string_field(chunk, "id");
                const std::string name = string_field(chunk, "name");
                if (id.empty() || name.empty()) {
                    return script_error(line_no, "tool_call requires id and name");
                }
                const json arguments =
                    chunk.contains("arguments") ? chunk.at("arguments") : json::object();
                response.chunks.emplace_back(protocol::ToolCallBeginChunk{id, name});
                response.chunks.emplace_back(protocol::ToolArgsChunk{
                    arguments.is_string() ? arguments.get<std::string>() : arguments.dump()});
                response.chunks.emplace_back(protocol::ToolCallEndChunk{});
            } else if (type == "tool_call_begin") {
                response.chunks.emplace_back(protocol::ToolCallBeginChunk{
                    string_field(chunk, "id"), string_field(chunk, "name")});
            } else if (type == "tool_args") {
                response.chunks.emplace_back(protocol::ToolArgsChunk{string_field(chunk, "text")});
            } else if (type == "tool_call_end") {
                response.chunks.emplace_back(protocol::ToolCallEndChunk{});
            } else if (type == "stream_end") {
                protocol::StreamEndChunk end;
                if (chunk.contains("total_tokens") && chunk.at("total_tokens").is_number_unsigned()) {
                    end.total_tokens = chunk.at("total_tokens").get<std::uint32_t>();
                }
                response.chunks.emplace_back(end);
            } else if (type == "error") {
                response.failure = string_field(chunk, "message");
                if (response.failure.empty()) {
                    response.failure = "scripted transport failure";
                }
                break;
            } else {
                return script_error(line_no, "unknown chunk type '" + type + "'");
            }
        }
        responses.push_back(std::move(response));
    }
    return responses;
}

core::errors::Result<std::shared_ptr<ReplayModelClient>> ReplayModelClient::load(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Input, "Unable to open script: " + path.string(),
                          "script_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto parsed = parse_script(buffer.str());
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    auto responses = core::errors::take_value(std::move(parsed));
    FORGE_LOG_DEBUG("Loaded " + std::to_string(responses.size()) + " scripted response(s) from " +
                    path.string());
    return std::make_shared<ReplayModelClient>(std::move(responses));
}

core::errors::Status ReplayModelClient::stream(const protocol::ModelRequest& request,
                                               const ChunkSink& on_chunk,
                                               const core::concurrency::CancelToken& cancel) {
    ScriptedResponse response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (next_ >= responses_.size()) {
            return ForgeError{ErrorCategory::Input, "Model script has no more responses",
                              "script_exhausted"};
        }
        response = responses_[next_++];
    }

    for (const auto& chunk : response.chunks) {
        if (chunk_delay_.count() > 0 &&
            !core::concurrency::sleep_unless_cancelled(cancel, chunk_delay_)) {
            return ForgeError{ErrorCategory::Execution, "Model stream cancelled", "cancelled"};
        }
        if (core::concurrency::is_cancelled(cancel)) {
            return ForgeError{ErrorCategory::Execution, "Model stream cancelled", "cancelled"};
        }
        on_chunk(chunk);
    }
    if (!response.failure.empty()) {
        return ForgeError{ErrorCategory::Transport, response.failure, "stream_failed"};
    }
    return core::errors::ok();
}

std::vector<protocol::ModelRequest> ReplayModelClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t ReplayModelClient::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size() - next_;
}

}  // namespace forge::providers

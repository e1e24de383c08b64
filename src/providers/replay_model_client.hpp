#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "providers/model_client.hpp"

namespace forge::providers {

// One scripted step: chunks to deliver, then optionally a transport failure.
struct ScriptedResponse {
    std::vector<protocol::ModelChunk> chunks;
    std::string failure;  // non-empty: fail with this message after the chunks
};

// Plays back scripted responses, one per stream() call, in order.
//
// Script format is JSONL, one response per line, each an array of chunk
// objects:
//   {"type":"text","text":"..."}
//   {"type":"tool_call","id":"c1","name":"read_file","arguments":{...}}
//   {"type":"tool_call_begin","id":"c1","name":"..."}
//   {"type":"tool_args","text":"{\"pa"}
//   {"type":"tool_call_end"}
//   {"type":"stream_end","total_tokens":12}
//   {"type":"error","message":"connection reset"}
// Blank lines and lines starting with '#' are skipped.
class ReplayModelClient : public ModelClient {
public:
    explicit ReplayModelClient(std::vector<ScriptedResponse> responses,
                               std::chrono::milliseconds chunk_delay = std::chrono::milliseconds(0));

    static core::errors::Result<std::vector<ScriptedResponse>> parse_script(const std::string& text);
    static core::errors::Result<std::shared_ptr<ReplayModelClient>> load(
        const std::filesystem::path& path);

    core::errors::Status stream(const protocol::ModelRequest& request,
                                const ChunkSink& on_chunk,
                                const core::concurrency::CancelToken& cancel) override;

    std::vector<protocol::ModelRequest> requests() const;
    std::size_t remaining() const;

private:
    mutable std::mutex mutex_;
    std::vector<ScriptedResponse> responses_;
    std::size_t next_ = 0;
    std::chrono::milliseconds chunk_delay_;
    std::vector<protocol::ModelRequest> requests_;
};

}  // namespace forge::providers

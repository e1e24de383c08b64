#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/model_contract.hpp"

namespace forge::runtime {

enum class AccumulatorState {
    Idle,
    InText,
    InToolArgs
};

std::string to_string(AccumulatorState state);

// What one chunk produced.
struct FeedOutcome {
    std::optional<std::string> text_delta;
    std::optional<protocol::ToolCall> completed_call;
};

// Turns the chunks of one streamed response into assistant text and
// complete ToolCalls. A call whose argument text is not a JSON object is
// still produced, with argument_error set.
class StreamAccumulator {
public:
    core::errors::Result<FeedOutcome> feed(const protocol::ModelChunk& chunk);

    // Closes an unterminated call, if any. Returns it.
    std::optional<protocol::ToolCall> finish();

    AccumulatorState state() const { return state_; }
    const std::string& text() const { return text_; }
    const std::vector<protocol::ToolCall>& calls() const { return calls_; }
    bool ended() const { return ended_; }

private:
    protocol::ToolCall close_call();

    AccumulatorState state_ = AccumulatorState::Idle;
    std::string text_;
    std::vector<protocol::ToolCall> calls_;
    protocol::ToolCall open_call_;
    bool ended_ = false;
};

}  // namespace forge::runtime

#include "runtime/stream_accumulator.hpp"

#include <type_traits>
#include <variant>
#include <utility>
#include <nlohmann/json.hpp>

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

std::string to_string(const AccumulatorState state) {
    switch (state) {
        case AccumulatorState::Idle:
            return "idle";
        case AccumulatorState::InText:
            return "in_text";
        case AccumulatorState::InToolArgs:
            return "in_tool_args";
        default:
            return "unknown";
    }
}

namespace {

ForgeError malformed(const std::string& message) {
    return ForgeError{ErrorCategory::Transport, "Malformed model stream: " + message,
                      "malformed_stream"};
}

}  // namespace

core::errors::Result<FeedOutcome> StreamAccumulator::feed(const protocol::ModelChunk& chunk) {
    if (ended_) {
        return malformed("chunk after stream end");
    }
    FeedOutcome outcome;

    return std::visit(
        [&](const auto& piece) -> core::errors::Result<FeedOutcome> {
            using Chunk = std::decay_t<decltype(piece)>;
            if constexpr (std::is_same_v<Chunk, protocol::TextChunk>) {
                if (state_ == AccumulatorState::InToolArgs) {
                    return malformed("text inside a tool call");
                }
                state_ = AccumulatorState::InText;
                if (!piece.text.empty()) {
                    text_ += piece.text;
                    outcome.text_delta = piece.text;
                }
            } else if constexpr (std::is_same_v<Chunk, protocol::ToolCallBeginChunk>) {
                if (state_ == AccumulatorState::InToolArgs) {
                    return malformed("tool call '" + piece.name + "' began inside '" +
                                     open_call_.name + "'");
                }
                if (piece.name.empty()) {
                    return malformed("tool call without a name");
                }
                open_call_ = protocol::ToolCall{};
                open_call_.id = piece.id;
                open_call_.name = piece.name;
                state_ = AccumulatorState::InToolArgs;
            } else if constexpr (std::is_same_v<Chunk, protocol::ToolArgsChunk>) {
                if (state_ != AccumulatorState::InToolArgs) {
                    return malformed("tool arguments outside a tool call");
                }
                open_call_.raw_arguments += piece.text;
            } else if constexpr (std::is_same_v<Chunk, protocol::ToolCallEndChunk>) {
                if (state_ != AccumulatorState::InToolArgs) {
                    return malformed("tool call end without a begin");
                }
                outcome.completed_call = close_call();
            } else if constexpr (std::is_same_v<Chunk, protocol::StreamEndChunk>) {
                if (state_ == AccumulatorState::InToolArgs) {
                    outcome.completed_call = close_call();
                    outcome.completed_call->argument_error =
                        "Tool call arguments were cut off by the end of the stream";
                    calls_.back().argument_error = outcome.completed_call->argument_error;
                }
                ended_ = true;
                state_ = AccumulatorState::Idle;
            }
            return outcome;
        },
        chunk);
}

std::optional<protocol::ToolCall> StreamAccumulator::finish() {
    if (state_ != AccumulatorState::InToolArgs) {
        state_ = AccumulatorState::Idle;
        return std::nullopt;
    }
    protocol::ToolCall call = close_call();
    call.argument_error = "Tool call arguments were cut off by the end of the stream";
    calls_.back().argument_error = call.argument_error;
    return call;
}

protocol::ToolCall StreamAccumulator::close_call() {
    protocol::ToolCall call = std::move(open_call_);
    open_call_ = protocol::ToolCall{};

    const auto first = call.raw_arguments.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        call.arguments = nlohmann::json::object();
    } else {
        nlohmann::json parsed = nlohmann::json::parse(call.raw_arguments, nullptr, false);
        if (parsed.is_discarded()) {
            call.argument_error = "Arguments are not valid JSON";
        } else if (!parsed.is_object()) {
            call.argument_error = "Arguments must be a JSON object";
        } else {
            call.arguments = std::move(parsed);
        }
    }

    calls_.push_back(call);
    state_ = AccumulatorState::Idle;
    return call;
}

}  // namespace forge::runtime

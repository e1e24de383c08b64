#include <gtest/gtest.h>
#include "core/errors/forge_errors.hpp"
#include "runtime/stream_accumulator.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::protocol::StreamEndChunk;
using forge::protocol::TextChunk;
using forge::protocol::ToolArgsChunk;
using forge::protocol::ToolCallBeginChunk;
using forge::protocol::ToolCallEndChunk;
using forge::runtime::AccumulatorState;
using forge::runtime::StreamAccumulator;

TEST(StreamAccumulatorTest, CollectsTextAndCalls) {
    StreamAccumulator acc;
    auto first = acc.feed(TextChunk{"Let me "});
    ASSERT_FALSE(is_error(first));
    ASSERT_TRUE(get_value(first).text_delta.has_value());
    EXPECT_EQ(get_value(first).text_delta.value(), "Let me ");
    ASSERT_FALSE(is_error(acc.feed(TextChunk{"check."})));
    EXPECT_EQ(acc.state(), AccumulatorState::InText);

    ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c1", "read_file"})));
    EXPECT_EQ(acc.state(), AccumulatorState::InToolArgs);
    ASSERT_FALSE(is_error(acc.feed(ToolArgsChunk{"{\"path\":"})));
    ASSERT_FALSE(is_error(acc.feed(ToolArgsChunk{"\"a.txt\"}"})));
    auto closed = acc.feed(ToolCallEndChunk{});
    ASSERT_FALSE(is_error(closed));
    ASSERT_TRUE(get_value(closed).completed_call.has_value());
    const auto& call = get_value(closed).completed_call.value();
    EXPECT_EQ(call.id, "c1");
    EXPECT_EQ(call.arguments.at("path"), "a.txt");
    EXPECT_EQ(call.raw_arguments, "{\"path\":\"a.txt\"}");
    EXPECT_FALSE(call.argument_error.has_value());

    ASSERT_FALSE(is_error(acc.feed(StreamEndChunk{12})));
    EXPECT_TRUE(acc.ended());
    EXPECT_EQ(acc.text(), "Let me check.");
    EXPECT_EQ(acc.calls().size(), 1u);
}

TEST(StreamAccumulatorTest, EmptyArgumentsBecomeEmptyObject) {
    StreamAccumulator acc;
    ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c1", "list_files"})));
    auto closed = acc.feed(ToolCallEndChunk{});
    ASSERT_FALSE(is_error(closed));
    const auto& call = get_value(closed).completed_call.value();
    EXPECT_TRUE(call.arguments.is_object());
    EXPECT_TRUE(call.arguments.empty());
    EXPECT_FALSE(call.argument_error.has_value());
}

TEST(StreamAccumulatorTest, BadArgumentsAreFlaggedNotDropped) {
    StreamAccumulator acc;
    ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c1", "read_file"})));
    ASSERT_FALSE(is_error(acc.feed(ToolArgsChunk{"{\"path\": "})));
    auto broken = acc.feed(ToolCallEndChunk{});
    ASSERT_FALSE(is_error(broken));
    EXPECT_EQ(get_value(broken).completed_call->argument_error.value(),
              "Arguments are not valid JSON");

    ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c2", "read_file"})));
    ASSERT_FALSE(is_error(acc.feed(ToolArgsChunk{"[1, 2]"})));
    auto array = acc.feed(ToolCallEndChunk{});
    ASSERT_FALSE(is_error(array));
    EXPECT_EQ(get_value(array).completed_call->argument_error.value(),
              "Arguments must be a JSON object");
    EXPECT_EQ(acc.calls().size(), 2u);
}

TEST(StreamAccumulatorTest, StreamEndClosesOpenCallAsCutOff) {
    StreamAccumulator acc;
    ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c1", "write_to_file"})));
    ASSERT_FALSE(is_error(acc.feed(ToolArgsChunk{"{\"path\": \"a"})));
    auto ended = acc.feed(StreamEndChunk{});
    ASSERT_FALSE(is_error(ended));
    ASSERT_TRUE(get_value(ended).completed_call.has_value());
    EXPECT_TRUE(get_value(ended).completed_call->argument_error.has_value());
    ASSERT_EQ(acc.calls().size(), 1u);
    EXPECT_TRUE(acc.calls()[0].argument_error.has_value());
}

TEST(StreamAccumulatorTest, FinishClosesUnterminatedCall) {
    StreamAccumulator acc;
    EXPECT_FALSE(acc.finish().has_value());
    ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c1", "read_file"})));
    auto call = acc.finish();
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->id, "c1");
    EXPECT_TRUE(call->argument_error.has_value());
    EXPECT_EQ(acc.state(), AccumulatorState::Idle);
}

TEST(StreamAccumulatorTest, RejectsMalformedSequences) {
    {
        StreamAccumulator acc;
        auto status = acc.feed(ToolArgsChunk{"{}"});
        ASSERT_TRUE(is_error(status));
        EXPECT_EQ(get_error(status).category, ErrorCategory::Transport);
        EXPECT_EQ(get_error(status).code, "malformed_stream");
    }
    {
        StreamAccumulator acc;
        EXPECT_TRUE(is_error(acc.feed(ToolCallEndChunk{})));
    }
    {
        StreamAccumulator acc;
        ASSERT_FALSE(is_error(acc.feed(ToolCallBeginChunk{"c1", "read_file"})));
        EXPECT_TRUE(is_error(acc.feed(TextChunk{"oops"})));
        EXPECT_TRUE(is_error(acc.feed(ToolCallBeginChunk{"c2", "list_files"})));
    }
    {
        StreamAccumulator acc;
        EXPECT_TRUE(is_error(acc.feed(ToolCallBeginChunk{"c1", ""})));
    }
    {
        StreamAccumulator acc;
        ASSERT_FALSE(is_error(acc.feed(StreamEndChunk{})));
        EXPECT_TRUE(is_error(acc.feed(TextChunk{"late"})));
    }
}

}  // namespace

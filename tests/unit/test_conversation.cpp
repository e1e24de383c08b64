#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/forge_errors.hpp"
#include "session/conversation.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::is_error;
using forge::protocol::AssistantMessage;
using forge::protocol::Notice;
using forge::protocol::ToolCall;
using forge::protocol::ToolResult;
using forge::protocol::UserMessage;
using forge::session::Conversation;

AssistantMessage with_calls(const std::vector<std::string>& ids) {
    AssistantMessage message;
    message.text = "working";
    for (const auto& id : ids) {
        ToolCall call;
        call.id = id;
        call.name = "read_file";
        message.tool_calls.push_back(call);
    }
    return message;
}

TEST(ConversationTest, TracksUnresolvedCallsInOrder) {
    Conversation conversation;
    ASSERT_FALSE(is_error(conversation.append(UserMessage{"fix the bug"})));
    ASSERT_FALSE(is_error(conversation.append(with_calls({"c1", "c2", "c3"}))));
    EXPECT_FALSE(conversation.is_settled());

    ASSERT_FALSE(is_error(conversation.append(ToolResult::text("c2", "ok"))));
    const auto pending = conversation.unresolved_calls();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0], "c1");
    EXPECT_EQ(pending[1], "c3");

    ASSERT_FALSE(is_error(conversation.append(ToolResult::text("c1", "ok"))));
    ASSERT_FALSE(is_error(conversation.append(ToolResult::text("c3", "ok"))));
    EXPECT_TRUE(conversation.is_settled());
    EXPECT_EQ(conversation.size(), 5u);
    EXPECT_TRUE(conversation.has_call("c2"));
    EXPECT_FALSE(conversation.has_call("c9"));
}

TEST(ConversationTest, RejectsResultForUnknownOrAnsweredCall) {
    Conversation conversation;
    auto orphan = conversation.append(ToolResult::text("ghost", "?"));
    ASSERT_TRUE(is_error(orphan));
    EXPECT_EQ(get_error(orphan).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(orphan).code, "conversation_invariant");

    ASSERT_FALSE(is_error(conversation.append(with_calls({"c1"}))));
    ASSERT_FALSE(is_error(conversation.append(ToolResult::text("c1", "first"))));
    EXPECT_EQ(get_error(conversation.append(ToolResult::text("c1", "again"))).code,
              "conversation_invariant");
    EXPECT_EQ(conversation.size(), 2u);
}

TEST(ConversationTest, RejectsMissingAndReusedCallIds) {
    Conversation conversation;
    EXPECT_TRUE(is_error(conversation.append(with_calls({""}))));
    EXPECT_TRUE(is_error(conversation.append(with_calls({"c1", "c1"}))));
    ASSERT_FALSE(is_error(conversation.append(with_calls({"c1"}))));
    EXPECT_TRUE(is_error(conversation.append(with_calls({"c1"}))));
    EXPECT_EQ(conversation.unresolved_calls().size(), 1u);
}

TEST(ConversationTest, NoticesDoNotAffectCalls) {
    Conversation conversation;
    ASSERT_FALSE(is_error(conversation.append(Notice{ErrorCategory::Transport, "stream dropped"})));
    EXPECT_TRUE(conversation.is_settled());
    const auto turns = conversation.snapshot();
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(forge::protocol::turn_kind(turns[0]), "notice");
}

}  // namespace

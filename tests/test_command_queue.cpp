/**
 * @file test_command_queue.cpp
 * @brief Unit tests for the one-in-flight FIFO used on the rigctld link
 */

#include "rigd/adapter/command_queue.hpp"
#include "rigd/adapter/rigctld_protocol.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using rigd::adapter::CommandQueue;
using rigd::adapter::CommandRequest;
using rigd::core::CommandResult;
using rigd::core::ErrorCode;

namespace {

struct Reply {
    ErrorCode code;
    std::string text;
};

class CommandQueueTest : public ::testing::Test {
   protected:
    std::vector<std::string> written;
    std::vector<Reply> replies;
    CommandQueue queue{[this](const std::string& command) { written.push_back(command); },
                       [](const std::string& line) {
                           return rigd::adapter::rigctld::parseReplyCode(line).has_value();
                       }};

    CommandRequest request(const std::string& command, std::size_t lines = 1) {
        CommandRequest r;
        r.command = command;
        r.responseLines = lines;
        r.handler = [this](const CommandResult& result, const std::string& text) {
            replies.push_back({result.code, text});
        };
        return r;
    }
};

}  // namespace

TEST_F(CommandQueueTest, EnqueueWhileLinkDownFailsImmediately) {
    queue.enqueue(request("f"));

    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].code, ErrorCode::NotConnected);
    EXPECT_TRUE(written.empty());
}

TEST_F(CommandQueueTest, OnlyOneCommandIsInFlight) {
    queue.setLinkUp(true);
    queue.enqueue(request("f"));
    queue.enqueue(request("t"));
    queue.enqueue(request("F 7074000"));

    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0], "f");
    EXPECT_TRUE(queue.hasPending());
    EXPECT_EQ(queue.queued(), 2u);
}

TEST_F(CommandQueueTest, ResponsesResolveInFifoOrder) {
    queue.setLinkUp(true);
    queue.enqueue(request("f"));
    queue.enqueue(request("t"));
    queue.enqueue(request("F 7074000"));

    EXPECT_TRUE(queue.onResponse("14074000"));
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[1], "t");

    EXPECT_TRUE(queue.onResponse("0"));
    ASSERT_EQ(written.size(), 3u);
    EXPECT_EQ(written[2], "F 7074000");

    EXPECT_TRUE(queue.onResponse("RPRT 0"));

    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[0].text, "14074000");
    EXPECT_EQ(replies[1].text, "0");
    EXPECT_EQ(replies[2].text, "RPRT 0");
    EXPECT_FALSE(queue.hasPending());
}

TEST_F(CommandQueueTest, MultiLineResponseIsJoined) {
    queue.setLinkUp(true);
    queue.enqueue(request("m", 2));

    EXPECT_TRUE(queue.onResponse("USB"));
    EXPECT_TRUE(replies.empty());
    EXPECT_TRUE(queue.onResponse("2400"));

    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].code, ErrorCode::Ok);
    EXPECT_EQ(replies[0].text, "USB 2400");
}

TEST_F(CommandQueueTest, ErrorReplyEndsMultiLineResponseEarly) {
    queue.setLinkUp(true);
    queue.enqueue(request("m", 2));
    queue.enqueue(request("f"));

    EXPECT_TRUE(queue.onResponse("RPRT -11"));

    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].text, "RPRT -11");
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[1], "f");
}

TEST_F(CommandQueueTest, UnsolicitedLineIsRejected) {
    queue.setLinkUp(true);
    EXPECT_FALSE(queue.onResponse("14074000"));
    EXPECT_TRUE(replies.empty());
}

TEST_F(CommandQueueTest, LinkLossFailsPendingAndQueued) {
    queue.setLinkUp(true);
    queue.enqueue(request("m", 2));
    queue.enqueue(request("f"));
    queue.onResponse("USB");

    queue.setLinkUp(false);

    ASSERT_EQ(replies.size(), 2u);
    for (const auto& reply : replies) {
        EXPECT_EQ(reply.code, ErrorCode::NotConnected);
    }
    EXPECT_FALSE(queue.hasPending());
    EXPECT_EQ(queue.queued(), 0u);

    // The half-received reply is gone after reconnecting.
    queue.setLinkUp(true);
    queue.enqueue(request("m", 2));
    queue.onResponse("CW");
    queue.onResponse("500");
    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[2].text, "CW 500");
}

TEST_F(CommandQueueTest, LinkLossReasonIsPropagated) {
    queue.setLinkUp(true);
    queue.enqueue(request("f"));

    queue.setLinkUp(false, {ErrorCode::Timeout, "command timeout"});

    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].code, ErrorCode::Timeout);
}

TEST_F(CommandQueueTest, HandlerMayEnqueueFollowUp) {
    queue.setLinkUp(true);
    CommandRequest first = request("f");
    first.handler = [this](const CommandResult&, const std::string&) { queue.enqueue(request("t")); };
    queue.enqueue(std::move(first));

    queue.onResponse("14074000");

    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[1], "t");
    EXPECT_TRUE(queue.hasPending());
}

/**
 * @file test_history_sync.cpp
 * @brief MessageLog ordering and the history request/response exchange.
 */
#include "zone_test_harness.h"

#include <algorithm>

using namespace zonechat::tests;
using namespace ::testing;

namespace
{
std::vector<std::string> ids_of(const MessageLog &log)
{
    std::vector<std::string> out;
    for (const auto &m : log.messages())
        out.push_back(m.id);
    return out;
}
} // namespace

// ============================================================================
// MessageLog
// ============================================================================

TEST(MessageLogTest, OrdersByTimestamp)
{
    MessageLog log;
    EXPECT_TRUE(log.append(make_text("c", "A", 30)));
    EXPECT_TRUE(log.append(make_text("a", "A", 10)));
    EXPECT_TRUE(log.append(make_text("b", "A", 20)));
    EXPECT_THAT(ids_of(log), ElementsAre("a", "b", "c"));
}

// Equal timestamps keep arrival order.
TEST(MessageLogTest, EqualTimestampsAreStable)
{
    MessageLog log;
    log.append(make_text("x", "A", 10));
    log.append(make_text("y", "B", 10));
    log.append(make_text("z", "C", 10));
    log.append(make_text("early", "C", 5));
    EXPECT_THAT(ids_of(log), ElementsAre("early", "x", "y", "z"));
}

TEST(MessageLogTest, AppendIsIdempotentById)
{
    MessageLog log;
    EXPECT_TRUE(log.append(make_text("a", "A", 10, "first")));
    EXPECT_FALSE(log.append(make_text("a", "A", 99, "second")));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(*log.messages()[0].text, "first");
    EXPECT_TRUE(log.contains("a"));
    log.clear();
    EXPECT_TRUE(log.empty());
    EXPECT_FALSE(log.contains("a"));
}

// Any permutation of the same distinct messages yields the same log.
TEST(MessageLogTest, MergeIsOrderIndependent)
{
    std::vector<ChatMessage> msgs{make_text("m1", "A", 1), make_text("m2", "B", 2),
                                  make_text("m3", "A", 3), make_text("m4", "C", 4)};
    std::sort(msgs.begin(), msgs.end(),
              [](const ChatMessage &a, const ChatMessage &b) { return a.id < b.id; });
    do
    {
        MessageLog log;
        EXPECT_EQ(log.merge(msgs), 4u);
        EXPECT_THAT(ids_of(log), ElementsAre("m1", "m2", "m3", "m4"));
    } while (std::next_permutation(
        msgs.begin(), msgs.end(),
        [](const ChatMessage &a, const ChatMessage &b) { return a.id < b.id; }));
}

TEST(MessageLogTest, MergeCountsOnlyNewMessages)
{
    MessageLog log;
    log.append(make_text("m1", "A", 1));
    log.append(make_text("m2", "A", 2));
    EXPECT_EQ(log.merge({make_text("m2", "A", 2), make_text("m3", "B", 3)}), 1u);
    EXPECT_EQ(log.merge({make_text("m1", "A", 1)}), 0u);
    EXPECT_EQ(log.size(), 3u);
}

// ============================================================================
// HistorySynchronizer
// ============================================================================

TEST(HistorySynchronizerTest, RequestCarriesOurFingerprint)
{
    MessageLog log;
    HistorySynchronizer sync("me", log);
    const Envelope req = sync.make_request();
    EXPECT_EQ(req.from, "me");
    EXPECT_NE(req.as<HistoryRequest>(), nullptr);
    EXPECT_FALSE(req.to.has_value());
}

TEST(HistorySynchronizerTest, AnswersOthersWithWholeLogAddressedToThem)
{
    MessageLog log;
    log.append(make_text("m1", "A", 1));
    log.append(make_text("m2", "A", 2));
    HistorySynchronizer sync("me", log);

    auto reply = sync.on_request(Envelope{"peer", std::nullopt, HistoryRequest{}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->from, "me");
    ASSERT_TRUE(reply->to.has_value());
    EXPECT_EQ(*reply->to, "peer");
    const auto *res = reply->as<HistoryResponse>();
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(res->messages.size(), 2u);
}

TEST(HistorySynchronizerTest, IgnoresOwnRequestAndEmptyLog)
{
    MessageLog log;
    HistorySynchronizer sync("me", log);
    EXPECT_FALSE(sync.on_request(Envelope{"peer", std::nullopt, HistoryRequest{}}).has_value());
    log.append(make_text("m1", "A", 1));
    EXPECT_FALSE(sync.on_request(Envelope{"me", std::nullopt, HistoryRequest{}}).has_value());
}

TEST(HistorySynchronizerTest, MergesOnlyResponsesAddressedToUs)
{
    MessageLog log;
    HistorySynchronizer sync("me", log);
    const HistoryResponse payload{{make_text("m2", "B", 2), make_text("m1", "A", 1)}};

    EXPECT_EQ(sync.on_response(Envelope{"peer", std::string("someone-else"), payload}), 0u);
    EXPECT_EQ(sync.on_response(Envelope{"peer", std::nullopt, payload}), 0u);
    EXPECT_TRUE(log.empty());

    EXPECT_EQ(sync.on_response(Envelope{"peer", std::string("me"), payload}), 2u);
    EXPECT_THAT(ids_of(log), ElementsAre("m1", "m2"));
    // A second peer answering with the same log adds nothing.
    EXPECT_EQ(sync.on_response(Envelope{"peer2", std::string("me"), payload}), 0u);
}

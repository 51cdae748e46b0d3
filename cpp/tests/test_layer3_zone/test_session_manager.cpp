/**
 * @file test_session_manager.cpp
 * @brief SessionManager against a scripted transport: every envelope it sends
 *        is recorded and every inbound frame is injected by the test.
 */
#include "zone_test_harness.h"

using namespace zonechat::tests;
using namespace ::testing;

namespace
{

const GeoPoint kHere{10.0, 10.0};
const std::string kDiscovery = discovery_topic(kDefaultTopicPrefix);

class MockModerator : public ContentModerator
{
  public:
    MOCK_METHOD(ModerationVerdict, moderate, (std::string_view text), (override));
};

class SessionManagerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        transport.connect();
        make_session(&position);
    }

    void make_session(PositionProvider *provider, ContentModerator *moderator = nullptr)
    {
        session.reset();
        session = std::make_unique<SessionManager>(loop, transport,
                                                   ClientIdentity{"fp_self", "me", "#00ff88"},
                                                   test_config(), provider, moderator);
        SessionCallbacks cb;
        cb.on_state_changed = [this](SessionState s) { states.push_back(s); };
        cb.on_message = [this](const ChatMessage &m) { delivered.push_back(m.id); };
        cb.on_history_merged = [this](size_t n) { merged += n; };
        cb.on_typing_changed = [this](const std::vector<std::string> &h) { typing = h; };
        cb.on_member_count = [this](int n) { counts.push_back(n); };
        cb.on_expiry_warning = [this](int64_t left) { warnings.push_back(left); };
        cb.on_expired = [this](const Zone &z) { expired.push_back(z.id); };
        session->set_callbacks(std::move(cb));
        session->start();
        drain(loop);
        transport.published.clear();
        transport.wire_ops.clear();
        states.clear();
    }

    /// Joins a foreign zone centred here and drains.
    Zone join(const std::string &id, int64_t expires_at = kT0 + kHourMs)
    {
        const Zone z = make_zone(id, kHere, expires_at);
        auto r = session->join_zone(z);
        EXPECT_TRUE(r.is_ok());
        drain(loop);
        return z;
    }

    /// Kinds published on @p topic, in order.
    std::vector<std::string> kinds_on(const std::string &topic) const
    {
        std::vector<std::string> out;
        for (const auto &[t, env] : transport.published)
        {
            if (t == topic)
                out.push_back(env.kind());
        }
        return out;
    }

    std::vector<std::string> log_texts() const
    {
        std::vector<std::string> out;
        for (const auto &m : session->messages())
        {
            if (m.text)
                out.push_back(*m.text);
        }
        return out;
    }

    static Envelope from_peer(Payload p, const std::string &fp = "fp_peer")
    {
        return Envelope{fp, std::nullopt, std::move(p)};
    }

    ManualClock clock{kT0};
    EventLoop loop{clock};
    ScriptedTransport transport{loop};
    FixedPositionProvider position{kHere};
    FixedPositionProvider no_fix;
    std::unique_ptr<SessionManager> session;

    std::vector<SessionState> states;
    std::vector<std::string> delivered;
    size_t merged{0};
    std::vector<std::string> typing;
    std::vector<int> counts;
    std::vector<int64_t> warnings;
    std::vector<std::string> expired;
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_F(SessionManagerTest, ConstructorRejectsBadInput)
{
    EXPECT_THROW({ SessionManager s(loop, transport, ClientIdentity{}, test_config()); },
                 std::invalid_argument);

    ClientConfig bad = test_config();
    bad.radius_km = 0;
    EXPECT_THROW({ SessionManager s(loop, transport, ClientIdentity::generate("x"), bad); },
                 std::runtime_error);
}

TEST_F(SessionManagerTest, HandleIsUppercased)
{
    EXPECT_EQ(session->identity().handle, "ME");
    EXPECT_EQ(session->identity().fingerprint, "fp_self");
    EXPECT_EQ(session->state(), SessionState::Idle);
}

// ============================================================================
// create_zone
// ============================================================================

TEST_F(SessionManagerTest, CreateRequiresLocation)
{
    make_session(nullptr);
    auto r = session->create_zone("bunker", Visibility::Public);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ZoneError::LocationRequired);
    EXPECT_THAT(states, ElementsAre(SessionState::Creating, SessionState::Idle));

    make_session(&no_fix);
    auto r2 = session->create_zone("bunker", Visibility::Public);
    ASSERT_TRUE(r2.is_error());
    EXPECT_EQ(r2.error(), ZoneError::LocationRequired);
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_TRUE(transport.published.empty());
}

TEST_F(SessionManagerTest, CreateValidatesArguments)
{
    auto blank = session->create_zone("   ", Visibility::Public);
    ASSERT_TRUE(blank.is_error());
    EXPECT_EQ(blank.error(), ZoneError::InvalidArgument);

    auto no_pw = session->create_zone("vault", Visibility::Private);
    ASSERT_TRUE(no_pw.is_error());
    EXPECT_EQ(no_pw.error(), ZoneError::InvalidArgument);

    auto empty_pw = session->create_zone("vault", Visibility::Private, {}, std::string{});
    ASSERT_TRUE(empty_pw.is_error());
    EXPECT_EQ(empty_pw.error(), ZoneError::InvalidArgument);
    EXPECT_EQ(session->state(), SessionState::Idle);
}

TEST_F(SessionManagerTest, CreatePublishesDescriptorJoinPresenceAndHistoryRequest)
{
    auto r = session->create_zone("  bunker ", Visibility::Public, "nova");
    ASSERT_TRUE(r.is_ok());
    const Zone &z = r.content();
    EXPECT_EQ(z.name, "BUNKER");
    EXPECT_EQ(z.host_fingerprint, "fp_self");
    EXPECT_EQ(z.created_at, kT0);
    EXPECT_EQ(z.expires_at, kT0 + 2 * kHourMs);
    EXPECT_DOUBLE_EQ(z.center.lat, kHere.lat);
    EXPECT_FALSE(z.password_digest.has_value());

    EXPECT_TRUE(session->is_active());
    EXPECT_TRUE(session->is_host());
    EXPECT_EQ(session->identity().handle, "NOVA");
    EXPECT_THAT(states, ElementsAre(SessionState::Creating, SessionState::Active));

    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    EXPECT_THAT(transport.wire_ops, ElementsAre("sub:" + topic));
    EXPECT_THAT(kinds_on(kDiscovery), ElementsAre("zone_descriptor"));
    EXPECT_THAT(kinds_on(topic), ElementsAre("message", "presence", "history_req"));

    // The join notice enters the log once the publish is acknowledged.
    EXPECT_TRUE(session->messages().empty());
    drain(loop);
    ASSERT_EQ(session->messages().size(), 1u);
    EXPECT_EQ(session->messages()[0].kind, MessageKind::SystemJoin);
    EXPECT_EQ(*session->messages()[0].text, "NOVA joined the zone");
    EXPECT_EQ(session->member_count(), 1);
}

TEST_F(SessionManagerTest, PrivateZoneCarriesSaltedDigest)
{
    auto r = session->create_zone("vault", Visibility::Private, {}, std::string("pw"));
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(r.content().password_digest.has_value());
    EXPECT_EQ(*r.content().password_digest, AccessControl().digest("pw"));
}

TEST_F(SessionManagerTest, SecondSessionIsRefused)
{
    ASSERT_TRUE(session->create_zone("a", Visibility::Public).is_ok());
    auto again = session->create_zone("b", Visibility::Public);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error(), ZoneError::AlreadyActive);
    auto join = session->join_zone(make_zone("OTHER", kHere, kT0 + kHourMs));
    ASSERT_TRUE(join.is_error());
    EXPECT_EQ(join.error(), ZoneError::AlreadyActive);
    EXPECT_TRUE(session->is_active());
}

// ============================================================================
// join_zone
// ============================================================================

TEST_F(SessionManagerTest, JoinPrivateZoneChecksPassword)
{
    Zone z = make_zone("VAULT", kHere, kT0 + kHourMs);
    z.visibility = Visibility::Private;
    z.password_digest = AccessControl().digest("open sesame");

    for (const std::optional<std::string> &pw :
         {std::optional<std::string>{}, std::optional<std::string>{"wrong"}})
    {
        auto r = session->join_zone(z, {}, pw);
        ASSERT_TRUE(r.is_error());
        EXPECT_EQ(r.error(), ZoneError::AccessDenied);
        EXPECT_EQ(session->state(), SessionState::Idle);
    }
    EXPECT_TRUE(transport.published.empty());

    auto ok = session->join_zone(z, {}, std::string("open sesame"));
    ASSERT_TRUE(ok.is_ok());
    EXPECT_TRUE(session->is_active());
    EXPECT_FALSE(session->is_host());
}

TEST_F(SessionManagerTest, PrivateZoneWithoutDigestIsOpen)
{
    Zone z = make_zone("LEGACY", kHere, kT0 + kHourMs);
    z.visibility = Visibility::Private;
    EXPECT_TRUE(session->join_zone(z).is_ok());
}

TEST_F(SessionManagerTest, JoinExpiredZoneFails)
{
    auto r = session->join_zone(make_zone("OLD", kHere, kT0));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ZoneError::ZoneExpired);
    EXPECT_EQ(session->state(), SessionState::Idle);
}

TEST_F(SessionManagerTest, JoinShowsAdvertisedMemberCount)
{
    Zone z = make_zone("Z", kHere, kT0 + kHourMs);
    z.member_count = 4;
    ASSERT_TRUE(session->join_zone(z).is_ok());
    EXPECT_EQ(session->member_count(), 4);
    EXPECT_THAT(counts, ElementsAre(4));
    EXPECT_TRUE(kinds_on(kDiscovery).empty()) << "members never announce the zone";
}

// ============================================================================
// Sending
// ============================================================================

TEST_F(SessionManagerTest, SendRequiresActiveSession)
{
    auto t = session->send_text("hello");
    ASSERT_TRUE(t.is_error());
    EXPECT_EQ(t.error(), ZoneError::NotActive);
    auto m = session->send_media(MessageKind::Image, "data:image/png;base64,AAAA");
    ASSERT_TRUE(m.is_error());
    EXPECT_EQ(m.error(), ZoneError::NotActive);
    EXPECT_FALSE(session->notify_typing());
}

TEST_F(SessionManagerTest, SentTextAppearsAfterAckAndEchoIsDeduplicated)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    std::vector<PublishStatus> acks;

    auto r = session->send_text("  hello  ", [&](PublishStatus s) { acks.push_back(s); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(*r.content().text, "hello");
    EXPECT_EQ(r.content().sender, "ME");
    EXPECT_EQ(r.content().color, std::optional<std::string>("#00ff88"));
    EXPECT_THAT(log_texts(), Not(Contains("hello")));

    drain(loop);
    EXPECT_THAT(acks, ElementsAre(PublishStatus::Accepted));
    EXPECT_THAT(log_texts(), Contains("hello"));

    const size_t before = delivered.size();
    transport.inject(topic, from_peer(MessageEvent{r.content()}, "fp_self"));
    EXPECT_EQ(delivered.size(), before);
    EXPECT_EQ(session->messages().size(), 2u);
}

TEST_F(SessionManagerTest, EmptyTextIsRejected)
{
    join("Z");
    auto r = session->send_text(" \t ");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ZoneError::InvalidArgument);
}

TEST_F(SessionManagerTest, SendIsThrottled)
{
    join("Z");
    ASSERT_TRUE(session->send_text("one").is_ok());
    auto r = session->send_text("two");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ZoneError::Throttled);

    step(clock, loop, 999, 999);
    EXPECT_TRUE(session->send_text("three").is_error());
    step(clock, loop, 1, 1);
    EXPECT_TRUE(session->send_text("four").is_ok());
    drain(loop);
    EXPECT_THAT(log_texts(), ElementsAre("ME joined the zone", "one", "four"));
}

TEST_F(SessionManagerTest, ModeratorCanBlock)
{
    StrictMock<MockModerator> moderator;
    make_session(&position, &moderator);
    join("Z");

    EXPECT_CALL(moderator, moderate(std::string_view("bad words")))
        .WillOnce(Return(ModerationVerdict{false, "abusive language"}));
    EXPECT_CALL(moderator, moderate(std::string_view("fine")))
        .WillOnce(Return(ModerationVerdict{true, ""}));

    auto blocked = session->send_text("bad words");
    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error(), ZoneError::Blocked);
    EXPECT_EQ(blocked.error_detail(), "abusive language");

    // A blocked attempt does not count against the throttle.
    EXPECT_TRUE(session->send_text("fine").is_ok());
    drain(loop);
    EXPECT_THAT(log_texts(), ElementsAre("ME joined the zone", "fine"));
}

TEST_F(SessionManagerTest, MediaValidation)
{
    join("Z");
    auto not_media = session->send_media(MessageKind::Text, "x");
    ASSERT_TRUE(not_media.is_error());
    EXPECT_EQ(not_media.error(), ZoneError::InvalidArgument);
    auto empty = session->send_media(MessageKind::Audio, "");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error(), ZoneError::InvalidArgument);

    auto ok = session->send_media(MessageKind::Image, "data:image/png;base64,AAAA");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.content().media, std::optional<std::string>("data:image/png;base64,AAAA"));
    EXPECT_FALSE(ok.content().text.has_value());
    drain(loop);
    EXPECT_EQ(session->messages().back().kind, MessageKind::Image);
}

TEST_F(SessionManagerTest, OfflineSendIsReportedAndNotAppended)
{
    join("Z");
    transport.go(ConnectionState::Reconnecting);
    std::vector<PublishStatus> acks;
    ASSERT_TRUE(session->send_text("lost", [&](PublishStatus s) { acks.push_back(s); }).is_ok());
    drain(loop);
    EXPECT_THAT(acks, ElementsAre(PublishStatus::Offline));
    EXPECT_THAT(log_texts(), Not(Contains("lost")));
    EXPECT_FALSE(session->notify_typing());
}

TEST_F(SessionManagerTest, FailedSendGivesThrottleWindowBack)
{
    join("Z");
    std::vector<PublishStatus> acks;
    const auto record = [&](PublishStatus st) { acks.push_back(st); };

    transport.go(ConnectionState::Reconnecting);
    ASSERT_TRUE(session->send_text("lost", record).is_ok());
    drain(loop);
    transport.go(ConnectionState::Connected);
    drain(loop);
    ASSERT_TRUE(session->send_text("retry", record).is_ok()) << "no time has passed";
    drain(loop);

    transport.fail_publish = true;
    step(clock, loop, 1000, 1000);
    ASSERT_TRUE(session->send_text("refused", record).is_ok());
    drain(loop);
    transport.fail_publish = false;
    ASSERT_TRUE(session->send_text("retry again", record).is_ok());
    drain(loop);

    EXPECT_THAT(acks, ElementsAre(PublishStatus::Offline, PublishStatus::Accepted,
                                  PublishStatus::Failed, PublishStatus::Accepted));
    EXPECT_THAT(log_texts(), ElementsAre("ME joined the zone", "retry", "retry again"));

    // A delivered send still holds the window.
    auto r = session->send_text("too soon");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ZoneError::Throttled);
}

// ============================================================================
// exit
// ============================================================================

TEST_F(SessionManagerTest, ExitPublishesLeaveAndResets)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    const uint64_t gen = session->generation();
    transport.published.clear();

    EXPECT_TRUE(session->exit());
    ASSERT_EQ(transport.published.size(), 1u);
    const auto *leave = transport.published[0].second.as<MessageEvent>();
    ASSERT_NE(leave, nullptr);
    EXPECT_EQ(leave->message.kind, MessageKind::SystemLeave);
    EXPECT_THAT(transport.wire_ops, ElementsAre("sub:" + topic, "unsub:" + topic));

    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_FALSE(session->zone().has_value());
    EXPECT_TRUE(session->messages().empty());
    EXPECT_EQ(session->member_count(), 1);
    EXPECT_GT(session->generation(), gen);
    EXPECT_TRUE(expired.empty());

    EXPECT_FALSE(session->exit());
}

TEST_F(SessionManagerTest, StopLeavesWithoutExpiryNotice)
{
    join("Z");
    session->stop();
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_TRUE(expired.empty());
    EXPECT_TRUE(transport.subscriptions().empty());
    session->stop();
}

// ============================================================================
// Timers
// ============================================================================

TEST_F(SessionManagerTest, ExpiryWarnsOnceThenExits)
{
    join("SHORT", kT0 + 400000);
    EXPECT_EQ(session->remaining_ms(), 400000);

    step(clock, loop, 99000, 1000);
    EXPECT_TRUE(warnings.empty());
    step(clock, loop, 1000, 1000);
    EXPECT_THAT(warnings, ElementsAre(300000));

    step(clock, loop, 299000, 1000);
    EXPECT_EQ(warnings.size(), 1u);
    EXPECT_TRUE(session->is_active());
    EXPECT_EQ(session->remaining_ms(), 1000);

    step(clock, loop, 1000, 1000);
    EXPECT_THAT(expired, ElementsAre("SHORT"));
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_EQ(session->remaining_ms(), 0);
}

TEST_F(SessionManagerTest, MembersAnnouncePresenceEveryHalfPulse)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    transport.published.clear();
    step(clock, loop, 10000, 1000);
    EXPECT_THAT(kinds_on(topic), ElementsAre("presence", "presence"));
}

TEST_F(SessionManagerTest, HostPulseCountsDistinctParticipants)
{
    auto r = session->create_zone("bunker", Visibility::Public);
    ASSERT_TRUE(r.is_ok());
    const std::string topic = zone_topic(kDefaultTopicPrefix, r.content().id);
    drain(loop);

    transport.inject(topic, from_peer(PresenceEvent{"A"}, "fp_a"));
    transport.inject(topic, from_peer(PresenceEvent{"A"}, "fp_a"));
    transport.inject(topic, from_peer(PresenceEvent{"B"}, "fp_b"));
    transport.inject(topic, from_peer(MessageEvent{make_text("m1", "C", kT0)}, "fp_c"));
    transport.published.clear();
    counts.clear();

    step(clock, loop, 10000, 1000);
    EXPECT_EQ(session->member_count(), 4);
    EXPECT_THAT(counts, ElementsAre(4));
    ASSERT_THAT(kinds_on(kDiscovery), ElementsAre("zone_descriptor"));
    for (const auto &[t, env] : transport.published)
    {
        if (const auto *desc = env.as<ZoneDescriptor>())
            EXPECT_EQ(desc->zone.member_count, 4);
        if (const auto *sync = env.as<CountSyncEvent>())
            EXPECT_EQ(sync->count, 4);
    }
    EXPECT_THAT(kinds_on(topic), Contains("count_sync"));

    // Quiet window: only the host remains.
    step(clock, loop, 10000, 1000);
    EXPECT_EQ(session->member_count(), 1);
}

TEST_F(SessionManagerTest, MembersAcceptCountSyncOnlyFromHost)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    counts.clear();
    transport.inject(topic, from_peer(CountSyncEvent{9}, "fp_impostor"));
    EXPECT_EQ(session->member_count(), 1);
    transport.inject(topic, from_peer(CountSyncEvent{3}, z.host_fingerprint));
    EXPECT_EQ(session->member_count(), 3);
    EXPECT_EQ(session->zone()->member_count, 3);
    EXPECT_THAT(counts, ElementsAre(3));
}

// ============================================================================
// Typing
// ============================================================================

TEST_F(SessionManagerTest, TypingIndicatorsFromOthers)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);

    transport.inject(topic, from_peer(TypingEvent{"ME"}, "fp_self"));
    EXPECT_TRUE(session->typing_users().empty());

    transport.inject(topic, from_peer(TypingEvent{"ECHO"}));
    transport.inject(topic, from_peer(TypingEvent{"BRAVO"}, "fp_bravo"));
    EXPECT_THAT(session->typing_users(), ElementsAre("BRAVO", "ECHO"));
    EXPECT_THAT(typing, ElementsAre("BRAVO", "ECHO"));

    // A message from ECHO ends ECHO's indicator.
    transport.inject(topic, from_peer(MessageEvent{make_text("m1", "ECHO", kT0)}));
    EXPECT_THAT(typing, ElementsAre("BRAVO"));

    step(clock, loop, 4000, 1000);
    EXPECT_THAT(session->typing_users(), ElementsAre("BRAVO"));
    step(clock, loop, 1000, 1000);
    EXPECT_TRUE(session->typing_users().empty());
    EXPECT_TRUE(typing.empty());
}

TEST_F(SessionManagerTest, NotifyTypingIsThrottled)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    transport.published.clear();

    EXPECT_TRUE(session->notify_typing());
    EXPECT_FALSE(session->notify_typing());
    step(clock, loop, 1499, 1499);
    EXPECT_FALSE(session->notify_typing());
    step(clock, loop, 1, 1);
    EXPECT_TRUE(session->notify_typing());

    std::vector<std::string> typing_sent;
    for (const auto &[t, env] : transport.published)
    {
        if (const auto *ev = env.as<TypingEvent>())
            typing_sent.push_back(ev->handle);
    }
    EXPECT_THAT(typing_sent, ElementsAre("ME", "ME"));
}

// ============================================================================
// History
// ============================================================================

TEST_F(SessionManagerTest, AnswersHistoryRequestsFromPeers)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    ASSERT_TRUE(session->send_text("first").is_ok());
    drain(loop);
    transport.published.clear();

    transport.inject(topic, from_peer(HistoryRequest{}, "fp_self"));
    EXPECT_TRUE(transport.published.empty());

    transport.inject(topic, from_peer(HistoryRequest{}, "fp_newcomer"));
    ASSERT_EQ(transport.published.size(), 1u);
    const Envelope &reply = transport.published[0].second;
    EXPECT_EQ(reply.to, std::optional<std::string>("fp_newcomer"));
    const auto *res = reply.as<HistoryResponse>();
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(res->messages.size(), 2u);
}

TEST_F(SessionManagerTest, MergesHistoryAddressedToUs)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    const HistoryResponse older{{make_text("h2", "A", kT0 - 500, "second"),
                                 make_text("h1", "A", kT0 - 900, "first")}};

    transport.inject(topic, Envelope{"fp_peer", std::string("fp_other"), older});
    EXPECT_EQ(merged, 0u);

    transport.inject(topic, Envelope{"fp_peer", std::string("fp_self"), older});
    EXPECT_EQ(merged, 2u);
    EXPECT_THAT(log_texts(), ElementsAre("first", "second", "ME joined the zone"));

    transport.inject(topic, Envelope{"fp_peer2", std::string("fp_self"), older});
    EXPECT_EQ(merged, 2u);
}

// ============================================================================
// Generation guard
// ============================================================================

TEST_F(SessionManagerTest, StaleZoneListenerCannotTouchNewSession)
{
    join("A");
    const TransportListener stale = transport.captured.back();
    session->exit();
    const Zone b = join("B");
    const std::string topic_b = zone_topic(kDefaultTopicPrefix, b.id);
    const size_t before = session->messages().size();

    stale.on_envelope(topic_b, from_peer(MessageEvent{make_text("ghost", "A", kT0, "boo")}));
    stale.on_envelope(topic_b, Envelope{"fp_peer", std::string("fp_self"),
                                        HistoryResponse{{make_text("old", "A", kT0, "old")}}});
    EXPECT_EQ(session->messages().size(), before);

    transport.inject(topic_b, from_peer(MessageEvent{make_text("live", "A", kT0, "live")}));
    EXPECT_THAT(log_texts(), Contains("live"));
    EXPECT_THAT(log_texts(), Not(Contains("boo")));
}

TEST_F(SessionManagerTest, StaleAckIsIgnored)
{
    join("A");
    bool acked = false;
    ASSERT_TRUE(session->send_text("late", [&](PublishStatus) { acked = true; }).is_ok());
    session->exit();
    ASSERT_TRUE(session->join_zone(make_zone("B", kHere, kT0 + kHourMs)).is_ok());
    drain(loop);

    EXPECT_FALSE(acked);
    EXPECT_THAT(log_texts(), ElementsAre("ME joined the zone"));
    EXPECT_EQ(session->zone()->id, "B");
}

// ============================================================================
// Discovery and connection
// ============================================================================

TEST_F(SessionManagerTest, HostReannouncesOnSyncRequest)
{
    ASSERT_TRUE(session->create_zone("bunker", Visibility::Public).is_ok());
    drain(loop);
    transport.published.clear();

    transport.inject(kDiscovery, from_peer(ZoneSyncRequest{}));
    EXPECT_THAT(kinds_on(kDiscovery), ElementsAre("zone_descriptor"));
}

TEST_F(SessionManagerTest, MemberDoesNotAnswerSyncRequest)
{
    join("Z");
    transport.published.clear();
    transport.inject(kDiscovery, from_peer(ZoneSyncRequest{}));
    EXPECT_TRUE(transport.published.empty());
}

TEST_F(SessionManagerTest, RecoveryRepublishesPresenceAndHistoryRequest)
{
    const Zone z = join("Z");
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    transport.published.clear();
    transport.wire_ops.clear();

    transport.go(ConnectionState::Reconnecting);
    EXPECT_EQ(session->connection_state(), ConnectionState::Reconnecting);
    transport.go(ConnectionState::Connected);

    EXPECT_THAT(transport.wire_ops, ElementsAre("unsub:" + kDiscovery, "sub:" + kDiscovery,
                                                "unsub:" + topic, "sub:" + topic));
    EXPECT_THAT(kinds_on(kDiscovery), ElementsAre("zone_sync_req"));
    EXPECT_THAT(kinds_on(topic), ElementsAre("presence", "history_req"));
    EXPECT_TRUE(session->is_active());
}

TEST_F(SessionManagerTest, FirstConnectCatchesUpOnEarlierPublishes)
{
    // A link that is still coming up, as after ZmqTransport::connect().
    ScriptedTransport late{loop};
    late.go(ConnectionState::Reconnecting);
    SessionManager s(loop, late, ClientIdentity{"fp_late", "late", "#336699"}, test_config(),
                     &position);
    s.start();
    const Zone z = make_zone("Z", kHere, kT0 + kHourMs);
    ASSERT_TRUE(s.join_zone(z).is_ok());
    drain(loop);
    EXPECT_TRUE(late.published.empty());

    late.go(ConnectionState::Connected);
    drain(loop);
    const std::string topic = zone_topic(kDefaultTopicPrefix, z.id);
    std::vector<std::string> on_discovery;
    std::vector<std::string> on_zone;
    for (const auto &[t, env] : late.published)
    {
        if (t == kDiscovery)
            on_discovery.push_back(env.kind());
        else if (t == topic)
            on_zone.push_back(env.kind());
    }
    EXPECT_THAT(on_discovery, ElementsAre("zone_sync_req"));
    EXPECT_THAT(on_zone, ElementsAre("presence", "history_req"));
    EXPECT_EQ(s.connection_state(), ConnectionState::Connected);
}

TEST_F(SessionManagerTest, TracksDistanceToZone)
{
    join("Z");
    ASSERT_TRUE(session->distance_to_zone().has_value());
    EXPECT_NEAR(*session->distance_to_zone(), 0.0, 1e-9);
    EXPECT_TRUE(session->is_in_range());

    position.set(GeoPoint{11.0, 11.0});
    session->update_location();
    EXPECT_GT(*session->distance_to_zone(), 100.0);
    EXPECT_FALSE(session->is_in_range());
    EXPECT_TRUE(session->is_active()) << "leaving the area does not end the session";
}

// =============================================================================
// FILE: tests/test_event_builder.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "manager/event_builder.h"

using namespace asterisk_live;

static AmiPacket make_packet(std::initializer_list<std::pair<std::string, std::string>> fields) {
    AmiPacket p;
    for (const auto& f : fields) p.add(f.first, f.second);
    return p;
}

TEST(EventBuilder, NewChannel) {
    auto ev = build_event(make_packet({{"Event", "Newchannel"}, {"Channel", "SIP/1000-0001"},
                                       {"State", "Ring"}, {"CallerID", "1000"},
                                       {"CallerIDName", "Alice"}, {"Uniqueid", "111.1"}}), 1);
    ASSERT_TRUE(ev.is<NewChannelEvent>());
    const auto* e = ev.as<NewChannelEvent>();
    EXPECT_EQ(e->channel, "SIP/1000-0001");
    EXPECT_EQ(e->unique_id, "111.1");
    EXPECT_EQ(e->state, "Ring");
    EXPECT_EQ(e->caller_id_num, "1000");
    EXPECT_EQ(e->caller_id_name, "Alice");
    EXPECT_EQ(ev.id, 1u);
    EXPECT_EQ(ev.name, "Newchannel");
}

TEST(EventBuilder, NameMatchIsCaseInsensitive) {
    auto ev = build_event(make_packet({{"Event", "HANGUP"}, {"Uniqueid", "1.2"},
                                       {"Cause", "16"}, {"Cause-txt", "Normal Clearing"}}), 2);
    ASSERT_TRUE(ev.is<HangupEvent>());
    EXPECT_EQ(ev.as<HangupEvent>()->cause, 16);
    EXPECT_EQ(ev.as<HangupEvent>()->cause_text, "Normal Clearing");
}

TEST(EventBuilder, MalformedNumbersFallBackToZero) {
    auto ev = build_event(make_packet({{"Event", "Status"}, {"Channel", "SIP/2000-0002"},
                                       {"Uniqueid", "5.6"}, {"Priority", "3abc"},
                                       {"Seconds", "-7"}}), 20);
    ASSERT_TRUE(ev.is<StatusEvent>());
    EXPECT_EQ(ev.as<StatusEvent>()->priority, 0);
    EXPECT_EQ(ev.as<StatusEvent>()->seconds, -7);

    auto hangup = build_event(make_packet({{"Event", "Hangup"}, {"Uniqueid", "5.7"},
                                           {"Cause", "99999999999"}}), 21);
    ASSERT_TRUE(hangup.is<HangupEvent>());
    EXPECT_EQ(hangup.as<HangupEvent>()->cause, 0);
}

TEST(EventBuilder, PrefersChannelStateDesc) {
    auto ev = build_event(make_packet({{"Event", "Newstate"}, {"ChannelState", "6"},
                                       {"ChannelStateDesc", "Up"}, {"Uniqueid", "1.3"}}), 3);
    ASSERT_TRUE(ev.is<NewStateEvent>());
    EXPECT_EQ(ev.as<NewStateEvent>()->state, "Up");
}

TEST(EventBuilder, BridgeMapsToLinkAndUnlink) {
    auto link = build_event(make_packet({{"Event", "Bridge"}, {"Bridgestate", "Link"},
                                         {"Channel1", "A"}, {"Channel2", "B"},
                                         {"Uniqueid1", "1"}, {"Uniqueid2", "2"}}), 4);
    ASSERT_TRUE(link.is<LinkEvent>());
    EXPECT_EQ(link.as<LinkEvent>()->unique_id2, "2");

    auto unlink = build_event(make_packet({{"Event", "Bridge"}, {"Bridgestate", "Unlink"},
                                           {"Channel1", "A"}, {"Channel2", "B"}}), 5);
    EXPECT_TRUE(unlink.is<UnlinkEvent>());
}

TEST(EventBuilder, StatusCarriesActionId) {
    auto ev = build_event(make_packet({{"Event", "Status"}, {"ActionID", "17"},
                                       {"Channel", "SIP/2000-0002"}, {"Uniqueid", "5.5"},
                                       {"State", "Up"}, {"Context", "default"},
                                       {"Extension", "2000"}, {"Priority", "3"},
                                       {"Link", "SIP/3000-0003"}, {"Seconds", "42"}}), 6);
    ASSERT_TRUE(ev.is<StatusEvent>());
    EXPECT_EQ(ev.action_id, "17");
    const auto* s = ev.as<StatusEvent>();
    EXPECT_EQ(s->priority, 3);
    EXPECT_EQ(s->link, "SIP/3000-0003");
    EXPECT_EQ(s->seconds, 42);
}

TEST(EventBuilder, QueueMemberAcceptsInterface) {
    auto ev = build_event(make_packet({{"Event", "QueueMember"}, {"Queue", "support"},
                                       {"Interface", "SIP/4000"}, {"Paused", "1"},
                                       {"CallsTaken", "7"}}), 7);
    ASSERT_TRUE(ev.is<QueueMemberEvent>());
    EXPECT_EQ(ev.as<QueueMemberEvent>()->location, "SIP/4000");
    EXPECT_TRUE(ev.as<QueueMemberEvent>()->paused);
    EXPECT_EQ(ev.as<QueueMemberEvent>()->calls_taken, 7);
}

TEST(EventBuilder, OriginateVariants) {
    auto resp = build_event(make_packet({{"Event", "OriginateResponse"},
                                         {"Response", "Success"}, {"Uniqueid", "9.9"}}), 8);
    ASSERT_TRUE(resp.is<OriginateResponseEvent>());
    EXPECT_TRUE(resp.as<OriginateResponseEvent>()->success);

    auto fail = build_event(make_packet({{"Event", "OriginateFailure"}, {"Reason", "5"}}), 9);
    ASSERT_TRUE(fail.is<OriginateResponseEvent>());
    EXPECT_FALSE(fail.as<OriginateResponseEvent>()->success);
    EXPECT_EQ(fail.as<OriginateResponseEvent>()->reason, 5);
}

TEST(EventBuilder, UnknownNameBecomesGeneric) {
    auto ev = build_event(make_packet({{"Event", "PeerStatus"}, {"Peer", "SIP/1000"},
                                       {"PeerStatus", "Registered"}}), 10);
    ASSERT_TRUE(ev.is<GenericEvent>());
    EXPECT_EQ(ev.as<GenericEvent>()->fields.size(), 3u);
    EXPECT_STREQ(event_type_name(ev.payload), "Generic");
}

TEST(EventBuilder, MissingNumericFieldsDefaultToZero) {
    auto ev = build_event(make_packet({{"Event", "Join"}, {"Queue", "q"},
                                       {"Position", "abc"}}), 11);
    ASSERT_TRUE(ev.is<JoinEvent>());
    EXPECT_EQ(ev.as<JoinEvent>()->position, 0);
    EXPECT_EQ(ev.as<JoinEvent>()->count, 0);
}

TEST(EventBuilder, BuildResponse) {
    AmiPacket p = make_packet({{"Response", "Follows"}, {"ActionID", "3"}});
    p.output.push_back("Asterisk 1.4.21");
    auto r = build_response(p);
    EXPECT_TRUE(r.is_success());
    EXPECT_EQ(r.action_id, "3");
    ASSERT_EQ(r.output.size(), 1u);

    auto err = build_response(make_packet({{"Response", "Error"},
                                           {"Message", "Permission denied"}}));
    EXPECT_FALSE(err.is_success());
    EXPECT_EQ(err.message, "Permission denied");
    EXPECT_EQ(err.get("message"), "Permission denied");
}

TEST(EventBuilder, TypeNames) {
    EXPECT_STREQ(event_type_name(EventPayload{ConnectEvent{}}), "Connect");
    EXPECT_STREQ(event_type_name(EventPayload{HangupEvent{}}), "Hangup");
    EXPECT_STREQ(event_type_name(EventPayload{OriginateResponseEvent{}}), "OriginateResponse");
}

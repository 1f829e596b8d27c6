// =============================================================================
// FILE: tests/test_channel_manager.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "live/channel_manager.h"

using namespace asterisk_live;

static StatusEvent make_status(const std::string& uid, const std::string& name,
                               const std::string& state = "Up") {
    StatusEvent s;
    s.unique_id = uid;
    s.channel = name;
    s.state = state;
    s.caller_id_num = "1000";
    s.context = "default";
    s.extension = "2000";
    s.priority = 1;
    return s;
}

TEST(ChannelState, ParsesTextAndNumbers) {
    EXPECT_EQ(parse_channel_state("Up"), ChannelState::kUp);
    EXPECT_EQ(parse_channel_state("ringing"), ChannelState::kRinging);
    EXPECT_EQ(parse_channel_state("Rsrvd"), ChannelState::kReserved);
    EXPECT_EQ(parse_channel_state("6"), ChannelState::kUp);
    EXPECT_EQ(parse_channel_state("42"), ChannelState::kUnknown);
    EXPECT_EQ(parse_channel_state(""), ChannelState::kUnknown);
    EXPECT_STREQ(channel_state_to_string(ChannelState::kDialingOffHook), "Dialing Offhook");
}

TEST(ChannelManager, StatusUpsertsByUniqueId) {
    ChannelManager mgr;
    mgr.handle_status_event(make_status("1.1", "SIP/1000-0001"));
    mgr.handle_status_event(make_status("1.1", "SIP/1000-0001"));
    EXPECT_EQ(mgr.channel_count(), 1u);

    auto c = mgr.get_channel_by_id("1.1");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->state(), ChannelState::kUp);
    EXPECT_EQ(c->extension_history().size(), 1u);
}

TEST(ChannelManager, StatusWithoutUniqueIdIsIgnored) {
    ChannelManager mgr;
    mgr.handle_status_event(make_status("", "SIP/1000-0001"));
    EXPECT_EQ(mgr.channel_count(), 0u);
}

TEST(ChannelManager, NewChannelThenNewExtenAndState) {
    ChannelManager mgr;
    NewChannelEvent nc;
    nc.unique_id = "2.1"; nc.channel = "SIP/2000-0001"; nc.state = "Down";
    nc.caller_id_num = "2000"; nc.caller_id_name = "Bob";
    mgr.handle_new_channel_event(nc);

    NewExtenEvent ne;
    ne.unique_id = "2.1"; ne.channel = "SIP/2000-0001"; ne.context = "from-internal";
    ne.extension = "300"; ne.priority = 1; ne.application = "Dial"; ne.app_data = "SIP/300";
    mgr.handle_new_exten_event(ne);
    mgr.handle_new_exten_event(ne);

    NewStateEvent ns;
    ns.unique_id = "2.1"; ns.channel = "SIP/2000-0001"; ns.state = "Ringing";
    mgr.handle_new_state_event(ns);

    auto c = mgr.get_channel_by_name("SIP/2000-0001");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->state(), ChannelState::kRinging);
    EXPECT_EQ(c->caller_id_name(), "Bob");
    ASSERT_EQ(c->extension_history().size(), 1u);
    auto ext = c->current_extension();
    ASSERT_TRUE(ext.has_value());
    EXPECT_EQ(ext->application, "Dial");
}

TEST(ChannelManager, EventsForUnseenChannelCreateIt) {
    ChannelManager mgr;
    NewCallerIdEvent ev;
    ev.unique_id = "3.1"; ev.channel = "IAX2/peer-1"; ev.caller_id_num = "555";
    mgr.handle_new_caller_id_event(ev);
    auto c = mgr.get_channel_by_id("3.1");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->caller_id_num(), "555");
}

TEST(ChannelManager, LinkAndUnlink) {
    ChannelManager mgr;
    mgr.handle_status_event(make_status("a", "SIP/A-1"));
    mgr.handle_status_event(make_status("b", "SIP/B-1"));

    mgr.handle_link_event(LinkEvent{"SIP/A-1", "SIP/B-1", "a", "b"});
    EXPECT_EQ(mgr.get_channel_by_id("a")->linked_channel(), "SIP/B-1");
    EXPECT_EQ(mgr.get_channel_by_id("b")->linked_unique_id(), "a");

    mgr.handle_unlink_event(UnlinkEvent{"SIP/A-1", "SIP/B-1", "a", "b"});
    EXPECT_EQ(mgr.get_channel_by_id("a")->linked_channel(), "");
    EXPECT_EQ(mgr.get_channel_by_id("b")->linked_channel(), "");
}

TEST(ChannelManager, LinkWithUnknownChannelIsCounted) {
    ChannelManager mgr;
    mgr.handle_status_event(make_status("a", "SIP/A-1"));
    mgr.handle_link_event(LinkEvent{"SIP/A-1", "SIP/X-1", "a", "x"});
    EXPECT_EQ(mgr.get_channel_by_id("a")->linked_channel(), "SIP/X-1");
    EXPECT_EQ(mgr.stats().unknown_channel_events.load(), 1u);
}

TEST(ChannelManager, Rename) {
    ChannelManager mgr;
    mgr.handle_status_event(make_status("r", "SIP/old-1"));
    mgr.handle_rename_event(RenameEvent{"SIP/old-1", "SIP/new-1", "r"});
    EXPECT_EQ(mgr.get_channel_by_name("SIP/old-1"), nullptr);
    ASSERT_NE(mgr.get_channel_by_name("SIP/new-1"), nullptr);

    mgr.handle_rename_event(RenameEvent{"SIP/ghost", "SIP/ghost2", "zz"});
    EXPECT_EQ(mgr.stats().unknown_channel_events.load(), 1u);
}

TEST(ChannelManager, HangupRemovesAndInvokesCallback) {
    ChannelManager mgr;
    std::shared_ptr<LiveChannel> hung;
    mgr.set_hangup_callback([&](const std::shared_ptr<LiveChannel>& c) { hung = c; });

    mgr.handle_status_event(make_status("h", "SIP/H-1"));
    mgr.handle_hangup_event(HangupEvent{"SIP/H-1", "h", 16, "Normal Clearing"});

    EXPECT_EQ(mgr.channel_count(), 0u);
    ASSERT_NE(hung, nullptr);
    EXPECT_EQ(hung->state(), ChannelState::kHungUp);
    EXPECT_EQ(hung->hangup_cause(), 16);
    EXPECT_EQ(hung->hangup_cause_text(), "Normal Clearing");
    EXPECT_TRUE(hung->hung_up_at().has_value());
    EXPECT_EQ(mgr.stats().channels_hung_up.load(), 1u);
}

TEST(ChannelManager, HangupOfUnknownChannel) {
    ChannelManager mgr;
    bool called = false;
    mgr.set_hangup_callback([&](const std::shared_ptr<LiveChannel>&) { called = true; });
    mgr.handle_hangup_event(HangupEvent{"SIP/none", "none", 16, ""});
    EXPECT_FALSE(called);
    EXPECT_EQ(mgr.stats().unknown_channel_events.load(), 1u);
}

TEST(ChannelManager, ClearDropsEverything) {
    ChannelManager mgr;
    mgr.handle_status_event(make_status("1", "SIP/1"));
    mgr.handle_status_event(make_status("2", "SIP/2"));
    EXPECT_EQ(mgr.get_channels().size(), 2u);
    mgr.clear();
    EXPECT_EQ(mgr.channel_count(), 0u);
}

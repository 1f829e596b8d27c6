// =============================================================================
// FILE: tests/test_call_record.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "persistence/call_record.h"
#include "live/live_channel.h"
#include <thread>

using namespace asterisk_live;

TEST(CallRecord, FromHungUpChannel) {
    LiveChannel channel("1234.5", "SIP/1000-00af");
    channel.set_caller_id("1000", "Alice");
    channel.set_account_code("acct-7");
    ExtensionEntry ext;
    ext.context = "from-internal";
    ext.extension = "2000";
    ext.priority = 1;
    channel.add_extension(ext);
    channel.set_linked("SIP/2000-00b0", "1234.6");

    std::this_thread::sleep_for(Millisecs(5));
    channel.set_hangup(16, "Normal Clearing");

    auto rec = CallRecord::from_channel(channel);
    EXPECT_EQ(rec.unique_id, "1234.5");
    EXPECT_EQ(rec.channel, "SIP/1000-00af");
    EXPECT_EQ(rec.caller_id_num, "1000");
    EXPECT_EQ(rec.caller_id_name, "Alice");
    EXPECT_EQ(rec.account_code, "acct-7");
    EXPECT_EQ(rec.last_context, "from-internal");
    EXPECT_EQ(rec.last_extension, "2000");
    EXPECT_EQ(rec.linked_channel, "SIP/2000-00b0");
    EXPECT_EQ(rec.hangup_cause, 16);
    EXPECT_EQ(rec.hangup_cause_text, "Normal Clearing");
    EXPECT_GE(rec.duration.count(), 5);
    EXPECT_LE(rec.start_time, rec.end_time);
    EXPECT_LE(rec.end_time, WallClock::now());
}

TEST(CallRecord, ChannelWithoutExtension) {
    LiveChannel channel("1.1", "Local/100@test-0001");
    auto rec = CallRecord::from_channel(channel);
    EXPECT_EQ(rec.last_context, "");
    EXPECT_EQ(rec.hangup_cause, 0);
    EXPECT_GE(rec.duration.count(), 0);
}

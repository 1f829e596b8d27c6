// =============================================================================
// FILE: tests/test_queue_manager.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "live/queue_manager.h"

using namespace asterisk_live;

class QueueManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        QueueParamsEvent p;
        p.queue = "support";
        p.strategy = "ringall";
        p.max = 10;
        mgr.handle_queue_params_event(p);
    }

    static JoinEvent join(const std::string& channel, int position) {
        JoinEvent j;
        j.queue = "support";
        j.channel = channel;
        j.unique_id = channel + "-id";
        j.position = position;
        return j;
    }

    QueueManager mgr;
};

TEST_F(QueueManagerTest, ParamsCreateQueue) {
    auto q = mgr.get_queue("support");
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->strategy, "ringall");
    EXPECT_EQ(q->max, 10);
    EXPECT_EQ(mgr.queue_count(), 1u);
    EXPECT_FALSE(mgr.get_queue("sales").has_value());
}

TEST_F(QueueManagerTest, MemberUpsertByLocation) {
    QueueMemberEvent m;
    m.queue = "support";
    m.location = "SIP/4000";
    m.calls_taken = 1;
    mgr.handle_queue_member_event(m);
    m.calls_taken = 5;
    m.paused = true;
    mgr.handle_queue_member_event(m);

    auto q = mgr.get_queue("support");
    ASSERT_EQ(q->members.size(), 1u);
    EXPECT_EQ(q->members[0].calls_taken, 5);
    EXPECT_TRUE(q->members[0].paused);
}

TEST_F(QueueManagerTest, JoinAndLeaveRenumber) {
    mgr.handle_join_event(join("SIP/a", 1));
    mgr.handle_join_event(join("SIP/b", 2));
    mgr.handle_join_event(join("SIP/c", 3));

    LeaveEvent l;
    l.queue = "support";
    l.channel = "SIP/a";
    mgr.handle_leave_event(l);

    auto q = mgr.get_queue("support");
    ASSERT_EQ(q->entries.size(), 2u);
    EXPECT_EQ(q->entries[0].channel, "SIP/b");
    EXPECT_EQ(q->entries[0].position, 1);
    EXPECT_EQ(q->entries[1].channel, "SIP/c");
    EXPECT_EQ(q->entries[1].position, 2);
    EXPECT_EQ(q->calls, 2);
}

TEST_F(QueueManagerTest, QueueEntryUpsertsByChannel) {
    QueueEntryEvent e;
    e.queue = "support";
    e.channel = "SIP/a";
    e.position = 1;
    mgr.handle_queue_entry_event(e);
    mgr.handle_queue_entry_event(e);
    EXPECT_EQ(mgr.get_queue("support")->entries.size(), 1u);
}

TEST_F(QueueManagerTest, EventsForUnknownQueueAreDropped) {
    JoinEvent j = join("SIP/a", 1);
    j.queue = "sales";
    mgr.handle_join_event(j);

    QueueMemberEvent m;
    m.queue = "sales";
    m.location = "SIP/1";
    mgr.handle_queue_member_event(m);

    EXPECT_EQ(mgr.queue_count(), 1u);
    EXPECT_EQ(mgr.stats().unknown_queue_events.load(), 2u);
}

TEST_F(QueueManagerTest, ReadersGetCopies) {
    auto queues = mgr.get_queues();
    ASSERT_EQ(queues.size(), 1u);
    queues[0].strategy = "changed";
    EXPECT_EQ(mgr.get_queue("support")->strategy, "ringall");
}

TEST_F(QueueManagerTest, Clear) {
    mgr.clear();
    EXPECT_EQ(mgr.queue_count(), 0u);
}

// =============================================================================
// FILE: include/live/queue_manager.h
// =============================================================================
#ifndef LIVE_QUEUE_MANAGER_H
#define LIVE_QUEUE_MANAGER_H

#include "common/types.h"
#include "manager/manager_event.h"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace asterisk_live {

struct QueueMemberInfo {
    std::string location;
    std::string name;
    std::string membership;   // "static" / "dynamic"
    int         penalty     = 0;
    int         calls_taken = 0;
    long        last_call   = 0;
    int         status      = 0;
    bool        paused      = false;
};

struct QueueEntryInfo {
    std::string channel;
    std::string unique_id;
    std::string caller_id_num;
    std::string caller_id_name;
    int         position = 0;   // 1-based
};

struct AsteriskQueue {
    std::string name;
    std::string strategy;
    int         max        = 0;
    int         calls      = 0;
    int         hold_time  = 0;
    int         completed  = 0;
    int         abandoned  = 0;
    int         service_level = 0;
    double      service_level_perf = 0.0;
    int         weight     = 0;
    std::vector<QueueMemberInfo> members;
    std::vector<QueueEntryInfo>  entries;   // Ordered by position
};

// Registry of queues. QueueParams creates a queue; member, entry, Join and
// Leave events for a queue that was never announced are dropped.
// Readers get value copies.
class QueueManager {
public:
    QueueManager() = default;

    void handle_queue_params_event(const QueueParamsEvent& event);
    void handle_queue_member_event(const QueueMemberEvent& event);
    void handle_queue_entry_event(const QueueEntryEvent& event);
    void handle_join_event(const JoinEvent& event);
    void handle_leave_event(const LeaveEvent& event);

    std::vector<AsteriskQueue> get_queues() const;
    std::optional<AsteriskQueue> get_queue(const std::string& name) const;
    size_t queue_count() const;

    void clear();

    struct Stats {
        std::atomic<uint64_t> unknown_queue_events{0};
    };
    const Stats& stats() const { return stats_; }

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

private:
    AsteriskQueue* find_locked(const std::string& name, const char* event_name);
    static void upsert_entry(AsteriskQueue& queue, const QueueEntryInfo& entry);

    mutable std::mutex mu_;
    std::map<std::string, AsteriskQueue> queues_;
    Stats stats_;
};

} // namespace asterisk_live
#endif // LIVE_QUEUE_MANAGER_H

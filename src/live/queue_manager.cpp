// =============================================================================
// FILE: src/live/queue_manager.cpp
// =============================================================================
#include "live/queue_manager.h"
#include "common/logger.h"
#include <algorithm>

namespace asterisk_live {

AsteriskQueue* QueueManager::find_locked(const std::string& name, const char* event_name) {
    auto it = queues_.find(name);
    if (it != queues_.end()) return &it->second;
    stats_.unknown_queue_events.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("QueueManager: %s for unknown queue '%s' ignored", event_name, name.c_str());
    return nullptr;
}

// Same channel again moves the entry; positions stay 1..n in order
void QueueManager::upsert_entry(AsteriskQueue& queue, const QueueEntryInfo& entry) {
    auto& entries = queue.entries;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                      [&](const QueueEntryInfo& e) { return e.channel == entry.channel; }),
                  entries.end());

    size_t pos = entry.position > 0 ? static_cast<size_t>(entry.position - 1) : entries.size();
    if (pos > entries.size()) pos = entries.size();
    entries.insert(entries.begin() + static_cast<std::ptrdiff_t>(pos), entry);

    for (size_t i = 0; i < entries.size(); ++i) entries[i].position = static_cast<int>(i + 1);
}

void QueueManager::handle_queue_params_event(const QueueParamsEvent& event) {
    if (event.queue.empty()) return;
    std::lock_guard<std::mutex> lk(mu_);
    AsteriskQueue& q = queues_[event.queue];
    q.name               = event.queue;
    q.strategy           = event.strategy;
    q.max                = event.max;
    q.calls              = event.calls;
    q.hold_time          = event.hold_time;
    q.completed          = event.completed;
    q.abandoned          = event.abandoned;
    q.service_level      = event.service_level;
    q.service_level_perf = event.service_level_perf;
    q.weight             = event.weight;
}

void QueueManager::handle_queue_member_event(const QueueMemberEvent& event) {
    std::lock_guard<std::mutex> lk(mu_);
    AsteriskQueue* q = find_locked(event.queue, "QueueMember");
    if (!q) return;

    QueueMemberInfo info;
    info.location    = event.location;
    info.name        = event.name;
    info.membership  = event.membership;
    info.penalty     = event.penalty;
    info.calls_taken = event.calls_taken;
    info.last_call   = event.last_call;
    info.status      = event.status;
    info.paused      = event.paused;

    for (auto& m : q->members) {
        if (m.location == info.location) { m = info; return; }
    }
    q->members.push_back(std::move(info));
}

void QueueManager::handle_queue_entry_event(const QueueEntryEvent& event) {
    std::lock_guard<std::mutex> lk(mu_);
    AsteriskQueue* q = find_locked(event.queue, "QueueEntry");
    if (!q) return;
    upsert_entry(*q, {event.channel, event.unique_id, event.caller_id_num,
                      event.caller_id_name, event.position});
}

void QueueManager::handle_join_event(const JoinEvent& event) {
    std::lock_guard<std::mutex> lk(mu_);
    AsteriskQueue* q = find_locked(event.queue, "Join");
    if (!q) return;
    upsert_entry(*q, {event.channel, event.unique_id, event.caller_id_num,
                      event.caller_id_name, event.position});
    q->calls = static_cast<int>(q->entries.size());
    LOG_DEBUG("QueueManager: %s joined %s at %d", event.channel.c_str(),
              event.queue.c_str(), event.position);
}

void QueueManager::handle_leave_event(const LeaveEvent& event) {
    std::lock_guard<std::mutex> lk(mu_);
    AsteriskQueue* q = find_locked(event.queue, "Leave");
    if (!q) return;

    auto& entries = q->entries;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                      [&](const QueueEntryInfo& e) { return e.channel == event.channel; }),
                  entries.end());
    for (size_t i = 0; i < entries.size(); ++i) entries[i].position = static_cast<int>(i + 1);
    q->calls = static_cast<int>(entries.size());
    LOG_DEBUG("QueueManager: %s left %s", event.channel.c_str(), event.queue.c_str());
}

std::vector<AsteriskQueue> QueueManager::get_queues() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<AsteriskQueue> out;
    out.reserve(queues_.size());
    for (const auto& kv : queues_) out.push_back(kv.second);
    return out;
}

std::optional<AsteriskQueue> QueueManager::get_queue(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = queues_.find(name);
    if (it == queues_.end()) return std::nullopt;
    return it->second;
}

size_t QueueManager::queue_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queues_.size();
}

void QueueManager::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    LOG_INFO("QueueManager: clearing %zu queues", queues_.size());
    queues_.clear();
}

} // namespace asterisk_live

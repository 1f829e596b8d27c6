// =============================================================================
// FILE: include/persistence/call_record_store.h
// =============================================================================
#ifndef CALL_RECORD_STORE_H
#define CALL_RECORD_STORE_H

#include "common/types.h"
#include "common/config.h"
#include "persistence/call_record.h"
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <string>
#include <vector>

namespace asterisk_live {

class MongoClient;

// Persists a CallRecord for every channel the live registry hangs up.
//
// The hangup callback runs on the event delivery thread, so queue_record()
// only appends under a mutex. A writer thread upserts the queue by
// unique_id in one bulk write per mongodb.sync_interval_sec, or sooner once
// mongodb.batch_size records are waiting. A failed bulk write is put back
// at the head of the queue; past ten batches' worth the oldest records are
// dropped and counted. stop() drains whatever is left.
class CallRecordStore {
public:
    CallRecordStore(const Config& config, std::shared_ptr<MongoClient> mongo);
    ~CallRecordStore();

    // With persistence disabled this is a no-op returning kOk
    Result start();
    void stop();

    void queue_record(const CallRecord& record);

    // Bypasses the queue
    Result save_immediately(const CallRecord& record);
    Result load_call_record(const std::string& unique_id, CallRecord& out);

    bool is_enabled() const { return enabled_; }
    size_t max_backlog() const { return config_.mongo_batch_size * 10; }

    struct Stats {
        std::atomic<uint64_t> records_queued{0};
        std::atomic<uint64_t> records_written{0};
        std::atomic<uint64_t> records_dropped{0};
        std::atomic<uint64_t> records_loaded{0};
        std::atomic<uint64_t> bulk_writes{0};
        std::atomic<uint64_t> write_failures{0};
        std::atomic<uint64_t> queue_depth{0};
    };
    const Stats& stats() const { return stats_; }

    CallRecordStore(const CallRecordStore&) = delete;
    CallRecordStore& operator=(const CallRecordStore&) = delete;

private:
    void writer_loop();
    void drain_queue();
    Result bulk_upsert(const std::vector<CallRecord>& batch);

    Config config_;
    std::shared_ptr<MongoClient> mongo_;
    const bool enabled_;

    std::thread writer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex pending_mu_;
    std::condition_variable pending_cv_;
    std::vector<CallRecord> pending_;

    Stats stats_;
};

} // namespace asterisk_live
#endif // CALL_RECORD_STORE_H

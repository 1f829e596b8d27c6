// =============================================================================
// FILE: include/persistence/mongo_client.h
// =============================================================================
#ifndef MONGO_CLIENT_H
#define MONGO_CLIENT_H

#include "common/types.h"
#include "common/config.h"
#include <memory>
#include <atomic>
#include <string>

// The driver headers stay out of this header
namespace mongocxx { inline namespace v_noabi {
    class pool;
    class collection;
}}

namespace asterisk_live {

// Connection pool for the call records database. Writers borrow a client
// per batch through lease().
class MongoClient {
public:
    explicit MongoClient(const Config& config);
    ~MongoClient();

    // Creates the pool and pings the database
    Result connect();
    void disconnect();
    bool is_connected() const { return connected_.load(std::memory_order_acquire); }

    // unique_id (unique), end_time, and service_id + end_time on the calls
    // collection. Safe to repeat; existing indexes are left alone.
    Result ensure_call_indexes();

    // A pooled client, handed back when the lease goes out of scope
    class Lease {
    public:
        ~Lease();
        Lease(Lease&&) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        bool valid() const { return entry_ != nullptr; }
        mongocxx::collection calls();

    private:
        friend class MongoClient;
        struct Entry;
        explicit Lease(MongoClient& owner);

        MongoClient& owner_;
        std::unique_ptr<Entry> entry_;
    };

    Lease lease();

    struct MongoStats {
        std::atomic<uint64_t> operations{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> latency_total_ms{0};
    };
    const MongoStats& stats() const { return stats_; }
    double average_latency_ms() const;

    void record_operation(Millisecs latency, bool ok);

    MongoClient(const MongoClient&) = delete;
    MongoClient& operator=(const MongoClient&) = delete;

private:
    std::string uri_;
    std::string database_;
    std::string calls_collection_;

    std::unique_ptr<mongocxx::pool> pool_;
    std::atomic<bool> connected_{false};
    MongoStats stats_;
};

} // namespace asterisk_live
#endif // MONGO_CLIENT_H

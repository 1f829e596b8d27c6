// =============================================================================
// FILE: src/persistence/mongo_client.cpp
// =============================================================================
#include "persistence/mongo_client.h"
#include "common/logger.h"

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <bsoncxx/builder/stream/document.hpp>

namespace asterisk_live {

using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;

MongoClient::MongoClient(const Config& config)
    : uri_(config.mongo_uri)
    , database_(config.mongo_database)
    , calls_collection_(config.mongo_collection_calls)
{}

MongoClient::~MongoClient() { disconnect(); }

Result MongoClient::connect() {
    // The driver allows exactly one instance per process
    static mongocxx::instance driver{};

    try {
        pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri{uri_});
        auto client = pool_->acquire();
        (*client)[database_].run_command(document{} << "ping" << 1 << finalize);
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB: connect to %s failed: %s", uri_.c_str(), e.what());
        pool_.reset();
        return Result::kPersistenceError;
    }

    connected_.store(true, std::memory_order_release);
    LOG_INFO("MongoDB: connected to %s/%s", uri_.c_str(), database_.c_str());
    return Result::kOk;
}

void MongoClient::disconnect() {
    if (connected_.exchange(false)) LOG_INFO("MongoDB: disconnected");
    pool_.reset();
}

Result MongoClient::ensure_call_indexes() {
    auto l = lease();
    if (!l.valid()) return Result::kPersistenceError;

    ScopedTimer timer;
    try {
        auto coll = l.calls();

        mongocxx::options::index unique;
        unique.unique(true);
        coll.create_index(document{} << "unique_id" << 1 << finalize, unique);
        coll.create_index(document{} << "end_time" << -1 << finalize);
        coll.create_index(document{} << "service_id" << 1 << "end_time" << -1 << finalize);
    } catch (const mongocxx::exception& e) {
        record_operation(timer.elapsed_ms(), false);
        LOG_WARN("MongoDB: index setup on %s failed: %s", calls_collection_.c_str(), e.what());
        return Result::kPersistenceError;
    }

    record_operation(timer.elapsed_ms(), true);
    LOG_DEBUG("MongoDB: indexes ready on %s", calls_collection_.c_str());
    return Result::kOk;
}

void MongoClient::record_operation(Millisecs latency, bool ok) {
    stats_.operations.fetch_add(1, std::memory_order_relaxed);
    stats_.latency_total_ms.fetch_add(static_cast<uint64_t>(latency.count()),
                                      std::memory_order_relaxed);
    if (!ok) stats_.errors.fetch_add(1, std::memory_order_relaxed);
}

double MongoClient::average_latency_ms() const {
    uint64_t ops = stats_.operations.load(std::memory_order_relaxed);
    if (ops == 0) return 0.0;
    return static_cast<double>(stats_.latency_total_ms.load(std::memory_order_relaxed)) /
           static_cast<double>(ops);
}

// -----------------------------------------------------------------------------
// Lease
// -----------------------------------------------------------------------------

struct MongoClient::Lease::Entry {
    mongocxx::pool::entry client;
};

MongoClient::Lease::Lease(MongoClient& owner) : owner_(owner) {
    if (!owner_.pool_ || !owner_.is_connected()) return;
    try {
        entry_ = std::make_unique<Entry>(Entry{owner_.pool_->acquire()});
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB: no client available: %s", e.what());
        entry_.reset();
    }
}

MongoClient::Lease::~Lease() = default;
MongoClient::Lease::Lease(Lease&&) noexcept = default;

mongocxx::collection MongoClient::Lease::calls() {
    return (*entry_->client)[owner_.database_][owner_.calls_collection_];
}

MongoClient::Lease MongoClient::lease() {
    return Lease(*this);
}

} // namespace asterisk_live

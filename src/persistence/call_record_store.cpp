// =============================================================================
// FILE: src/persistence/call_record_store.cpp
// =============================================================================
#include "persistence/call_record_store.h"
#include "persistence/mongo_client.h"
#include "common/logger.h"

#include <mongocxx/bulk_write.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/model/update_one.hpp>
#include <mongocxx/options/update.hpp>
#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/string/to_string.hpp>
#include <bsoncxx/types.hpp>

namespace asterisk_live {

namespace {

using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;

bsoncxx::document::value make_filter(const std::string& unique_id) {
    return document{} << "unique_id" << unique_id << finalize;
}

bsoncxx::document::value make_update(const CallRecord& rec, const std::string& service_id) {
    auto fields = document{}
        << "unique_id"         << rec.unique_id
        << "channel"           << rec.channel
        << "caller_id_num"     << rec.caller_id_num
        << "caller_id_name"    << rec.caller_id_name
        << "account_code"      << rec.account_code
        << "last_context"      << rec.last_context
        << "last_extension"    << rec.last_extension
        << "linked_channel"    << rec.linked_channel
        << "hangup_cause"      << static_cast<int32_t>(rec.hangup_cause)
        << "hangup_cause_text" << rec.hangup_cause_text
        << "start_time"        << bsoncxx::types::b_date{rec.start_time}
        << "end_time"          << bsoncxx::types::b_date{rec.end_time}
        << "duration_ms"       << static_cast<int64_t>(rec.duration.count())
        << "service_id"        << service_id
        << finalize;
    return document{} << "$set" << bsoncxx::types::b_document{fields.view()} << finalize;
}

std::string get_string(const bsoncxx::document::view& v, const char* key) {
    auto el = v[key];
    if (!el || el.type() != bsoncxx::type::k_utf8) return "";
    return bsoncxx::string::to_string(el.get_utf8().value);
}

WallTimePoint get_date(const bsoncxx::document::view& v, const char* key) {
    auto el = v[key];
    if (!el || el.type() != bsoncxx::type::k_date) return WallTimePoint{};
    return WallTimePoint(el.get_date().value);
}

} // namespace

CallRecordStore::CallRecordStore(const Config& config, std::shared_ptr<MongoClient> mongo)
    : config_(config), mongo_(std::move(mongo)), enabled_(config.mongo_enable_persistence)
{}

CallRecordStore::~CallRecordStore() { stop(); }

Result CallRecordStore::start() {
    if (!enabled_) { LOG_INFO("CallStore: persistence disabled"); return Result::kOk; }
    if (!mongo_ || !mongo_->is_connected()) return Result::kPersistenceError;
    if (mongo_->ensure_call_indexes() != Result::kOk)
        LOG_WARN("CallStore: continuing without indexes on %s", config_.mongo_collection_calls.c_str());

    stopping_.store(false); running_.store(true);
    writer_ = std::thread(&CallRecordStore::writer_loop, this);

    LOG_INFO("CallStore started (sync=%lds, batch=%zu, collection=%s)",
             static_cast<long>(config_.mongo_sync_interval.count()), config_.mongo_batch_size,
             config_.mongo_collection_calls.c_str());
    return Result::kOk;
}

void CallRecordStore::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(pending_mu_); stopping_.store(true); }
    pending_cv_.notify_one();
    if (writer_.joinable()) writer_.join();
    drain_queue();
    running_.store(false);
    LOG_INFO("CallStore stopped");
}

void CallRecordStore::queue_record(const CallRecord& record) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lk(pending_mu_);
    pending_.push_back(record);
    stats_.records_queued.fetch_add(1, std::memory_order_relaxed);
    stats_.queue_depth.store(pending_.size(), std::memory_order_relaxed);
    if (pending_.size() >= config_.mongo_batch_size) pending_cv_.notify_one();
}

Result CallRecordStore::save_immediately(const CallRecord& record) {
    if (!enabled_ || !mongo_ || !mongo_->is_connected()) return Result::kOk;

    ScopedTimer timer;
    auto client = mongo_->lease();
    if (!client.valid()) return Result::kPersistenceError;

    try {
        mongocxx::options::update opts;
        opts.upsert(true);
        auto coll = client.calls();
        coll.update_one(make_filter(record.unique_id).view(),
                        make_update(record, config_.service_id).view(), opts);
    } catch (const mongocxx::exception& e) {
        stats_.write_failures.fetch_add(1, std::memory_order_relaxed);
        mongo_->record_operation(timer.elapsed_ms(), false);
        LOG_ERROR("CallStore: upsert failed for %s: %s", record.unique_id.c_str(), e.what());
        return Result::kPersistenceError;
    }

    stats_.records_written.fetch_add(1, std::memory_order_relaxed);
    mongo_->record_operation(timer.elapsed_ms(), true);
    return Result::kOk;
}

Result CallRecordStore::bulk_upsert(const std::vector<CallRecord>& batch) {
    if (!mongo_ || !mongo_->is_connected()) return Result::kPersistenceError;

    ScopedTimer timer;
    auto client = mongo_->lease();
    if (!client.valid()) return Result::kPersistenceError;

    try {
        auto coll = client.calls();
        auto bulk = coll.create_bulk_write();
        for (const auto& rec : batch) {
            mongocxx::model::update_one op{make_filter(rec.unique_id),
                                           make_update(rec, config_.service_id)};
            op.upsert(true);
            bulk.append(op);
        }
        bulk.execute();
    } catch (const mongocxx::exception& e) {
        stats_.write_failures.fetch_add(1, std::memory_order_relaxed);
        mongo_->record_operation(timer.elapsed_ms(), false);
        LOG_ERROR("CallStore: batch of %zu failed: %s", batch.size(), e.what());
        return Result::kPersistenceError;
    }

    stats_.records_written.fetch_add(batch.size(), std::memory_order_relaxed);
    mongo_->record_operation(timer.elapsed_ms(), true);
    return Result::kOk;
}

Result CallRecordStore::load_call_record(const std::string& unique_id, CallRecord& out) {
    if (!enabled_ || !mongo_ || !mongo_->is_connected()) return Result::kNotFound;

    ScopedTimer timer;
    auto client = mongo_->lease();
    if (!client.valid()) return Result::kPersistenceError;

    try {
        auto coll = client.calls();
        auto doc = coll.find_one(make_filter(unique_id).view());
        mongo_->record_operation(timer.elapsed_ms(), true);
        if (!doc) return Result::kNotFound;

        auto v = doc->view();
        out.unique_id         = get_string(v, "unique_id");
        out.channel           = get_string(v, "channel");
        out.caller_id_num     = get_string(v, "caller_id_num");
        out.caller_id_name    = get_string(v, "caller_id_name");
        out.account_code      = get_string(v, "account_code");
        out.last_context      = get_string(v, "last_context");
        out.last_extension    = get_string(v, "last_extension");
        out.linked_channel    = get_string(v, "linked_channel");
        out.hangup_cause_text = get_string(v, "hangup_cause_text");
        out.start_time        = get_date(v, "start_time");
        out.end_time          = get_date(v, "end_time");

        auto cause = v["hangup_cause"];
        out.hangup_cause = (cause && cause.type() == bsoncxx::type::k_int32)
                           ? cause.get_int32().value : 0;
        auto duration = v["duration_ms"];
        out.duration = (duration && duration.type() == bsoncxx::type::k_int64)
                       ? Millisecs(duration.get_int64().value) : Millisecs(0);
    } catch (const mongocxx::exception& e) {
        stats_.write_failures.fetch_add(1, std::memory_order_relaxed);
        mongo_->record_operation(timer.elapsed_ms(), false);
        LOG_ERROR("CallStore: load failed for %s: %s", unique_id.c_str(), e.what());
        return Result::kPersistenceError;
    }

    stats_.records_loaded.fetch_add(1, std::memory_order_relaxed);
    return Result::kOk;
}

void CallRecordStore::writer_loop() {
    while (!stopping_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lk(pending_mu_);
            pending_cv_.wait_for(lk, config_.mongo_sync_interval, [this] {
                return stopping_.load() || pending_.size() >= config_.mongo_batch_size;
            });
        }
        if (stopping_.load()) break;
        drain_queue();
    }
}

void CallRecordStore::drain_queue() {
    std::vector<CallRecord> batch;
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        batch.swap(pending_);
        stats_.queue_depth.store(0, std::memory_order_relaxed);
    }
    if (batch.empty()) return;

    ScopedTimer timer;
    if (bulk_upsert(batch) != Result::kOk) {
        std::lock_guard<std::mutex> lk(pending_mu_);
        pending_.insert(pending_.begin(), batch.begin(), batch.end());
        if (pending_.size() > max_backlog()) {
            size_t excess = pending_.size() - max_backlog();
            pending_.erase(pending_.begin(),
                           pending_.begin() + static_cast<std::ptrdiff_t>(excess));
            stats_.records_dropped.fetch_add(excess, std::memory_order_relaxed);
            LOG_ERROR("CallStore: backlog full, dropped %zu oldest call records", excess);
        }
        stats_.queue_depth.store(pending_.size(), std::memory_order_relaxed);
        return;
    }

    stats_.bulk_writes.fetch_add(1, std::memory_order_relaxed);
    long ms = static_cast<long>(timer.elapsed_ms().count());
    if (ms > 100) LOG_WARN("CallStore: upsert of %zu records took %ldms", batch.size(), ms);
}

} // namespace asterisk_live

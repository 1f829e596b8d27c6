// =============================================================================
// FILE: src/common/slow_event_logger.cpp
// =============================================================================
#include "common/slow_event_logger.h"
#include "common/logger.h"

namespace asterisk_live {

const char* timed_stage_name(TimedStage stage) {
    switch (stage) {
        case TimedStage::kDispatch: return "DISPATCH";
        case TimedStage::kSnapshot: return "SNAPSHOT";
        case TimedStage::kAction:   return "ACTION";
    }
    return "UNKNOWN";
}

SlowEventLogger::SlowEventLogger(const Config& config)
    : warn_ms_(config.slow_event_warn_threshold.count())
    , error_ms_(config.slow_event_error_threshold.count())
    , critical_ms_(config.slow_event_critical_threshold.count())
{}

void SlowEventLogger::set_thresholds(const Thresholds& t) {
    warn_ms_.store(t.warn.count(), std::memory_order_relaxed);
    error_ms_.store(t.error.count(), std::memory_order_relaxed);
    critical_ms_.store(t.critical.count(), std::memory_order_relaxed);
    LOG_INFO("SlowEventLogger: warn=%ldms error=%ldms critical=%ldms",
             static_cast<long>(t.warn.count()), static_cast<long>(t.error.count()),
             static_cast<long>(t.critical.count()));
}

SlowEventLogger::Thresholds SlowEventLogger::thresholds() const {
    return {Millisecs(warn_ms_.load(std::memory_order_relaxed)),
            Millisecs(error_ms_.load(std::memory_order_relaxed)),
            Millisecs(critical_ms_.load(std::memory_order_relaxed))};
}

std::atomic<uint64_t>& SlowEventLogger::slow_counter(TimedStage stage) {
    switch (stage) {
        case TimedStage::kSnapshot: return stats_.slow_snapshots;
        case TimedStage::kAction:   return stats_.slow_actions;
        case TimedStage::kDispatch: break;
    }
    return stats_.slow_dispatches;
}

void SlowEventLogger::record(TimedStage stage, const std::string& subject, Millisecs elapsed) {
    const int64_t ms = elapsed.count() < 0 ? 0 : elapsed.count();
    const char* stage_name = timed_stage_name(stage);
    stats_.timed_count.fetch_add(1, std::memory_order_relaxed);

    uint64_t seen = stats_.max_duration_ms.load(std::memory_order_relaxed);
    while (static_cast<uint64_t>(ms) > seen &&
           !stats_.max_duration_ms.compare_exchange_weak(seen, static_cast<uint64_t>(ms),
                                                         std::memory_order_relaxed)) {
    }

    {
        std::lock_guard<std::mutex> lk(slowest_mu_);
        if (!slowest_ || ms > slowest_->elapsed.count())
            slowest_ = Sample{stage, subject, Millisecs(ms)};
    }

    if (ms < warn_ms_.load(std::memory_order_relaxed)) return;
    slow_counter(stage).fetch_add(1, std::memory_order_relaxed);

    if (ms >= critical_ms_.load(std::memory_order_relaxed)) {
        stats_.critical_count.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("SLOW %s CRITICAL: %s took %ldms", stage_name, subject.c_str(),
                  static_cast<long>(ms));
    } else if (ms >= error_ms_.load(std::memory_order_relaxed)) {
        stats_.error_count.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("SLOW %s: %s took %ldms", stage_name, subject.c_str(), static_cast<long>(ms));
    } else {
        stats_.warn_count.fetch_add(1, std::memory_order_relaxed);
        LOG_SLOW("%s %s took %ldms", stage_name, subject.c_str(), static_cast<long>(ms));
    }
}

std::optional<SlowEventLogger::Sample> SlowEventLogger::slowest() const {
    std::lock_guard<std::mutex> lk(slowest_mu_);
    return slowest_;
}

SlowEventLogger::Timer::Timer(SlowEventLogger& owner, TimedStage stage, std::string subject)
    : owner_(owner), stage_(stage), subject_(std::move(subject)) {}

void SlowEventLogger::Timer::finish() {
    if (done_) return;
    done_ = true;
    owner_.record(stage_, subject_, clock_.elapsed_ms());
}

} // namespace asterisk_live

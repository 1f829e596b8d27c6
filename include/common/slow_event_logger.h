// =============================================================================
// FILE: include/common/slow_event_logger.h
// =============================================================================
#ifndef SLOW_EVENT_LOGGER_H
#define SLOW_EVENT_LOGGER_H

#include "common/types.h"
#include "common/config.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace asterisk_live {

// Where the time was spent
enum class TimedStage {
    kDispatch,   // One live event through the registries (delivery thread)
    kSnapshot,   // Status / QueueStatus reload
    kAction,     // Synchronous request/response action
};

const char* timed_stage_name(TimedStage stage);

// Reports manager work that overran its budget.
//
//   SlowEventLogger::Timer t(slow, TimedStage::kDispatch, event.name);
//
//   >= warn      LOG_SLOW
//   >= error     LOG_ERROR
//   >= critical  LOG_ERROR, counted as critical
//
// A slow dispatch holds up every listener behind it, so the
// defaults are tight.
class SlowEventLogger {
public:
    struct Thresholds {
        Millisecs warn;
        Millisecs error;
        Millisecs critical;
    };

    struct Sample {
        TimedStage  stage;
        std::string subject;
        Millisecs   elapsed;
    };

    struct Stats {
        std::atomic<uint64_t> timed_count{0};
        std::atomic<uint64_t> warn_count{0};
        std::atomic<uint64_t> error_count{0};
        std::atomic<uint64_t> critical_count{0};
        std::atomic<uint64_t> max_duration_ms{0};
        // Anything at or over warn, by stage
        std::atomic<uint64_t> slow_dispatches{0};
        std::atomic<uint64_t> slow_snapshots{0};
        std::atomic<uint64_t> slow_actions{0};
    };

    explicit SlowEventLogger(const Config& config);

    void set_thresholds(const Thresholds& t);
    Thresholds thresholds() const;

    // Accounts for one finished operation
    void record(TimedStage stage, const std::string& subject, Millisecs elapsed);

    // Worst operation seen so far, if any was timed
    std::optional<Sample> slowest() const;

    const Stats& stats() const { return stats_; }

    class Timer {
    public:
        Timer(SlowEventLogger& owner, TimedStage stage, std::string subject);
        ~Timer() { finish(); }

        void finish();
        Millisecs elapsed() const { return clock_.elapsed_ms(); }

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

    private:
        SlowEventLogger& owner_;
        TimedStage stage_;
        std::string subject_;
        ScopedTimer clock_;
        bool done_ = false;
    };

private:
    std::atomic<uint64_t>& slow_counter(TimedStage stage);

    std::atomic<int64_t> warn_ms_;
    std::atomic<int64_t> error_ms_;
    std::atomic<int64_t> critical_ms_;
    Stats stats_;

    mutable std::mutex slowest_mu_;
    std::optional<Sample> slowest_;
};

} // namespace asterisk_live
#endif // SLOW_EVENT_LOGGER_H

// =============================================================================
// FILE: include/common/types.h
// =============================================================================
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <cstdint>
#include <chrono>

namespace asterisk_live {

// Event ordering and timeouts use the monotonic clock; only persisted
// timestamps are wall-clock.
using Clock         = std::chrono::steady_clock;
using TimePoint     = Clock::time_point;
using WallClock     = std::chrono::system_clock;
using WallTimePoint = WallClock::time_point;
using Millisecs     = std::chrono::milliseconds;
using Seconds       = std::chrono::seconds;
using EventId       = uint64_t;

enum class Result {
    kOk,
    kTimeout,               // No response, or completion event never arrived
    kNotFound,
    kInvalidArgument,
    kShuttingDown,
    kConnectionLost,        // Socket gone, or no pool member connected
    kAuthenticationFailed,  // Login answered with Response: Error
    kCommandFailed,         // Action answered with Response: Error
    kPersistenceError
};

inline const char* result_to_string(Result r) {
    switch (r) {
        case Result::kOk:                   return "OK";
        case Result::kTimeout:              return "Timeout";
        case Result::kNotFound:             return "NotFound";
        case Result::kInvalidArgument:      return "InvalidArgument";
        case Result::kShuttingDown:         return "ShuttingDown";
        case Result::kConnectionLost:       return "ConnectionLost";
        case Result::kAuthenticationFailed: return "AuthenticationFailed";
        case Result::kCommandFailed:        return "CommandFailed";
        case Result::kPersistenceError:     return "PersistenceError";
    }
    return "Unknown";
}

// Maps a steady-clock instant in the past onto the wall clock
inline WallTimePoint to_wall_time(TimePoint t) {
    return WallClock::now() -
           std::chrono::duration_cast<WallClock::duration>(Clock::now() - t);
}

class ScopedTimer {
public:
    ScopedTimer() : start_(Clock::now()) {}
    Millisecs elapsed_ms() const {
        return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
    }
private:
    TimePoint start_;
};

} // namespace asterisk_live
#endif // COMMON_TYPES_H

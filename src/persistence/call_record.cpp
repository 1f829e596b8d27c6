// =============================================================================
// FILE: src/persistence/call_record.cpp
// =============================================================================
#include "persistence/call_record.h"
#include "live/live_channel.h"

namespace asterisk_live {

CallRecord CallRecord::from_channel(const LiveChannel& channel) {
    CallRecord rec;
    rec.unique_id         = channel.unique_id();
    rec.channel           = channel.name();
    rec.caller_id_num     = channel.caller_id_num();
    rec.caller_id_name    = channel.caller_id_name();
    rec.account_code      = channel.account_code();
    rec.linked_channel    = channel.linked_channel();
    rec.hangup_cause      = channel.hangup_cause();
    rec.hangup_cause_text = channel.hangup_cause_text();

    if (auto ext = channel.current_extension()) {
        rec.last_context   = ext->context;
        rec.last_extension = ext->extension;
    }

    TimePoint steady_end = channel.hung_up_at().value_or(Clock::now());
    rec.duration = std::chrono::duration_cast<Millisecs>(steady_end - channel.created_at());
    if (rec.duration.count() < 0) rec.duration = Millisecs(0);

    rec.end_time   = to_wall_time(steady_end);
    rec.start_time = rec.end_time - std::chrono::duration_cast<WallClock::duration>(rec.duration);
    return rec;
}

} // namespace asterisk_live

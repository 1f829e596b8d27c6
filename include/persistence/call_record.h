// =============================================================================
// FILE: include/persistence/call_record.h
// =============================================================================
#ifndef CALL_RECORD_H
#define CALL_RECORD_H

#include "common/types.h"
#include <chrono>
#include <string>

namespace asterisk_live {

class LiveChannel;

// Summary of one finished call leg, written once at hangup
struct CallRecord {
    std::string unique_id;
    std::string channel;
    std::string caller_id_num;
    std::string caller_id_name;
    std::string account_code;
    std::string last_context;
    std::string last_extension;
    std::string linked_channel;
    int         hangup_cause = 0;
    std::string hangup_cause_text;
    WallTimePoint start_time;
    WallTimePoint end_time;
    Millisecs   duration{0};

    // Snapshot of a hung-up channel. Wall-clock times are derived from the
    // channel's steady-clock lifetime, anchored at now.
    static CallRecord from_channel(const LiveChannel& channel);
};

} // namespace asterisk_live
#endif // CALL_RECORD_H

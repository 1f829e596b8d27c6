// =============================================================================
// FILE: include/live/live_channel.h
// =============================================================================
#ifndef LIVE_CHANNEL_H
#define LIVE_CHANNEL_H

#include "common/types.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace asterisk_live {

class ChannelActivityAction;

enum class ChannelState {
    kUnknown, kDown, kReserved, kOffHook, kDialing, kRing, kRinging,
    kUp, kBusy, kDialingOffHook, kPreRing, kHungUp
};

const char* channel_state_to_string(ChannelState s);

// Accepts the text Asterisk sends ("Up", "Ringing", "Rsrvd", ...) or the
// numeric ChannelState value.
ChannelState parse_channel_state(const std::string& s);

struct ExtensionEntry {
    std::string context;
    std::string extension;
    int         priority = 0;
    std::string application;
    std::string app_data;
    TimePoint   entered_at;
};

// Mirror of one call leg on the server. Every accessor locks, so a channel
// obtained from ChannelManager may be read from any thread.
class LiveChannel {
public:
    LiveChannel(std::string unique_id, std::string name);

    const std::string& unique_id() const { return unique_id_; }
    TimePoint created_at() const { return created_at_; }

    std::string name() const;
    void set_name(const std::string& name);

    ChannelState state() const;
    void set_state(ChannelState state);

    std::string caller_id_num() const;
    std::string caller_id_name() const;
    void set_caller_id(const std::string& num, const std::string& name);

    std::string account_code() const;
    void set_account_code(const std::string& code);

    // Appends unless identical to the current extension
    void add_extension(const ExtensionEntry& entry);
    std::optional<ExtensionEntry> current_extension() const;
    std::vector<ExtensionEntry> extension_history() const;

    std::string linked_channel() const;
    std::string linked_unique_id() const;
    void set_linked(const std::string& channel, const std::string& unique_id);
    void clear_linked();

    void set_hangup(int cause, const std::string& cause_text);
    int hangup_cause() const;
    std::string hangup_cause_text() const;
    std::optional<TimePoint> hung_up_at() const;

    std::shared_ptr<ChannelActivityAction> current_activity() const;
    void set_current_activity(std::shared_ptr<ChannelActivityAction> activity);

    LiveChannel(const LiveChannel&) = delete;
    LiveChannel& operator=(const LiveChannel&) = delete;

private:
    const std::string unique_id_;
    const TimePoint created_at_;

    mutable std::mutex mu_;
    std::string name_;
    ChannelState state_ = ChannelState::kUnknown;
    std::string caller_id_num_;
    std::string caller_id_name_;
    std::string account_code_;
    std::vector<ExtensionEntry> extensions_;
    std::string linked_channel_;
    std::string linked_unique_id_;
    int hangup_cause_ = 0;
    std::string hangup_cause_text_;
    std::optional<TimePoint> hung_up_at_;
    std::shared_ptr<ChannelActivityAction> current_activity_;
};

} // namespace asterisk_live
#endif // LIVE_CHANNEL_H

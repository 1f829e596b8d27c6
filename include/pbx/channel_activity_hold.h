// =============================================================================
// FILE: include/pbx/channel_activity_hold.h
// =============================================================================
#ifndef PBX_CHANNEL_ACTIVITY_HOLD_H
#define PBX_CHANNEL_ACTIVITY_HOLD_H

#include "pbx/cancellation_gate.h"
#include "pbx/channel_activity_action.h"

namespace asterisk_live {

// Parks the AGI script until cancelled. Used as a marker while another
// action owns the channel (e.g. during a blind transfer dial).
class ChannelActivityHold : public ChannelActivityAction {
public:
    explicit ChannelActivityHold(Millisecs poll_interval = Millisecs(1000));

    Result execute(AgiChannel& channel, LiveChannel& live_channel) override;
    bool is_disconnect() const override { return false; }
    void cancel(LiveChannel& live_channel) override;

    bool is_cancelled() const { return gate_.is_cancelled(); }

private:
    Millisecs poll_interval_;
    CancellationGate gate_;
};

} // namespace asterisk_live
#endif // PBX_CHANNEL_ACTIVITY_HOLD_H

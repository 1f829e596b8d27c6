// =============================================================================
// FILE: include/pbx/channel_activity_action.h
// =============================================================================
#ifndef PBX_CHANNEL_ACTIVITY_ACTION_H
#define PBX_CHANNEL_ACTIVITY_ACTION_H

#include "common/types.h"

namespace asterisk_live {

class AgiChannel;
class LiveChannel;

// What the AGI script is currently doing with a channel. Installed as the
// channel's current activity so other logic does not drive it concurrently.
class ChannelActivityAction {
public:
    virtual ~ChannelActivityAction() = default;

    virtual Result execute(AgiChannel& channel, LiveChannel& live_channel) = 0;

    // True if executing this action ends the AGI session
    virtual bool is_disconnect() const = 0;

    virtual void cancel(LiveChannel& live_channel) = 0;
};

} // namespace asterisk_live
#endif // PBX_CHANNEL_ACTIVITY_ACTION_H

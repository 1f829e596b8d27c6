// =============================================================================
// FILE: src/pbx/channel_activity_hold.cpp
// =============================================================================
#include "pbx/channel_activity_hold.h"
#include "live/live_channel.h"
#include "common/logger.h"

namespace asterisk_live {

ChannelActivityHold::ChannelActivityHold(Millisecs poll_interval)
    : poll_interval_(poll_interval)
{}

Result ChannelActivityHold::execute(AgiChannel&, LiveChannel& live_channel) {
    LOG_DEBUG("Hold: holding %s", live_channel.name().c_str());
    while (!gate_.wait_for(poll_interval_)) {
        if (live_channel.state() == ChannelState::kHungUp) {
            LOG_DEBUG("Hold: %s hung up while held", live_channel.name().c_str());
            return Result::kConnectionLost;
        }
    }
    return Result::kOk;
}

void ChannelActivityHold::cancel(LiveChannel& live_channel) {
    if (gate_.signal())
        LOG_DEBUG("Hold: released %s", live_channel.name().c_str());
}

} // namespace asterisk_live

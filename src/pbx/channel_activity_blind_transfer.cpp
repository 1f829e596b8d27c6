// =============================================================================
// FILE: src/pbx/channel_activity_blind_transfer.cpp
// =============================================================================
#include "pbx/channel_activity_blind_transfer.h"
#include "pbx/agi_channel.h"
#include "pbx/channel_activity_hold.h"
#include "live/live_channel.h"
#include "common/logger.h"
#include <memory>

namespace asterisk_live {

ChannelActivityBlindTransfer::ChannelActivityBlindTransfer(std::string target,
                                                           std::string sip_header)
    : target_(std::move(target))
    , sip_header_(std::move(sip_header))
{}

Result ChannelActivityBlindTransfer::execute(AgiChannel& channel, LiveChannel& live_channel) {
    Result r = channel.set_variable("__SIPADDHEADER", sip_header_);
    if (r != Result::kOk) {
        LOG_WARN("BlindTransfer: set __SIPADDHEADER on %s failed: %s",
                 live_channel.name().c_str(), result_to_string(r));
        return r;
    }

    live_channel.set_current_activity(std::make_shared<ChannelActivityHold>());

    LOG_INFO("BlindTransfer: %s -> %s (timeout %lds)", live_channel.name().c_str(),
             target_.c_str(), static_cast<long>(timeout_.count()));

    // The gate is not consulted here; see class comment
    r = channel.dial(target_, timeout_, "");
    if (r != Result::kOk)
        LOG_WARN("BlindTransfer: dial %s failed: %s", target_.c_str(), result_to_string(r));
    return r;
}

void ChannelActivityBlindTransfer::cancel(LiveChannel& live_channel) {
    if (gate_.signal())
        LOG_INFO("BlindTransfer: cancel requested for %s (dial not interrupted)",
                 live_channel.name().c_str());
}

} // namespace asterisk_live

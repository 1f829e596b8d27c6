// =============================================================================
// FILE: include/pbx/channel_activity_blind_transfer.h
// =============================================================================
#ifndef PBX_CHANNEL_ACTIVITY_BLIND_TRANSFER_H
#define PBX_CHANNEL_ACTIVITY_BLIND_TRANSFER_H

#include "pbx/cancellation_gate.h"
#include "pbx/channel_activity_action.h"
#include <string>

namespace asterisk_live {

// Blind transfer of one call leg: sets __SIPADDHEADER (inherited by the
// outbound leg), marks the channel as held, then dials the target.
//
// cancel() is advisory. It opens the gate but does not interrupt a dial that
// is already running, and a cancel() before execute() does not prevent the
// dial either.
class ChannelActivityBlindTransfer : public ChannelActivityAction {
public:
    static constexpr Seconds kDialTimeout{30};

    // target: fully qualified dial string, e.g. "SIP/1001@pbx"
    ChannelActivityBlindTransfer(std::string target, std::string sip_header = "");

    Result execute(AgiChannel& channel, LiveChannel& live_channel) override;
    bool is_disconnect() const override { return false; }
    void cancel(LiveChannel& live_channel) override;

    const std::string& target() const { return target_; }
    const std::string& sip_header() const { return sip_header_; }
    Seconds timeout() const { return timeout_; }

    const CancellationGate& gate() const { return gate_; }
    CancellationGate& gate() { return gate_; }

private:
    std::string target_;
    std::string sip_header_;
    Seconds timeout_ = kDialTimeout;
    CancellationGate gate_;
};

} // namespace asterisk_live
#endif // PBX_CHANNEL_ACTIVITY_BLIND_TRANSFER_H

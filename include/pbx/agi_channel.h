// =============================================================================
// FILE: include/pbx/agi_channel.h
// =============================================================================
#ifndef PBX_AGI_CHANNEL_H
#define PBX_AGI_CHANNEL_H

#include "common/types.h"
#include <string>

namespace asterisk_live {

// Command side of one call leg under AGI control. Every call blocks until
// Asterisk answers the command.
class AgiChannel {
public:
    virtual ~AgiChannel() = default;

    virtual Result set_variable(const std::string& name, const std::string& value) = 0;

    // Dial application; returns when the dial ends (answered call hung up,
    // no answer within timeout, busy, ...)
    virtual Result dial(const std::string& target, Seconds timeout,
                        const std::string& options) = 0;
};

} // namespace asterisk_live
#endif // PBX_AGI_CHANNEL_H

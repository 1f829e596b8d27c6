// =============================================================================
// FILE: include/live/originate_request.h
// =============================================================================
#ifndef LIVE_ORIGINATE_REQUEST_H
#define LIVE_ORIGINATE_REQUEST_H

#include "common/types.h"
#include "manager/manager_action.h"
#include <map>
#include <string>
#include <variant>

namespace asterisk_live {

struct ExtensionTarget {
    std::string context;
    std::string extension;
    int         priority = 1;
};

struct ApplicationTarget {
    std::string application;
    std::string data;
};

struct OriginateRequest {
    std::string channel;
    std::variant<ExtensionTarget, ApplicationTarget> target;
    std::map<std::string, std::string> variables;
    Millisecs   timeout{30000};
    std::string caller_id;   // Optional

    // kInvalidArgument when channel or the target's mandatory part is empty
    Result validate() const;

    // Always Async: true, completes on the Originate* confirmation event
    ManagerAction to_action() const;
};

} // namespace asterisk_live
#endif // LIVE_ORIGINATE_REQUEST_H

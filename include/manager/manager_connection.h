// =============================================================================
// FILE: include/manager/manager_connection.h
// =============================================================================
#ifndef MANAGER_CONNECTION_H
#define MANAGER_CONNECTION_H

#include "common/types.h"
#include "manager/manager_action.h"
#include "manager/manager_event.h"

namespace asterisk_live {

// Event source and request/response channel to one Asterisk server.
//
// Events are delivered in arrival order on a single delivery thread owned by
// the implementation. Listeners must not add or remove listeners from inside
// on_manager_event().
class ManagerConnection {
public:
    virtual ~ManagerConnection() = default;

    // kOk, kAuthenticationFailed, kTimeout or kConnectionLost
    virtual Result login() = 0;
    virtual bool is_connected() const = 0;

    // Waits up to timeout for the response. kOk means a response arrived
    // (check response.is_success()).
    virtual Result send_action(const ManagerAction& action,
                               ManagerResponse& response,
                               Millisecs timeout) = 0;

    // Waits up to timeout for the response and the completion event.
    // kTimeout leaves the partial batch in result with complete == false.
    // An Error response completes the batch immediately and returns kCommandFailed.
    virtual Result send_event_generating_action(const ManagerAction& action,
                                                ResponseEvents& result,
                                                Millisecs timeout) = 0;

    // Adding the same listener twice is a no-op
    virtual void add_event_listener(ManagerEventListener* listener) = 0;
    virtual void remove_event_listener(ManagerEventListener* listener) = 0;
};

} // namespace asterisk_live
#endif // MANAGER_CONNECTION_H

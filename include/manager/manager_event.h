// =============================================================================
// FILE: include/manager/manager_event.h
// =============================================================================
#ifndef MANAGER_EVENT_H
#define MANAGER_EVENT_H

#include "common/types.h"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace asterisk_live {

// ---------------------------------------------------------------------------
// Connection lifecycle (synthesized by the connection, never sent by Asterisk)
// ---------------------------------------------------------------------------
struct ConnectEvent {
    std::string protocol_identifier;
};

struct DisconnectEvent {
    std::string reason;
};

// ---------------------------------------------------------------------------
// Channel lifecycle
// ---------------------------------------------------------------------------
struct NewChannelEvent {
    std::string channel;
    std::string unique_id;
    std::string state;
    std::string caller_id_num;
    std::string caller_id_name;
    std::string account_code;
    std::string context;
    std::string extension;
};

struct NewExtenEvent {
    std::string channel;
    std::string unique_id;
    std::string context;
    std::string extension;
    int         priority = 0;
    std::string application;
    std::string app_data;
};

struct NewStateEvent {
    std::string channel;
    std::string unique_id;
    std::string state;
    std::string caller_id_num;
    std::string caller_id_name;
};

struct NewCallerIdEvent {
    std::string channel;
    std::string unique_id;
    std::string caller_id_num;
    std::string caller_id_name;
};

struct LinkEvent {
    std::string channel1;
    std::string channel2;
    std::string unique_id1;
    std::string unique_id2;
};

struct UnlinkEvent {
    std::string channel1;
    std::string channel2;
    std::string unique_id1;
    std::string unique_id2;
};

struct RenameEvent {
    std::string old_name;
    std::string new_name;
    std::string unique_id;
};

struct HangupEvent {
    std::string channel;
    std::string unique_id;
    int         cause = 0;
    std::string cause_text;
};

// ---------------------------------------------------------------------------
// Queue membership
// ---------------------------------------------------------------------------
struct JoinEvent {
    std::string queue;
    std::string channel;
    std::string unique_id;
    std::string caller_id_num;
    std::string caller_id_name;
    int         position = 0;
    int         count    = 0;
};

struct LeaveEvent {
    std::string queue;
    std::string channel;
    std::string unique_id;
    int         count = 0;
};

// ---------------------------------------------------------------------------
// Snapshot responses (Status / QueueStatus)
// ---------------------------------------------------------------------------
struct StatusEvent {
    std::string channel;
    std::string unique_id;
    std::string state;
    std::string caller_id_num;
    std::string caller_id_name;
    std::string account_code;
    std::string context;
    std::string extension;
    int         priority = 0;
    std::string link;
    int         seconds  = 0;
};

struct StatusCompleteEvent {
    int items = 0;
};

struct QueueParamsEvent {
    std::string queue;
    int         max        = 0;
    std::string strategy;
    int         calls      = 0;
    int         hold_time  = 0;
    int         completed  = 0;
    int         abandoned  = 0;
    int         service_level = 0;
    double      service_level_perf = 0.0;
    int         weight     = 0;
};

struct QueueMemberEvent {
    std::string queue;
    std::string location;
    std::string name;
    std::string membership;
    int         penalty     = 0;
    int         calls_taken = 0;
    long        last_call   = 0;
    int         status      = 0;
    bool        paused      = false;
};

struct QueueEntryEvent {
    std::string queue;
    int         position = 0;
    std::string channel;
    std::string unique_id;
    std::string caller_id_num;
    std::string caller_id_name;
    long        wait = 0;
};

struct QueueStatusCompleteEvent {};

// ---------------------------------------------------------------------------
// Originate confirmation (OriginateResponse, OriginateSuccess, OriginateFailure)
// ---------------------------------------------------------------------------
struct OriginateResponseEvent {
    bool        success = false;
    std::string channel;
    std::string unique_id;
    std::string context;
    std::string extension;
    std::string application;
    int         reason = 0;
};

// Any event name not modeled above. Fields are kept verbatim.
struct GenericEvent {
    std::vector<std::pair<std::string, std::string>> fields;
};

using EventPayload = std::variant<
    ConnectEvent, DisconnectEvent,
    NewChannelEvent, NewExtenEvent, NewStateEvent, NewCallerIdEvent,
    LinkEvent, UnlinkEvent, RenameEvent, HangupEvent,
    JoinEvent, LeaveEvent,
    StatusEvent, StatusCompleteEvent,
    QueueParamsEvent, QueueMemberEvent, QueueEntryEvent, QueueStatusCompleteEvent,
    OriginateResponseEvent,
    GenericEvent>;

struct ManagerEvent {
    EventId     id = 0;
    std::string name;        // "Newchannel", "Hangup", ... as received
    std::string action_id;   // Set on events answering an action
    TimePoint   received_at;
    EventPayload payload;

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(payload); }
};

// Response to a single action
struct ManagerResponse {
    std::string response;    // "Success", "Error", "Follows", "Goodbye", "Pong"
    std::string message;
    std::string action_id;
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<std::string> output;   // Command output lines

    bool is_success() const;
    std::string get(const char* key) const;
};

// Response plus the events an event-generating action produced.
// complete is false when the completion event never arrived; events then
// holds the partial batch received before the deadline.
struct ResponseEvents {
    ManagerResponse response;
    std::vector<ManagerEvent> events;
    bool complete = false;
};

class ManagerEventListener {
public:
    virtual ~ManagerEventListener() = default;
    virtual void on_manager_event(const ManagerEvent& event) = 0;
};

} // namespace asterisk_live
#endif // MANAGER_EVENT_H

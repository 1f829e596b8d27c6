// =============================================================================
// FILE: src/manager/event_builder.cpp
// =============================================================================
#include "manager/event_builder.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <strings.h>
#include <unordered_map>

namespace asterisk_live {

namespace {

// Numeric header values; anything but a whole in-range decimal gives def
long to_long(const std::string& s, long def = 0) {
    if (s.empty()) return def;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return def;
    return v;
}

int to_int(const std::string& s, int def = 0) {
    long v = to_long(s, def);
    if (v < INT_MIN || v > INT_MAX) return def;
    return static_cast<int>(v);
}

bool to_bool(const std::string& s) {
    return s == "1" || strcasecmp(s.c_str(), "yes") == 0 ||
           strcasecmp(s.c_str(), "true") == 0 || strcasecmp(s.c_str(), "on") == 0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Asterisk 1.6+ says ChannelStateDesc, older servers say State
std::string channel_state(const AmiPacket& p) {
    std::string s = p.get("ChannelStateDesc");
    return s.empty() ? p.get("State") : s;
}

std::string caller_id_num(const AmiPacket& p) {
    std::string s = p.get("CallerIDNum");
    return s.empty() ? p.get("CallerID") : s;
}

std::string unique_id(const AmiPacket& p) { return p.get("Uniqueid"); }

EventPayload make_new_channel(const AmiPacket& p) {
    NewChannelEvent e;
    e.channel        = p.get("Channel");
    e.unique_id      = unique_id(p);
    e.state          = channel_state(p);
    e.caller_id_num  = caller_id_num(p);
    e.caller_id_name = p.get("CallerIDName");
    e.account_code   = p.get("AccountCode");
    e.context        = p.get("Context");
    e.extension      = p.get("Exten");
    return e;
}

EventPayload make_new_exten(const AmiPacket& p) {
    NewExtenEvent e;
    e.channel     = p.get("Channel");
    e.unique_id   = unique_id(p);
    e.context     = p.get("Context");
    e.extension   = p.has("Extension") ? p.get("Extension") : p.get("Exten");
    e.priority    = to_int(p.get("Priority"));
    e.application = p.get("Application");
    e.app_data    = p.get("AppData");
    return e;
}

EventPayload make_new_state(const AmiPacket& p) {
    NewStateEvent e;
    e.channel        = p.get("Channel");
    e.unique_id      = unique_id(p);
    e.state          = channel_state(p);
    e.caller_id_num  = caller_id_num(p);
    e.caller_id_name = p.get("CallerIDName");
    return e;
}

EventPayload make_new_caller_id(const AmiPacket& p) {
    NewCallerIdEvent e;
    e.channel        = p.get("Channel");
    e.unique_id      = unique_id(p);
    e.caller_id_num  = caller_id_num(p);
    e.caller_id_name = p.get("CallerIDName");
    return e;
}

EventPayload make_link(const AmiPacket& p) {
    return LinkEvent{p.get("Channel1"), p.get("Channel2"),
                     p.get("Uniqueid1"), p.get("Uniqueid2")};
}

EventPayload make_unlink(const AmiPacket& p) {
    return UnlinkEvent{p.get("Channel1"), p.get("Channel2"),
                       p.get("Uniqueid1"), p.get("Uniqueid2")};
}

// Asterisk 1.6 folds Link/Unlink into "Bridge" with Bridgestate
EventPayload make_bridge(const AmiPacket& p) {
    if (strcasecmp(p.get("Bridgestate").c_str(), "Unlink") == 0) return make_unlink(p);
    return make_link(p);
}

EventPayload make_rename(const AmiPacket& p) {
    RenameEvent e;
    e.old_name  = p.has("Oldname") ? p.get("Oldname") : p.get("Channel");
    e.new_name  = p.get("Newname");
    e.unique_id = unique_id(p);
    return e;
}

EventPayload make_hangup(const AmiPacket& p) {
    HangupEvent e;
    e.channel    = p.get("Channel");
    e.unique_id  = unique_id(p);
    e.cause      = to_int(p.get("Cause"));
    e.cause_text = p.get("Cause-txt");
    return e;
}

EventPayload make_join(const AmiPacket& p) {
    JoinEvent e;
    e.queue          = p.get("Queue");
    e.channel        = p.get("Channel");
    e.unique_id      = unique_id(p);
    e.caller_id_num  = caller_id_num(p);
    e.caller_id_name = p.get("CallerIDName");
    e.position       = to_int(p.get("Position"));
    e.count          = to_int(p.get("Count"));
    return e;
}

EventPayload make_leave(const AmiPacket& p) {
    LeaveEvent e;
    e.queue     = p.get("Queue");
    e.channel   = p.get("Channel");
    e.unique_id = unique_id(p);
    e.count     = to_int(p.get("Count"));
    return e;
}

EventPayload make_status(const AmiPacket& p) {
    StatusEvent e;
    e.channel        = p.get("Channel");
    e.unique_id      = unique_id(p);
    e.state          = channel_state(p);
    e.caller_id_num  = caller_id_num(p);
    e.caller_id_name = p.get("CallerIDName");
    e.account_code   = p.get("AccountCode");
    e.context        = p.get("Context");
    e.extension      = p.get("Extension");
    e.priority       = to_int(p.get("Priority"));
    e.link           = p.has("BridgedChannel") ? p.get("BridgedChannel") : p.get("Link");
    e.seconds        = to_int(p.get("Seconds"));
    return e;
}

EventPayload make_status_complete(const AmiPacket& p) {
    return StatusCompleteEvent{to_int(p.get("Items"))};
}

EventPayload make_queue_params(const AmiPacket& p) {
    QueueParamsEvent e;
    e.queue              = p.get("Queue");
    e.max                = to_int(p.get("Max"));
    e.strategy           = p.get("Strategy");
    e.calls              = to_int(p.get("Calls"));
    e.hold_time          = to_int(p.get("Holdtime"));
    e.completed          = to_int(p.get("Completed"));
    e.abandoned          = to_int(p.get("Abandoned"));
    e.service_level      = to_int(p.get("ServiceLevel"));
    e.service_level_perf = std::strtod(p.get("ServicelevelPerf").c_str(), nullptr);
    e.weight             = to_int(p.get("Weight"));
    return e;
}

EventPayload make_queue_member(const AmiPacket& p) {
    QueueMemberEvent e;
    e.queue       = p.get("Queue");
    e.location    = p.has("Location") ? p.get("Location") : p.get("Interface");
    e.name        = p.get("Name");
    e.membership  = p.get("Membership");
    e.penalty     = to_int(p.get("Penalty"));
    e.calls_taken = to_int(p.get("CallsTaken"));
    e.last_call   = to_long(p.get("LastCall"));
    e.status      = to_int(p.get("Status"));
    e.paused      = to_bool(p.get("Paused"));
    return e;
}

EventPayload make_queue_entry(const AmiPacket& p) {
    QueueEntryEvent e;
    e.queue          = p.get("Queue");
    e.position       = to_int(p.get("Position"));
    e.channel        = p.get("Channel");
    e.unique_id      = unique_id(p);
    e.caller_id_num  = caller_id_num(p);
    e.caller_id_name = p.get("CallerIDName");
    e.wait           = to_long(p.get("Wait"));
    return e;
}

EventPayload make_queue_status_complete(const AmiPacket&) {
    return QueueStatusCompleteEvent{};
}

OriginateResponseEvent originate_common(const AmiPacket& p) {
    OriginateResponseEvent e;
    e.channel     = p.get("Channel");
    e.unique_id   = unique_id(p);
    e.context     = p.get("Context");
    e.extension   = p.get("Exten");
    e.application = p.get("Application");
    e.reason      = to_int(p.get("Reason"));
    return e;
}

EventPayload make_originate_response(const AmiPacket& p) {
    OriginateResponseEvent e = originate_common(p);
    e.success = strcasecmp(p.get("Response").c_str(), "Success") == 0;
    return e;
}

EventPayload make_originate_success(const AmiPacket& p) {
    OriginateResponseEvent e = originate_common(p);
    e.success = true;
    return e;
}

EventPayload make_originate_failure(const AmiPacket& p) {
    OriginateResponseEvent e = originate_common(p);
    e.success = false;
    return e;
}

using Builder = EventPayload (*)(const AmiPacket&);

const std::unordered_map<std::string, Builder>& builders() {
    static const std::unordered_map<std::string, Builder> table = {
        {"newchannel",          &make_new_channel},
        {"newexten",            &make_new_exten},
        {"newstate",            &make_new_state},
        {"newcallerid",         &make_new_caller_id},
        {"link",                &make_link},
        {"unlink",              &make_unlink},
        {"bridge",              &make_bridge},
        {"rename",              &make_rename},
        {"hangup",              &make_hangup},
        {"join",                &make_join},
        {"queuecallerjoin",     &make_join},
        {"leave",               &make_leave},
        {"queuecallerleave",    &make_leave},
        {"status",              &make_status},
        {"statuscomplete",      &make_status_complete},
        {"queueparams",         &make_queue_params},
        {"queuemember",         &make_queue_member},
        {"queueentry",          &make_queue_entry},
        {"queuestatuscomplete", &make_queue_status_complete},
        {"originateresponse",   &make_originate_response},
        {"originatesuccess",    &make_originate_success},
        {"originatefailure",    &make_originate_failure},
    };
    return table;
}

} // namespace

ManagerEvent build_event(const AmiPacket& packet, EventId id) {
    ManagerEvent ev;
    ev.id          = id;
    ev.name        = packet.get("Event");
    ev.action_id   = packet.action_id();
    ev.received_at = Clock::now();

    auto it = builders().find(lower(ev.name));
    if (it != builders().end()) {
        ev.payload = it->second(packet);
    } else {
        ev.payload = GenericEvent{packet.fields};
    }
    return ev;
}

ManagerResponse build_response(const AmiPacket& packet) {
    ManagerResponse r;
    r.response  = packet.get("Response");
    r.message   = packet.get("Message");
    r.action_id = packet.action_id();
    r.fields    = packet.fields;
    r.output    = packet.output;
    return r;
}

bool ManagerResponse::is_success() const {
    return strcasecmp(response.c_str(), "Success") == 0 ||
           strcasecmp(response.c_str(), "Follows") == 0 ||
           strcasecmp(response.c_str(), "Goodbye") == 0 ||
           strcasecmp(response.c_str(), "Pong") == 0;
}

std::string ManagerResponse::get(const char* key) const {
    for (const auto& f : fields)
        if (strcasecmp(f.first.c_str(), key) == 0) return f.second;
    return "";
}

const char* event_type_name(const EventPayload& payload) {
    switch (payload.index()) {
        case 0:  return "Connect";
        case 1:  return "Disconnect";
        case 2:  return "NewChannel";
        case 3:  return "NewExten";
        case 4:  return "NewState";
        case 5:  return "NewCallerId";
        case 6:  return "Link";
        case 7:  return "Unlink";
        case 8:  return "Rename";
        case 9:  return "Hangup";
        case 10: return "Join";
        case 11: return "Leave";
        case 12: return "Status";
        case 13: return "StatusComplete";
        case 14: return "QueueParams";
        case 15: return "QueueMember";
        case 16: return "QueueEntry";
        case 17: return "QueueStatusComplete";
        case 18: return "OriginateResponse";
        case 19: return "Generic";
        default: return "Unknown";
    }
}

} // namespace asterisk_live

// =============================================================================
// FILE: src/live/live_channel.cpp
// =============================================================================
#include "live/live_channel.h"
#include "pbx/channel_activity_action.h"
#include <cctype>
#include <cstdlib>
#include <strings.h>

namespace asterisk_live {

const char* channel_state_to_string(ChannelState s) {
    switch (s) {
        case ChannelState::kDown:           return "Down";
        case ChannelState::kReserved:       return "Rsrvd";
        case ChannelState::kOffHook:        return "OffHook";
        case ChannelState::kDialing:        return "Dialing";
        case ChannelState::kRing:           return "Ring";
        case ChannelState::kRinging:        return "Ringing";
        case ChannelState::kUp:             return "Up";
        case ChannelState::kBusy:           return "Busy";
        case ChannelState::kDialingOffHook: return "Dialing Offhook";
        case ChannelState::kPreRing:        return "Pre-ring";
        case ChannelState::kHungUp:         return "Hungup";
        default:                            return "Unknown";
    }
}

ChannelState parse_channel_state(const std::string& s) {
    if (s.empty()) return ChannelState::kUnknown;

    if (std::isdigit(static_cast<unsigned char>(s[0]))) {
        switch (std::atoi(s.c_str())) {
            case 0: return ChannelState::kDown;
            case 1: return ChannelState::kReserved;
            case 2: return ChannelState::kOffHook;
            case 3: return ChannelState::kDialing;
            case 4: return ChannelState::kRing;
            case 5: return ChannelState::kRinging;
            case 6: return ChannelState::kUp;
            case 7: return ChannelState::kBusy;
            case 8: return ChannelState::kDialingOffHook;
            case 9: return ChannelState::kPreRing;
            default: return ChannelState::kUnknown;
        }
    }

    static const struct { const char* text; ChannelState state; } table[] = {
        {"Down", ChannelState::kDown},
        {"Rsrvd", ChannelState::kReserved},
        {"Reserved", ChannelState::kReserved},
        {"OffHook", ChannelState::kOffHook},
        {"Dialing", ChannelState::kDialing},
        {"Ring", ChannelState::kRing},
        {"Ringing", ChannelState::kRinging},
        {"Up", ChannelState::kUp},
        {"Busy", ChannelState::kBusy},
        {"Dialing Offhook", ChannelState::kDialingOffHook},
        {"Pre-ring", ChannelState::kPreRing},
    };
    for (const auto& e : table)
        if (strcasecmp(e.text, s.c_str()) == 0) return e.state;
    return ChannelState::kUnknown;
}

LiveChannel::LiveChannel(std::string unique_id, std::string name)
    : unique_id_(std::move(unique_id))
    , created_at_(Clock::now())
    , name_(std::move(name))
{}

std::string LiveChannel::name() const {
    std::lock_guard<std::mutex> lk(mu_);
    return name_;
}

void LiveChannel::set_name(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    name_ = name;
}

ChannelState LiveChannel::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void LiveChannel::set_state(ChannelState state) {
    std::lock_guard<std::mutex> lk(mu_);
    state_ = state;
}

std::string LiveChannel::caller_id_num() const {
    std::lock_guard<std::mutex> lk(mu_);
    return caller_id_num_;
}

std::string LiveChannel::caller_id_name() const {
    std::lock_guard<std::mutex> lk(mu_);
    return caller_id_name_;
}

void LiveChannel::set_caller_id(const std::string& num, const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    caller_id_num_ = num;
    caller_id_name_ = name;
}

std::string LiveChannel::account_code() const {
    std::lock_guard<std::mutex> lk(mu_);
    return account_code_;
}

void LiveChannel::set_account_code(const std::string& code) {
    std::lock_guard<std::mutex> lk(mu_);
    account_code_ = code;
}

void LiveChannel::add_extension(const ExtensionEntry& entry) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!extensions_.empty()) {
        const auto& cur = extensions_.back();
        if (cur.context == entry.context && cur.extension == entry.extension &&
            cur.priority == entry.priority) return;
    }
    extensions_.push_back(entry);
}

std::optional<ExtensionEntry> LiveChannel::current_extension() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (extensions_.empty()) return std::nullopt;
    return extensions_.back();
}

std::vector<ExtensionEntry> LiveChannel::extension_history() const {
    std::lock_guard<std::mutex> lk(mu_);
    return extensions_;
}

std::string LiveChannel::linked_channel() const {
    std::lock_guard<std::mutex> lk(mu_);
    return linked_channel_;
}

std::string LiveChannel::linked_unique_id() const {
    std::lock_guard<std::mutex> lk(mu_);
    return linked_unique_id_;
}

void LiveChannel::set_linked(const std::string& channel, const std::string& unique_id) {
    std::lock_guard<std::mutex> lk(mu_);
    linked_channel_ = channel;
    linked_unique_id_ = unique_id;
}

void LiveChannel::clear_linked() {
    std::lock_guard<std::mutex> lk(mu_);
    linked_channel_.clear();
    linked_unique_id_.clear();
}

void LiveChannel::set_hangup(int cause, const std::string& cause_text) {
    std::lock_guard<std::mutex> lk(mu_);
    state_ = ChannelState::kHungUp;
    hangup_cause_ = cause;
    hangup_cause_text_ = cause_text;
    hung_up_at_ = Clock::now();
}

int LiveChannel::hangup_cause() const {
    std::lock_guard<std::mutex> lk(mu_);
    return hangup_cause_;
}

std::string LiveChannel::hangup_cause_text() const {
    std::lock_guard<std::mutex> lk(mu_);
    return hangup_cause_text_;
}

std::optional<TimePoint> LiveChannel::hung_up_at() const {
    std::lock_guard<std::mutex> lk(mu_);
    return hung_up_at_;
}

std::shared_ptr<ChannelActivityAction> LiveChannel::current_activity() const {
    std::lock_guard<std::mutex> lk(mu_);
    return current_activity_;
}

void LiveChannel::set_current_activity(std::shared_ptr<ChannelActivityAction> activity) {
    std::lock_guard<std::mutex> lk(mu_);
    current_activity_ = std::move(activity);
}

} // namespace asterisk_live

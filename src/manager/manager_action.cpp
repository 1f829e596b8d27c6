// =============================================================================
// FILE: src/manager/manager_action.cpp
// =============================================================================
#include "manager/manager_action.h"
#include <strings.h>

namespace asterisk_live {

ManagerAction& ManagerAction::set(const std::string& key, const std::string& value) {
    for (auto& f : fields_) {
        if (strcasecmp(f.first.c_str(), key.c_str()) == 0) {
            f.second = value;
            return *this;
        }
    }
    fields_.emplace_back(key, value);
    return *this;
}

ManagerAction& ManagerAction::add_variable(const std::string& key, const std::string& value) {
    variables_.emplace_back(key, value);
    return *this;
}

ManagerAction& ManagerAction::complete_on(const std::string& event_name) {
    completion_events_.push_back(event_name);
    return *this;
}

std::string ManagerAction::get(const char* key) const {
    for (const auto& f : fields_)
        if (strcasecmp(f.first.c_str(), key) == 0) return f.second;
    return "";
}

bool ManagerAction::is_completion_event(const std::string& event_name) const {
    for (const auto& e : completion_events_)
        if (strcasecmp(e.c_str(), event_name.c_str()) == 0) return true;
    return false;
}

std::string ManagerAction::serialize(const std::string& action_id) const {
    std::string out;
    out.reserve(128 + fields_.size() * 32 + variables_.size() * 32);
    out += "Action: " + name_ + "\r\n";
    if (!action_id.empty()) out += "ActionID: " + action_id + "\r\n";
    for (const auto& f : fields_)
        out += f.first + ": " + f.second + "\r\n";
    for (const auto& v : variables_)
        out += "Variable: " + v.first + "=" + v.second + "\r\n";
    out += "\r\n";
    return out;
}

ManagerAction ManagerAction::login(const std::string& username, const std::string& secret,
                                   bool events) {
    ManagerAction a("Login");
    a.set("Username", username).set("Secret", secret).set("Events", events ? "on" : "off");
    return a;
}

ManagerAction ManagerAction::logoff() { return ManagerAction("Logoff"); }

ManagerAction ManagerAction::ping() { return ManagerAction("Ping"); }

ManagerAction ManagerAction::command(const std::string& command) {
    ManagerAction a("Command");
    a.set("Command", command);
    return a;
}

ManagerAction ManagerAction::status() {
    ManagerAction a("Status");
    a.complete_on("StatusComplete");
    return a;
}

ManagerAction ManagerAction::queue_status() {
    ManagerAction a("QueueStatus");
    a.complete_on("QueueStatusComplete");
    return a;
}

} // namespace asterisk_live

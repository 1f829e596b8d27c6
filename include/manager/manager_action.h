// =============================================================================
// FILE: include/manager/manager_action.h
// =============================================================================
#ifndef MANAGER_ACTION_H
#define MANAGER_ACTION_H

#include <string>
#include <utility>
#include <vector>

namespace asterisk_live {

// An outgoing manager action. Fields are written in insertion order;
// the connection assigns the ActionID when sending.
//
// An action with completion events is "event-generating": its result is the
// response plus every event tagged with the same ActionID, up to and
// including the first completion event.
class ManagerAction {
public:
    explicit ManagerAction(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    ManagerAction& set(const std::string& key, const std::string& value);
    ManagerAction& add_variable(const std::string& key, const std::string& value);
    ManagerAction& complete_on(const std::string& event_name);

    std::string get(const char* key) const;
    const std::vector<std::pair<std::string, std::string>>& fields() const { return fields_; }
    const std::vector<std::pair<std::string, std::string>>& variables() const { return variables_; }

    bool is_event_generating() const { return !completion_events_.empty(); }
    bool is_completion_event(const std::string& event_name) const;

    // Wire form, terminated by the blank line
    std::string serialize(const std::string& action_id) const;

    static ManagerAction login(const std::string& username, const std::string& secret,
                               bool events);
    static ManagerAction logoff();
    static ManagerAction ping();
    static ManagerAction command(const std::string& command);
    static ManagerAction status();
    static ManagerAction queue_status();

private:
    std::string name_;
    std::vector<std::pair<std::string, std::string>> fields_;
    std::vector<std::pair<std::string, std::string>> variables_;
    std::vector<std::string> completion_events_;
};

} // namespace asterisk_live
#endif // MANAGER_ACTION_H

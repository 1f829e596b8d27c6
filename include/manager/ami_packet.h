// =============================================================================
// FILE: include/manager/ami_packet.h
// =============================================================================
#ifndef AMI_PACKET_H
#define AMI_PACKET_H

#include <string>
#include <vector>
#include <utility>
#include <strings.h>

namespace asterisk_live {

// One framed manager packet: "Key: Value" lines up to a blank line.
// Keys are matched case-insensitively; order and duplicates are preserved
// (Originate may carry several "Variable" lines).
struct AmiPacket {
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<std::string> output;  // Command output lines

    void add(const std::string& key, const std::string& value) {
        fields.emplace_back(key, value);
    }

    bool has(const char* key) const {
        for (const auto& f : fields)
            if (strcasecmp(f.first.c_str(), key) == 0) return true;
        return false;
    }

    // First value for key, "" if absent
    std::string get(const char* key) const {
        for (const auto& f : fields)
            if (strcasecmp(f.first.c_str(), key) == 0) return f.second;
        return "";
    }

    bool is_event() const    { return has("Event"); }
    bool is_response() const { return has("Response"); }
    std::string action_id() const { return get("ActionID"); }
};

} // namespace asterisk_live
#endif // AMI_PACKET_H

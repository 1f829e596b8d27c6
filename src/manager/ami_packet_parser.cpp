// =============================================================================
// FILE: src/manager/ami_packet_parser.cpp
// =============================================================================
#include "manager/ami_packet_parser.h"
#include "common/logger.h"
#include <strings.h>

namespace asterisk_live {

namespace {
const char kBannerPrefix[] = "Asterisk Call Manager";
const char kEndCommand[]   = "--END COMMAND--";
const size_t kEndCommandLen = sizeof(kEndCommand) - 1;
}

AmiPacketParser::AmiPacketParser() { buffer_.reserve(4096); }
AmiPacketParser::~AmiPacketParser() = default;

void AmiPacketParser::reset() {
    buffer_.clear();
    current_ = AmiPacket();
    in_packet_ = false;
    command_output_ = false;
    output_started_ = false;
    command_ended_ = false;
}

bool AmiPacketParser::is_command_header(const std::string& key) const {
    return strcasecmp(key.c_str(), "Privilege") == 0 ||
           strcasecmp(key.c_str(), "ActionID") == 0;
}

void AmiPacketParser::finish_packet(ParseResult& result) {
    result.packets.push_back(std::move(current_));
    current_ = AmiPacket();
    in_packet_ = false;
    command_output_ = false;
    output_started_ = false;
    command_ended_ = false;
    total_parsed_++;
}

void AmiPacketParser::handle_line(const std::string& line, ParseResult& result) {
    // Legacy "Response: Follows" body: raw lines up to --END COMMAND--
    if (command_output_ && !command_ended_) {
        if (line.size() >= kEndCommandLen &&
            line.compare(line.size() - kEndCommandLen, kEndCommandLen, kEndCommand) == 0) {
            std::string tail = line.substr(0, line.size() - kEndCommandLen);
            if (!tail.empty()) current_.output.push_back(tail);
            command_ended_ = true;
            return;
        }
        if (!output_started_) {
            auto colon = line.find(':');
            if (colon != std::string::npos && is_command_header(line.substr(0, colon))) {
                std::string val = line.substr(colon + 1);
                val.erase(0, val.find_first_not_of(" \t"));
                current_.add(line.substr(0, colon), val);
                return;
            }
        }
        output_started_ = true;
        current_.output.push_back(line);
        return;
    }

    if (line.empty()) {
        if (in_packet_) finish_packet(result);
        return;
    }

    if (!in_packet_ && line.compare(0, sizeof(kBannerPrefix) - 1, kBannerPrefix) == 0) {
        result.protocol_identifier = line;
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        if (in_packet_) {
            current_.output.push_back(line);
        } else {
            total_errors_++;
            LOG_DEBUG("AmiParser: stray line outside packet: %.80s", line.c_str());
        }
        return;
    }

    in_packet_ = true;
    std::string key = line.substr(0, colon);
    std::string val = line.substr(colon + 1);

    if (strcasecmp(key.c_str(), "Output") == 0) {
        if (!val.empty() && val[0] == ' ') val.erase(0, 1);
        current_.output.push_back(val);
        return;
    }

    val.erase(0, val.find_first_not_of(" \t"));
    current_.add(key, val);

    if (strcasecmp(key.c_str(), "Response") == 0 && strcasecmp(val.c_str(), "Follows") == 0)
        command_output_ = true;
}

AmiPacketParser::ParseResult AmiPacketParser::feed(const char* data, size_t len) {
    ParseResult result;
    if (!data || len == 0) return result;

    if (buffer_.size() + len > max_buffer_size_) {
        LOG_ERROR("AmiParser: buffer overflow (%zu bytes), resetting", buffer_.size() + len);
        reset();
        result.error = "Buffer overflow";
        total_errors_++;
        return result;
    }

    buffer_.append(data, len);
    result.bytes_consumed = len;

    size_t pos = 0;
    while (true) {
        auto nl = buffer_.find('\n', pos);
        if (nl == std::string::npos) break;
        std::string line = buffer_.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pos = nl + 1;
        handle_line(line, result);
    }

    if (pos > 0) buffer_.erase(0, pos);
    return result;
}

} // namespace asterisk_live

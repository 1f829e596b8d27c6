// =============================================================================
// FILE: include/manager/ami_packet_parser.h
// =============================================================================
#ifndef AMI_PACKET_PARSER_H
#define AMI_PACKET_PARSER_H

#include "manager/ami_packet.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace asterisk_live {

// Incremental framer for the manager byte stream. Bytes may arrive split at
// any position; complete packets are returned as soon as their terminating
// blank line (or "--END COMMAND--" for legacy command output) is seen.
class AmiPacketParser {
public:
    AmiPacketParser();
    ~AmiPacketParser();

    struct ParseResult {
        std::vector<AmiPacket> packets;
        std::string protocol_identifier;  // "Asterisk Call Manager/x.y" when seen
        size_t bytes_consumed = 0;
        std::string error;
    };

    ParseResult feed(const char* data, size_t len);
    void reset();

    uint64_t total_packets_parsed() const { return total_parsed_; }
    uint64_t total_parse_errors()  const { return total_errors_; }

    AmiPacketParser(const AmiPacketParser&) = delete;
    AmiPacketParser& operator=(const AmiPacketParser&) = delete;

private:
    void handle_line(const std::string& line, ParseResult& result);
    void finish_packet(ParseResult& result);
    bool is_command_header(const std::string& key) const;

    std::string buffer_;
    size_t max_buffer_size_ = 1048576;

    AmiPacket current_;
    bool in_packet_       = false;
    bool command_output_  = false;  // Inside "Response: Follows" body
    bool output_started_  = false;
    bool command_ended_   = false;  // Saw --END COMMAND--, waiting for blank line

    uint64_t total_parsed_ = 0;
    uint64_t total_errors_ = 0;
};

} // namespace asterisk_live
#endif

// =============================================================================
// FILE: include/common/config.h
// =============================================================================
#ifndef COMMON_CONFIG_H
#define COMMON_CONFIG_H

#include "common/types.h"
#include <cstddef>
#include <string>
#include <unordered_map>

namespace asterisk_live {

// Manager interface endpoint (host:port)
struct AmiServerEndpoint {
    std::string host;
    uint16_t    port = 5038;
};

struct Config {
    // General
    std::string service_id     = "ami-live-01";
    std::string instance_name  = "asterisk_live_mirror";
    std::string log_level_str  = "info";

    // Manager connection
    AmiServerEndpoint ami_server          = {"127.0.0.1", 5038};
    std::string ami_username              = "manager";
    std::string ami_secret;
    Millisecs   ami_connect_timeout       = Millisecs(10000);
    Millisecs   ami_response_timeout      = Millisecs(2000);
    Millisecs   ami_snapshot_timeout      = Millisecs(10000);
    Seconds     ami_keepalive_interval    = Seconds(20);
    int         ami_keepalive_miss_threshold = 3;
    Seconds     ami_reconnect_interval     = Seconds(1);
    Seconds     ami_reconnect_max_interval = Seconds(30);
    size_t      ami_recv_buffer_size      = 65536;
    size_t      ami_max_pending_events    = 100000;
    size_t      ami_action_connections    = 0;   // Extra action-only connections in the pool
    bool        ami_skip_queues           = false;
    std::string ami_version_command       = "show version";
    std::string ami_version_files_command = "show version files";

    // MongoDB
    std::string mongo_uri                    = "mongodb://localhost:27017";
    std::string mongo_database               = "asterisk_live";
    std::string mongo_collection_calls       = "call_records";
    Seconds     mongo_sync_interval          = Seconds(5);
    size_t      mongo_batch_size             = 500;
    bool        mongo_enable_persistence     = true;

    // Slow event logging thresholds
    Millisecs slow_event_warn_threshold      = Millisecs(50);
    Millisecs slow_event_error_threshold     = Millisecs(200);
    Millisecs slow_event_critical_threshold  = Millisecs(1000);

    // Logging
    std::string log_directory           = "/var/log/asterisk_live";
    std::string log_base_name           = "asterisk_live";
    std::string log_console_level_str   = "warn";
    size_t      log_max_file_size_mb    = 50;
    int         log_max_rotated_files   = 10;
    bool        log_ami_trace           = false;   // Raw manager traffic to <base>_ami.log

    static constexpr size_t kMaxActionConnections = 32;

    // Parse from INI-style config file
    static Config load_from_file(const std::string& path);
    static Config load_defaults();

    // Logs every bad setting; kInvalidArgument if there was any
    Result validate() const;

private:
    using IniMap = std::unordered_map<std::string, std::string>;

    // Keys are flattened to "section.key"
    static IniMap parse_ini(const std::string& path);
    static std::string get_or(const IniMap& m, const std::string& key, const std::string& def);
    static int get_int(const IniMap& m, const std::string& key, int def);
    static size_t get_size(const IniMap& m, const std::string& key, size_t def);
    static bool get_bool(const IniMap& m, const std::string& key, bool def);
    static AmiServerEndpoint parse_endpoint(const std::string& host_port, uint16_t default_port);
};

} // namespace asterisk_live
#endif // COMMON_CONFIG_H

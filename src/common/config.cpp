// =============================================================================
// FILE: src/common/config.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include <cstdlib>
#include <fstream>
#include <strings.h>

namespace asterisk_live {

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Asterisk .conf comments start at any unescaped ';'. "\;" is a literal.
std::string strip_comment(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == ';') {
            out += ';';
            ++i;
        } else if (raw[i] == ';') {
            break;
        } else {
            out += raw[i];
        }
    }
    return out;
}

// ${NAME} from the environment, "" when unset
void expand_env(std::string& val) {
    size_t pos = 0;
    while ((pos = val.find("${", pos)) != std::string::npos) {
        size_t close = val.find('}', pos);
        if (close == std::string::npos) return;
        const char* env = std::getenv(val.substr(pos + 2, close - pos - 2).c_str());
        std::string repl = env ? env : "";
        val.replace(pos, close - pos + 1, repl);
        pos += repl.size();
    }
}

} // namespace

Config::IniMap Config::parse_ini(const std::string& path) {
    IniMap entries;
    std::ifstream in(path);
    if (!in) {
        LOG_WARN("Config: cannot open %s", path.c_str());
        return entries;
    }

    std::string section, raw;
    int lineno = 0;
    while (std::getline(in, raw)) {
        ++lineno;
        std::string line = strip_comment(raw);
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        // [section] or [section](template) in manager.conf style
        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                LOG_WARN("Config: %s:%d unterminated section header", path.c_str(), lineno);
                continue;
            }
            section = line.substr(1, close - 1);
            trim(section);
            continue;
        }

        // "key = value" or "key => value"
        size_t sep = line.find('=');
        if (sep == std::string::npos) {
            LOG_WARN("Config: %s:%d ignoring '%s'", path.c_str(), lineno, line.c_str());
            continue;
        }
        std::string key = line.substr(0, sep);
        std::string val = line.substr(line[sep + 1] == '>' ? sep + 2 : sep + 1);
        trim(key);
        trim(val);
        expand_env(val);

        entries[section.empty() ? key : section + "." + key] = val;
    }
    return entries;
}

std::string Config::get_or(const IniMap& m, const std::string& key, const std::string& def) {
    auto it = m.find(key);
    return it == m.end() ? def : it->second;
}

int Config::get_int(const IniMap& m, const std::string& key, int def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    char* end = nullptr;
    long v = std::strtol(it->second.c_str(), &end, 10);
    if (end == it->second.c_str()) {
        LOG_WARN("Config: %s = '%s' is not a number, using %d", key.c_str(),
                 it->second.c_str(), def);
        return def;
    }
    return static_cast<int>(v);
}

size_t Config::get_size(const IniMap& m, const std::string& key, size_t def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(it->second.c_str(), &end, 10);
    if (end == it->second.c_str() || it->second[0] == '-') {
        LOG_WARN("Config: %s = '%s' is not a size, using %zu", key.c_str(),
                 it->second.c_str(), def);
        return def;
    }
    return static_cast<size_t>(v);
}

bool Config::get_bool(const IniMap& m, const std::string& key, bool def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    // Same spellings as Asterisk's own ast_true()/ast_false()
    static const char* kTrue[]  = {"yes", "true", "y", "t", "1", "on"};
    static const char* kFalse[] = {"no", "false", "n", "f", "0", "off"};
    for (const char* t : kTrue)
        if (strcasecmp(it->second.c_str(), t) == 0) return true;
    for (const char* f : kFalse)
        if (strcasecmp(it->second.c_str(), f) == 0) return false;
    LOG_WARN("Config: %s = '%s' is not a boolean, using %s",
             key.c_str(), it->second.c_str(), def ? "yes" : "no");
    return def;
}

AmiServerEndpoint Config::parse_endpoint(const std::string& host_port, uint16_t default_port) {
    AmiServerEndpoint ep;
    ep.port = default_port;
    auto colon = host_port.rfind(':');
    if (colon == std::string::npos) {
        ep.host = host_port;
        return ep;
    }
    ep.host = host_port.substr(0, colon);
    char* end = nullptr;
    std::string port_str = host_port.substr(colon + 1);
    long port = std::strtol(port_str.c_str(), &end, 10);
    if (end != port_str.c_str() && port > 0 && port <= 65535)
        ep.port = static_cast<uint16_t>(port);
    return ep;
}

Result Config::validate() const {
    int problems = 0;
    auto reject = [&problems](const char* what) {
        LOG_ERROR("Config: %s", what);
        ++problems;
    };

    if (ami_server.host.empty()) reject("ami.server has no host");
    if (ami_server.port == 0) reject("ami.server port is 0");
    if (ami_username.empty()) reject("ami.username is empty");
    if (ami_connect_timeout.count() <= 0) reject("ami.connect_timeout_ms must be positive");
    if (ami_response_timeout.count() <= 0) reject("ami.response_timeout_ms must be positive");
    if (ami_snapshot_timeout.count() <= 0) reject("ami.snapshot_timeout_ms must be positive");
    if (ami_keepalive_miss_threshold < 1) reject("ami.keepalive_miss_threshold must be >= 1");
    if (ami_reconnect_max_interval < ami_reconnect_interval)
        reject("ami.reconnect_max_interval_sec is below ami.reconnect_interval_sec");
    if (ami_recv_buffer_size < 1024) reject("ami.recv_buffer_size must be >= 1024");
    if (ami_action_connections > kMaxActionConnections)
        reject("ami.action_connections is above the limit of 32");
    if (mongo_enable_persistence && mongo_batch_size == 0)
        reject("mongodb.batch_size is 0 with persistence enabled");
    if (!(slow_event_warn_threshold <= slow_event_error_threshold &&
          slow_event_error_threshold <= slow_event_critical_threshold))
        reject("slow_event thresholds must be warn <= error <= critical");

    if (ami_secret.empty())
        LOG_WARN("Config: ami.secret is empty; Login will likely be rejected");

    return problems == 0 ? Result::kOk : Result::kInvalidArgument;
}

Config Config::load_defaults() {
    Config cfg;
    LOG_INFO("Config: defaults loaded, ami=%s:%d", cfg.ami_server.host.c_str(), cfg.ami_server.port);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    IniMap m = parse_ini(path);
    if (m.empty()) {
        LOG_WARN("Config: nothing read from %s, falling back to defaults", path.c_str());
        return load_defaults();
    }

    Config c;

    // General
    c.service_id     = get_or(m, "general.service_id", c.service_id);
    c.instance_name  = get_or(m, "general.instance_name", c.instance_name);
    c.log_level_str  = get_or(m, "general.log_level", c.log_level_str);

    // Manager connection
    c.ami_server = parse_endpoint(get_or(m, "ami.server", "127.0.0.1:5038"), 5038);
    c.ami_username               = get_or(m, "ami.username", c.ami_username);
    c.ami_secret                 = get_or(m, "ami.secret", c.ami_secret);
    c.ami_connect_timeout        = Millisecs(get_int(m, "ami.connect_timeout_ms", 10000));
    c.ami_response_timeout       = Millisecs(get_int(m, "ami.response_timeout_ms", 2000));
    c.ami_snapshot_timeout       = Millisecs(get_int(m, "ami.snapshot_timeout_ms", 10000));
    c.ami_keepalive_interval     = Seconds(get_int(m, "ami.keepalive_interval_sec", 20));
    c.ami_keepalive_miss_threshold = get_int(m, "ami.keepalive_miss_threshold", 3);
    c.ami_reconnect_interval     = Seconds(get_int(m, "ami.reconnect_interval_sec", 1));
    c.ami_reconnect_max_interval = Seconds(get_int(m, "ami.reconnect_max_interval_sec", 30));
    c.ami_recv_buffer_size       = get_size(m, "ami.recv_buffer_size", 65536);
    c.ami_max_pending_events     = get_size(m, "ami.max_pending_events", 100000);
    c.ami_action_connections     = get_size(m, "ami.action_connections", 0);
    c.ami_skip_queues            = get_bool(m, "ami.skip_queues", false);
    c.ami_version_command        = get_or(m, "ami.version_command", c.ami_version_command);
    c.ami_version_files_command  = get_or(m, "ami.version_files_command", c.ami_version_files_command);

    // MongoDB
    c.mongo_uri                = get_or(m, "mongodb.uri", c.mongo_uri);
    c.mongo_database           = get_or(m, "mongodb.database", c.mongo_database);
    c.mongo_collection_calls   = get_or(m, "mongodb.collection_calls", c.mongo_collection_calls);
    c.mongo_sync_interval      = Seconds(get_int(m, "mongodb.sync_interval_sec", 5));
    c.mongo_batch_size         = get_size(m, "mongodb.batch_size", 500);
    c.mongo_enable_persistence = get_bool(m, "mongodb.enable_persistence", true);

    // Slow event
    c.slow_event_warn_threshold     = Millisecs(get_int(m, "slow_event.warn_threshold_ms", 50));
    c.slow_event_error_threshold    = Millisecs(get_int(m, "slow_event.error_threshold_ms", 200));
    c.slow_event_critical_threshold = Millisecs(get_int(m, "slow_event.critical_threshold_ms", 1000));

    // Logging
    c.log_directory         = get_or(m, "logging.directory", c.log_directory);
    c.log_base_name         = get_or(m, "logging.base_name", c.log_base_name);
    c.log_console_level_str = get_or(m, "logging.console_level", c.log_console_level_str);
    c.log_max_file_size_mb  = get_size(m, "logging.max_file_size_mb", 50);
    c.log_max_rotated_files = get_int(m, "logging.max_rotated_files", 10);
    c.log_ami_trace         = get_bool(m, "logging.ami_trace", false);

    LOG_INFO("Config: loaded from '%s' ami=%s:%d user=%s skip_queues=%s mongo=%s",
             path.c_str(), c.ami_server.host.c_str(), c.ami_server.port,
             c.ami_username.c_str(), c.ami_skip_queues ? "yes" : "no",
             c.mongo_enable_persistence ? "enabled" : "disabled");

    return c;
}

} // namespace asterisk_live

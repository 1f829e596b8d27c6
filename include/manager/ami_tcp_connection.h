// =============================================================================
// FILE: include/manager/ami_tcp_connection.h
// =============================================================================
#ifndef AMI_TCP_CONNECTION_H
#define AMI_TCP_CONNECTION_H

#include "common/types.h"
#include "common/config.h"
#include "manager/ami_packet_parser.h"
#include "manager/manager_connection.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace asterisk_live {

// ManagerConnection over a plain TCP socket.
//
// Threads:
//   reader   - poll/recv, framing, ActionID correlation, keep-alive Ping,
//              reconnect + re-login with exponential backoff
//   delivery - hands unsolicited events to listeners in arrival order
//
// Events tagged with the ActionID of a pending request belong to that request
// and are never delivered to listeners. Loss of the connection is reported as
// a DisconnectEvent, a successful re-login as a ConnectEvent.
class AmiTcpConnection : public ManagerConnection {
public:
    enum class ConnectionState { kDisconnected, kConnecting, kConnected, kReconnecting };

    // events=false logs in with "Events: off" (action-only connection)
    AmiTcpConnection(const Config& config, std::string connection_id, bool events = true);
    ~AmiTcpConnection() override;

    Result login() override;
    bool is_connected() const override { return connected_.load(std::memory_order_acquire); }

    Result send_action(const ManagerAction& action, ManagerResponse& response,
                       Millisecs timeout) override;
    Result send_event_generating_action(const ManagerAction& action, ResponseEvents& result,
                                        Millisecs timeout) override;

    void add_event_listener(ManagerEventListener* listener) override;
    void remove_event_listener(ManagerEventListener* listener) override;

    // Sends Logoff (best effort) and stops both threads
    void logoff();
    void stop();

    ConnectionState connection_state() const { return conn_state_.load(std::memory_order_acquire); }
    const std::string& connection_id() const { return connection_id_; }
    std::string protocol_identifier() const;

    struct ConnectionStats {
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> packets_received{0};
        std::atomic<uint64_t> events_received{0};
        std::atomic<uint64_t> events_delivered{0};
        std::atomic<uint64_t> events_dropped{0};
        std::atomic<uint64_t> actions_sent{0};
        std::atomic<uint64_t> action_timeouts{0};
        std::atomic<uint64_t> connect_attempts{0};
        std::atomic<uint64_t> connect_successes{0};
        std::atomic<uint64_t> disconnect_count{0};
        std::atomic<uint64_t> keepalive_timeouts{0};
        std::atomic<uint64_t> parse_errors{0};
        std::atomic<uint64_t> queue_depth{0};
    };
    const ConnectionStats& stats() const { return stats_; }

    AmiTcpConnection(const AmiTcpConnection&) = delete;
    AmiTcpConnection& operator=(const AmiTcpConnection&) = delete;

private:
    struct PendingRequest {
        const ManagerAction* action = nullptr;
        ManagerResponse response;
        std::vector<ManagerEvent> events;
        bool have_response = false;
        bool complete = false;
        Result failure = Result::kOk;   // Set when the connection is lost
    };

    Result connect_to_server();
    Result authenticate();
    Result read_some(int timeout_ms, AmiPacketParser::ParseResult& out);
    void close_socket();
    Result write_all(const std::string& data);

    void reader_thread_func();
    void read_loop();
    void reconnect_with_backoff();
    void check_keepalive();
    void handle_packet(AmiPacket&& packet);
    void fail_pending(Result reason);
    void set_connection_state(ConnectionState state, const std::string& detail = "");

    std::string next_action_id();
    Result send_and_wait(const ManagerAction& action, std::shared_ptr<PendingRequest>& req,
                         Millisecs timeout);

    void enqueue_event(ManagerEvent&& event);
    void delivery_thread_func();

    Config config_;
    std::string connection_id_;
    bool events_enabled_;

    int socket_fd_ = -1;
    std::mutex write_mu_;

    std::thread reader_thread_;
    std::thread delivery_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> connected_{false};
    std::atomic<ConnectionState> conn_state_{ConnectionState::kDisconnected};

    std::mutex shutdown_mu_;
    std::condition_variable shutdown_cv_;
    Seconds current_backoff_;

    TimePoint last_received_;
    TimePoint last_ping_sent_;

    mutable std::mutex banner_mu_;
    std::string protocol_identifier_;

    std::atomic<uint64_t> action_seq_{0};
    std::atomic<EventId> event_seq_{0};

    std::mutex pending_mu_;
    std::condition_variable pending_cv_;
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending_;

    // Packets that arrived in the same read as the login response
    std::vector<AmiPacket> backlog_;

    std::mutex queue_mu_;
    std::condition_variable queue_cv_;
    std::deque<ManagerEvent> event_queue_;

    std::mutex listeners_mu_;
    std::vector<ManagerEventListener*> listeners_;

    AmiPacketParser parser_;
    std::vector<char> recv_buffer_;
    ConnectionStats stats_;
};

} // namespace asterisk_live
#endif // AMI_TCP_CONNECTION_H

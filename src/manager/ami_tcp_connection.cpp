// =============================================================================
// FILE: src/manager/ami_tcp_connection.cpp
// =============================================================================
#include "manager/ami_tcp_connection.h"
#include "manager/event_builder.h"
#include "common/logger.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace asterisk_live {

namespace {
const int kPollIntervalMs = 1000;
}

AmiTcpConnection::AmiTcpConnection(const Config& config, std::string connection_id, bool events)
    : config_(config)
    , connection_id_(std::move(connection_id))
    , events_enabled_(events)
    , current_backoff_(config.ami_reconnect_interval)
    , recv_buffer_(config.ami_recv_buffer_size, '\0')
{}

AmiTcpConnection::~AmiTcpConnection() { stop(); }

std::string AmiTcpConnection::protocol_identifier() const {
    std::lock_guard<std::mutex> lk(banner_mu_);
    return protocol_identifier_;
}

std::string AmiTcpConnection::next_action_id() {
    return connection_id_ + "_" + std::to_string(action_seq_.fetch_add(1) + 1);
}

Result AmiTcpConnection::login() {
    if (running_.load(std::memory_order_acquire))
        return connected_.load() ? Result::kOk : Result::kConnectionLost;

    stop_requested_.store(false);

    Result r = connect_to_server();
    if (r != Result::kOk) {
        set_connection_state(ConnectionState::kDisconnected, result_to_string(r));
        return r;
    }

    r = authenticate();
    if (r != Result::kOk) {
        close_socket();
        set_connection_state(ConnectionState::kDisconnected, result_to_string(r));
        return r;
    }

    set_connection_state(ConnectionState::kConnected, protocol_identifier());
    running_.store(true);
    delivery_thread_ = std::thread(&AmiTcpConnection::delivery_thread_func, this);
    reader_thread_ = std::thread(&AmiTcpConnection::reader_thread_func, this);
    LOG_INFO("AmiConnection[%s]: logged in as %s (events %s)", connection_id_.c_str(),
             config_.ami_username.c_str(), events_enabled_ ? "on" : "off");
    return Result::kOk;
}

void AmiTcpConnection::logoff() {
    if (connected_.load(std::memory_order_acquire)) {
        ManagerResponse resp;
        Result r = send_action(ManagerAction::logoff(), resp, config_.ami_response_timeout);
        if (r != Result::kOk)
            LOG_WARN("AmiConnection[%s]: Logoff failed: %s",
                     connection_id_.c_str(), result_to_string(r));
    }
    stop();
}

void AmiTcpConnection::stop() {
    if (!running_.load(std::memory_order_acquire)) {
        close_socket();
        return;
    }
    stop_requested_.store(true);
    { std::lock_guard<std::mutex> lk(shutdown_mu_); }
    shutdown_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        if (socket_fd_ >= 0) shutdown(socket_fd_, SHUT_RDWR);
    }
    if (reader_thread_.joinable()) reader_thread_.join();
    close_socket();
    fail_pending(Result::kShuttingDown);

    { std::lock_guard<std::mutex> lk(queue_mu_); }
    queue_cv_.notify_all();
    if (delivery_thread_.joinable()) delivery_thread_.join();

    set_connection_state(ConnectionState::kDisconnected, "stopped");
    running_.store(false);
    LOG_INFO("AmiConnection[%s]: stopped", connection_id_.c_str());
}

void AmiTcpConnection::set_connection_state(ConnectionState state, const std::string& detail) {
    conn_state_.store(state);
    connected_.store(state == ConnectionState::kConnected);
    static const char* names[] = {"disconnected", "connecting", "connected", "reconnecting"};
    LOG_DEBUG("AmiConnection[%s]: %s %s", connection_id_.c_str(),
              names[static_cast<int>(state)], detail.c_str());
}

// -----------------------------------------------------------------------------
// Socket
// -----------------------------------------------------------------------------

Result AmiTcpConnection::connect_to_server() {
    const AmiServerEndpoint& ep = config_.ami_server;
    if (ep.host.empty()) return Result::kInvalidArgument;

    set_connection_state(ConnectionState::kConnecting, ep.host + ":" + std::to_string(ep.port));
    stats_.connect_attempts.fetch_add(1);

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_INET; hints.ai_socktype = SOCK_STREAM;
    std::string port_str = std::to_string(ep.port);

    int gai = getaddrinfo(ep.host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        LOG_ERROR("AmiConnection[%s]: DNS failed for %s: %s",
                  connection_id_.c_str(), ep.host.c_str(), gai_strerror(gai));
        return Result::kConnectionLost;
    }

    int fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) { freeaddrinfo(res); return Result::kConnectionLost; }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    // Non-blocking connect
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int cr = connect(fd, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);

    if (cr < 0 && errno != EINPROGRESS) {
        LOG_WARN("AmiConnection[%s]: connect to %s:%d failed: %s", connection_id_.c_str(),
                 ep.host.c_str(), ep.port, strerror(errno));
        close(fd);
        return Result::kConnectionLost;
    }

    if (cr < 0) {
        struct pollfd pfd{fd, POLLOUT, 0};
        if (poll(&pfd, 1, static_cast<int>(config_.ami_connect_timeout.count())) <= 0) {
            LOG_WARN("AmiConnection[%s]: connect to %s:%d timed out",
                     connection_id_.c_str(), ep.host.c_str(), ep.port);
            close(fd);
            return Result::kTimeout;
        }
        int sock_err = 0; socklen_t el = sizeof(sock_err);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &el);
        if (sock_err != 0) {
            LOG_WARN("AmiConnection[%s]: connect to %s:%d failed: %s", connection_id_.c_str(),
                     ep.host.c_str(), ep.port, strerror(sock_err));
            close(fd);
            return Result::kConnectionLost;
        }
    }

    if (flags >= 0) fcntl(fd, F_SETFL, flags);

    {
        std::lock_guard<std::mutex> lk(write_mu_);
        socket_fd_ = fd;
    }

    stats_.connect_successes.fetch_add(1);
    last_received_ = Clock::now();
    last_ping_sent_ = last_received_;
    parser_.reset();
    backlog_.clear();
    return Result::kOk;
}

void AmiTcpConnection::close_socket() {
    std::lock_guard<std::mutex> lk(write_mu_);
    if (socket_fd_ >= 0) { shutdown(socket_fd_, SHUT_RDWR); close(socket_fd_); socket_fd_ = -1; }
    connected_.store(false);
}

Result AmiTcpConnection::write_all(const std::string& data) {
    std::lock_guard<std::mutex> lk(write_mu_);
    if (socket_fd_ < 0) return Result::kConnectionLost;
    LOG_AMI_WIRE(connection_id_, WireDirection::kSent, data.data(), data.size());

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(socket_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("AmiConnection[%s]: send failed: %s", connection_id_.c_str(), strerror(errno));
            return Result::kConnectionLost;
        }
        sent += static_cast<size_t>(n);
    }
    return Result::kOk;
}

Result AmiTcpConnection::read_some(int timeout_ms, AmiPacketParser::ParseResult& out) {
    struct pollfd pfd{socket_fd_, POLLIN, 0};
    int pr = poll(&pfd, 1, timeout_ms);
    if (pr < 0) return errno == EINTR ? Result::kTimeout : Result::kConnectionLost;
    if (pr == 0) return Result::kTimeout;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return Result::kConnectionLost;

    ssize_t bytes = recv(socket_fd_, recv_buffer_.data(), recv_buffer_.size(), 0);
    if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) return Result::kTimeout;
    if (bytes <= 0) return Result::kConnectionLost;

    stats_.bytes_received.fetch_add(static_cast<uint64_t>(bytes));
    last_received_ = Clock::now();
    LOG_AMI_WIRE(connection_id_, WireDirection::kReceived, recv_buffer_.data(),
                 static_cast<size_t>(bytes));

    out = parser_.feed(recv_buffer_.data(), static_cast<size_t>(bytes));
    if (!out.error.empty()) stats_.parse_errors.fetch_add(1);
    if (!out.protocol_identifier.empty()) {
        std::lock_guard<std::mutex> lk(banner_mu_);
        protocol_identifier_ = out.protocol_identifier;
    }
    return Result::kOk;
}

// Runs on the caller thread for the first login and on the reader thread
// after a reconnect. Nothing else reads the socket meanwhile.
Result AmiTcpConnection::authenticate() {
    std::string id = next_action_id();
    ManagerAction action = ManagerAction::login(config_.ami_username, config_.ami_secret,
                                                events_enabled_);
    Result r = write_all(action.serialize(id));
    if (r != Result::kOk) return r;

    TimePoint deadline = Clock::now() + config_.ami_connect_timeout;
    while (!stop_requested_.load(std::memory_order_acquire)) {
        auto remaining = std::chrono::duration_cast<Millisecs>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            LOG_WARN("AmiConnection[%s]: no Login response", connection_id_.c_str());
            return Result::kTimeout;
        }

        AmiPacketParser::ParseResult pr;
        r = read_some(static_cast<int>(std::min<int64_t>(remaining.count(), kPollIntervalMs)), pr);
        if (r == Result::kTimeout) continue;
        if (r != Result::kOk) return r;

        bool done = false;
        Result outcome = Result::kOk;
        for (auto& packet : pr.packets) {
            if (done) {
                backlog_.push_back(std::move(packet));
            } else if (packet.is_response() && packet.action_id() == id) {
                done = true;
                ManagerResponse resp = build_response(packet);
                if (!resp.is_success()) {
                    LOG_ERROR("AmiConnection[%s]: login rejected for %s: %s",
                              connection_id_.c_str(), config_.ami_username.c_str(),
                              resp.message.c_str());
                    outcome = Result::kAuthenticationFailed;
                }
            }
        }
        if (done) return outcome;
    }
    return Result::kShuttingDown;
}

// -----------------------------------------------------------------------------
// Reader thread
// -----------------------------------------------------------------------------

void AmiTcpConnection::reader_thread_func() {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        read_loop();
        if (stop_requested_.load()) break;

        close_socket();
        stats_.disconnect_count.fetch_add(1);
        set_connection_state(ConnectionState::kDisconnected, "connection lost");
        LOG_WARN("AmiConnection[%s]: connection lost", connection_id_.c_str());
        fail_pending(Result::kConnectionLost);
        enqueue_event(ManagerEvent{event_seq_.fetch_add(1) + 1, "Disconnect", "",
                                   Clock::now(), DisconnectEvent{"connection lost"}});

        while (!stop_requested_.load()) {
            reconnect_with_backoff();
            if (stop_requested_.load()) break;
            if (connect_to_server() != Result::kOk) continue;

            Result r = authenticate();
            if (r != Result::kOk) {
                LOG_WARN("AmiConnection[%s]: re-login failed: %s",
                         connection_id_.c_str(), result_to_string(r));
                close_socket();
                continue;
            }

            current_backoff_ = config_.ami_reconnect_interval;
            set_connection_state(ConnectionState::kConnected, protocol_identifier());
            LOG_INFO("AmiConnection[%s]: reconnected", connection_id_.c_str());
            enqueue_event(ManagerEvent{event_seq_.fetch_add(1) + 1, "Connect", "",
                                       Clock::now(), ConnectEvent{protocol_identifier()}});
            break;
        }
    }
    close_socket();
}

void AmiTcpConnection::read_loop() {
    std::vector<AmiPacket> backlog;
    backlog.swap(backlog_);
    for (auto& packet : backlog) handle_packet(std::move(packet));

    while (!stop_requested_.load(std::memory_order_acquire)) {
        AmiPacketParser::ParseResult pr;
        Result r = read_some(kPollIntervalMs, pr);
        if (r == Result::kTimeout) {
            check_keepalive();
            if (socket_fd_ < 0) return;
            continue;
        }
        if (r != Result::kOk) return;

        for (auto& packet : pr.packets) handle_packet(std::move(packet));
    }
}

void AmiTcpConnection::check_keepalive() {
    TimePoint now = Clock::now();
    auto idle = now - last_received_;
    auto interval = config_.ami_keepalive_interval;

    if (idle > interval * config_.ami_keepalive_miss_threshold) {
        LOG_WARN("AmiConnection[%s]: keep-alive timeout (%ldms idle)", connection_id_.c_str(),
                 static_cast<long>(std::chrono::duration_cast<Millisecs>(idle).count()));
        stats_.keepalive_timeouts.fetch_add(1);
        close_socket();
        return;
    }

    if (idle > interval && now - last_ping_sent_ > interval) {
        last_ping_sent_ = now;
        Result r = write_all(ManagerAction::ping().serialize(next_action_id()));
        if (r != Result::kOk) close_socket();
    }
}

void AmiTcpConnection::reconnect_with_backoff() {
    set_connection_state(ConnectionState::kReconnecting,
                         "backoff=" + std::to_string(current_backoff_.count()) + "s");
    {
        std::unique_lock<std::mutex> lk(shutdown_mu_);
        shutdown_cv_.wait_for(lk, current_backoff_, [this] { return stop_requested_.load(); });
    }
    current_backoff_ = std::min(
        Seconds(current_backoff_.count() * 2),
        config_.ami_reconnect_max_interval);
}

void AmiTcpConnection::handle_packet(AmiPacket&& packet) {
    stats_.packets_received.fetch_add(1, std::memory_order_relaxed);

    if (packet.is_response()) {
        std::string id = packet.action_id();
        std::lock_guard<std::mutex> lk(pending_mu_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            LOG_TRACE("AmiConnection[%s]: unsolicited response id=%s",
                      connection_id_.c_str(), id.c_str());
            return;
        }
        auto& req = *it->second;
        req.response = build_response(packet);
        req.have_response = true;
        if (!req.action->is_event_generating() || !req.response.is_success())
            req.complete = true;
        pending_cv_.notify_all();
        return;
    }

    if (!packet.is_event()) {
        LOG_DEBUG("AmiConnection[%s]: dropping packet without Event/Response",
                  connection_id_.c_str());
        return;
    }

    ManagerEvent ev = build_event(packet, event_seq_.fetch_add(1) + 1);
    stats_.events_received.fetch_add(1, std::memory_order_relaxed);

    if (!ev.action_id.empty()) {
        std::lock_guard<std::mutex> lk(pending_mu_);
        auto it = pending_.find(ev.action_id);
        if (it != pending_.end()) {
            auto& req = *it->second;
            bool completion = req.action->is_completion_event(ev.name);
            req.events.push_back(std::move(ev));
            if (completion) {
                req.complete = true;
                pending_cv_.notify_all();
            }
            return;
        }
    }

    enqueue_event(std::move(ev));
}

void AmiTcpConnection::fail_pending(Result reason) {
    std::lock_guard<std::mutex> lk(pending_mu_);
    for (auto& kv : pending_) kv.second->failure = reason;
    pending_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// Actions
// -----------------------------------------------------------------------------

Result AmiTcpConnection::send_and_wait(const ManagerAction& action,
                                       std::shared_ptr<PendingRequest>& req,
                                       Millisecs timeout) {
    if (!connected_.load(std::memory_order_acquire)) return Result::kConnectionLost;

    std::string id = next_action_id();
    req = std::make_shared<PendingRequest>();
    req->action = &action;
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        pending_[id] = req;
    }

    Result w = write_all(action.serialize(id));
    if (w != Result::kOk) {
        std::lock_guard<std::mutex> lk(pending_mu_);
        pending_.erase(id);
        return w;
    }
    stats_.actions_sent.fetch_add(1, std::memory_order_relaxed);

    std::unique_lock<std::mutex> lk(pending_mu_);
    bool done = pending_cv_.wait_for(lk, timeout, [&] {
        return req->complete || req->failure != Result::kOk;
    });
    pending_.erase(id);

    if (req->failure != Result::kOk) return req->failure;
    if (!done) {
        stats_.action_timeouts.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("AmiConnection[%s]: %s id=%s timed out after %ldms (%zu events)",
                 connection_id_.c_str(), action.name().c_str(), id.c_str(),
                 static_cast<long>(timeout.count()), req->events.size());
        return Result::kTimeout;
    }
    return Result::kOk;
}

Result AmiTcpConnection::send_action(const ManagerAction& action, ManagerResponse& response,
                                     Millisecs timeout) {
    std::shared_ptr<PendingRequest> req;
    Result r = send_and_wait(action, req, timeout);
    if (req) response = std::move(req->response);
    return r;
}

Result AmiTcpConnection::send_event_generating_action(const ManagerAction& action,
                                                      ResponseEvents& result,
                                                      Millisecs timeout) {
    std::shared_ptr<PendingRequest> req;
    Result r = send_and_wait(action, req, timeout);
    if (!req) return r;

    result.response = std::move(req->response);
    result.events   = std::move(req->events);
    result.complete = req->complete;

    if (r == Result::kOk && !result.response.is_success()) {
        LOG_WARN("AmiConnection[%s]: %s failed: %s", connection_id_.c_str(),
                 action.name().c_str(), result.response.message.c_str());
        return Result::kCommandFailed;
    }
    return r;
}

// -----------------------------------------------------------------------------
// Delivery
// -----------------------------------------------------------------------------

void AmiTcpConnection::add_event_listener(ManagerEventListener* listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) return;
    listeners_.push_back(listener);
}

void AmiTcpConnection::remove_event_listener(ManagerEventListener* listener) {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void AmiTcpConnection::enqueue_event(ManagerEvent&& event) {
    {
        std::lock_guard<std::mutex> lk(queue_mu_);
        if (event_queue_.size() >= config_.ami_max_pending_events) {
            stats_.events_dropped.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("AmiConnection[%s]: queue full, dropping %s",
                     connection_id_.c_str(), event.name.c_str());
            return;
        }
        event_queue_.push_back(std::move(event));
        stats_.queue_depth.store(event_queue_.size(), std::memory_order_relaxed);
    }
    queue_cv_.notify_one();
}

// Listeners run with listeners_mu_ held: once remove_event_listener()
// returns, the listener is not being called.
void AmiTcpConnection::delivery_thread_func() {
    LOG_DEBUG("AmiConnection[%s]: delivery thread started", connection_id_.c_str());

    while (true) {
        ManagerEvent event;
        {
            std::unique_lock<std::mutex> lk(queue_mu_);
            queue_cv_.wait(lk, [this] {
                return !event_queue_.empty() || stop_requested_.load(std::memory_order_acquire);
            });
            if (stop_requested_.load() && event_queue_.empty()) break;
            if (event_queue_.empty()) continue;

            event = std::move(event_queue_.front());
            event_queue_.pop_front();
            stats_.queue_depth.store(event_queue_.size(), std::memory_order_relaxed);
        }

        std::lock_guard<std::mutex> lk(listeners_mu_);
        for (auto* listener : listeners_) listener->on_manager_event(event);
        stats_.events_delivered.fetch_add(1, std::memory_order_relaxed);
    }

    LOG_DEBUG("AmiConnection[%s]: delivery thread exiting", connection_id_.c_str());
}

} // namespace asterisk_live

// =============================================================================
// FILE: tests/test_ami_tcp_connection.cpp
//
// AmiTcpConnection against a scripted manager server on 127.0.0.1.
// =============================================================================
#include <gtest/gtest.h>
#include "manager/ami_tcp_connection.h"
#include "manager/ami_packet_parser.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

using namespace asterisk_live;

namespace {

// One client at a time; every framed action is passed to the handler and
// the returned text is written back verbatim.
class FakeAmiServer {
public:
    using Handler = std::function<std::string(const AmiPacket&)>;

    explicit FakeAmiServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(listen_fd_, 4);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { run(); });
    }

    ~FakeAmiServer() {
        stop_.store(true);
        drop_client();
        if (thread_.joinable()) thread_.join();
        close(listen_fd_);
    }

    uint16_t port() const { return port_; }
    int accept_count() const { return accepts_.load(); }

    void drop_client() {
        std::lock_guard<std::mutex> lk(mu_);
        if (client_fd_ >= 0) shutdown(client_fd_, SHUT_RDWR);
    }

    void push(const std::string& data) {
        std::lock_guard<std::mutex> lk(mu_);
        if (client_fd_ >= 0) send_all(client_fd_, data);
    }

private:
    static void send_all(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    void run() {
        while (!stop_.load()) {
            pollfd lp{listen_fd_, POLLIN, 0};
            if (poll(&lp, 1, 50) <= 0) continue;
            int fd = accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;

            {
                std::lock_guard<std::mutex> lk(mu_);
                client_fd_ = fd;
                send_all(fd, "Asterisk Call Manager/1.1\r\n");
            }
            accepts_.fetch_add(1);

            AmiPacketParser parser;
            char buf[4096];
            while (!stop_.load()) {
                pollfd cp{fd, POLLIN, 0};
                int pr = poll(&cp, 1, 50);
                if (pr == 0) continue;
                if (pr < 0) break;
                ssize_t n = recv(fd, buf, sizeof(buf), 0);
                if (n <= 0) break;
                auto result = parser.feed(buf, static_cast<size_t>(n));
                for (const auto& packet : result.packets) {
                    std::string reply = handler_(packet);
                    std::lock_guard<std::mutex> lk(mu_);
                    if (!reply.empty()) send_all(fd, reply);
                }
            }

            std::lock_guard<std::mutex> lk(mu_);
            close(fd);
            client_fd_ = -1;
        }
    }

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<int> accepts_{0};
    std::mutex mu_;
    int client_fd_ = -1;
};

std::string success(const AmiPacket& action, const std::string& extra = "") {
    return "Response: Success\r\nActionID: " + action.action_id() + "\r\n" + extra + "\r\n";
}

// Accepts secret "pw"; answers Ping, Status and Command
std::string default_handler(const AmiPacket& action) {
    std::string name = action.get("Action");
    std::string id = action.action_id();

    if (name == "Login") {
        if (action.get("Secret") != "pw")
            return "Response: Error\r\nActionID: " + id +
                   "\r\nMessage: Authentication failed\r\n\r\n";
        return success(action, "Message: Authentication accepted\r\n");
    }
    if (name == "Ping") return success(action, "Ping: Pong\r\n");
    if (name == "Status") {
        return success(action, "Message: Channel status will follow\r\n") +
               "Event: Newchannel\r\nChannel: SIP/9-1\r\nUniqueid: 9.1\r\nState: Ring\r\n\r\n" +
               "Event: Status\r\nActionID: " + id +
               "\r\nChannel: SIP/1-1\r\nUniqueid: 1.1\r\nState: Up\r\n\r\n" +
               "Event: StatusComplete\r\nActionID: " + id + "\r\nItems: 1\r\n\r\n";
    }
    if (name == "QueueStatus") {
        // Never completes
        return success(action) +
               "Event: QueueParams\r\nActionID: " + id + "\r\nQueue: support\r\n\r\n";
    }
    if (name == "Command") {
        return "Response: Follows\r\nPrivilege: Command\r\nActionID: " + id + "\r\n" +
               "Asterisk 1.4.21 built by root\r\n--END COMMAND--\r\n\r\n";
    }
    if (name == "Logoff")
        return "Response: Goodbye\r\nActionID: " + id + "\r\nMessage: Thanks\r\n\r\n";
    return "Response: Error\r\nActionID: " + id + "\r\nMessage: Invalid/unknown command\r\n\r\n";
}

class CollectingListener : public ManagerEventListener {
public:
    void on_manager_event(const ManagerEvent& event) override {
        std::lock_guard<std::mutex> lk(mu);
        events.push_back(event);
        cv.notify_all();
    }

    template <typename T>
    bool wait_for_event(Millisecs timeout) {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, timeout, [this] {
            for (const auto& e : events) if (e.is<T>()) return true;
            return false;
        });
    }

    template <typename T>
    size_t count() {
        std::lock_guard<std::mutex> lk(mu);
        size_t n = 0;
        for (const auto& e : events) if (e.is<T>()) n++;
        return n;
    }

    std::mutex mu;
    std::condition_variable cv;
    std::vector<ManagerEvent> events;
};

Config make_config(uint16_t port) {
    Config c;
    c.ami_server = {"127.0.0.1", port};
    c.ami_username = "admin";
    c.ami_secret = "pw";
    c.ami_connect_timeout = Millisecs(2000);
    c.ami_reconnect_interval = Seconds(1);
    c.ami_reconnect_max_interval = Seconds(2);
    return c;
}

} // namespace

TEST(AmiTcpConnection, LoginAndPing) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");

    ASSERT_EQ(conn.login(), Result::kOk);
    EXPECT_TRUE(conn.is_connected());
    EXPECT_EQ(conn.protocol_identifier(), "Asterisk Call Manager/1.1");

    ManagerResponse resp;
    ASSERT_EQ(conn.send_action(ManagerAction::ping(), resp, Millisecs(2000)), Result::kOk);
    EXPECT_TRUE(resp.is_success());
    EXPECT_EQ(resp.get("Ping"), "Pong");

    // Already running
    EXPECT_EQ(conn.login(), Result::kOk);
    conn.logoff();
    EXPECT_FALSE(conn.is_connected());
}

TEST(AmiTcpConnection, LoginRejected) {
    FakeAmiServer server(default_handler);
    Config c = make_config(server.port());
    c.ami_secret = "wrong";
    AmiTcpConnection conn(c, "t");

    EXPECT_EQ(conn.login(), Result::kAuthenticationFailed);
    EXPECT_FALSE(conn.is_connected());
}

TEST(AmiTcpConnection, NothingListening) {
    uint16_t port;
    {
        FakeAmiServer server(default_handler);
        port = server.port();
    }
    AmiTcpConnection conn(make_config(port), "t");
    EXPECT_NE(conn.login(), Result::kOk);

    ManagerResponse resp;
    EXPECT_EQ(conn.send_action(ManagerAction::ping(), resp, Millisecs(100)),
              Result::kConnectionLost);
}

TEST(AmiTcpConnection, StatusCollectsTaggedEventsOnly) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");
    CollectingListener listener;
    conn.add_event_listener(&listener);
    conn.add_event_listener(&listener);
    ASSERT_EQ(conn.login(), Result::kOk);

    ResponseEvents re;
    ASSERT_EQ(conn.send_event_generating_action(ManagerAction::status(), re, Millisecs(2000)),
              Result::kOk);
    EXPECT_TRUE(re.complete);
    ASSERT_EQ(re.events.size(), 2u);
    EXPECT_TRUE(re.events[0].is<StatusEvent>());
    EXPECT_TRUE(re.events[1].is<StatusCompleteEvent>());

    ASSERT_TRUE(listener.wait_for_event<NewChannelEvent>(Millisecs(2000)));
    EXPECT_EQ(listener.count<NewChannelEvent>(), 1u);
    EXPECT_EQ(listener.count<StatusEvent>(), 0u);
}

TEST(AmiTcpConnection, IncompleteBatchTimesOutWithPartialEvents) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");
    ASSERT_EQ(conn.login(), Result::kOk);

    ResponseEvents re;
    EXPECT_EQ(conn.send_event_generating_action(ManagerAction::queue_status(), re,
                                                Millisecs(300)),
              Result::kTimeout);
    EXPECT_FALSE(re.complete);
    ASSERT_EQ(re.events.size(), 1u);
    EXPECT_TRUE(re.events[0].is<QueueParamsEvent>());
    EXPECT_EQ(conn.stats().action_timeouts.load(), 1u);
}

TEST(AmiTcpConnection, ErrorResponseFailsBatch) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");
    ASSERT_EQ(conn.login(), Result::kOk);

    ManagerAction bogus("Bogus");
    bogus.complete_on("BogusComplete");
    ResponseEvents re;
    EXPECT_EQ(conn.send_event_generating_action(bogus, re, Millisecs(2000)),
              Result::kCommandFailed);
    EXPECT_EQ(re.response.message, "Invalid/unknown command");
}

TEST(AmiTcpConnection, CommandOutput) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");
    ASSERT_EQ(conn.login(), Result::kOk);

    ManagerResponse resp;
    ASSERT_EQ(conn.send_action(ManagerAction::command("show version"), resp, Millisecs(2000)),
              Result::kOk);
    ASSERT_EQ(resp.output.size(), 1u);
    EXPECT_EQ(resp.output[0], "Asterisk 1.4.21 built by root");
}

TEST(AmiTcpConnection, ReconnectsAndReportsLifecycle) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");
    CollectingListener listener;
    conn.add_event_listener(&listener);
    ASSERT_EQ(conn.login(), Result::kOk);

    server.drop_client();
    ASSERT_TRUE(listener.wait_for_event<DisconnectEvent>(Millisecs(3000)));
    ASSERT_TRUE(listener.wait_for_event<ConnectEvent>(Millisecs(5000)));
    EXPECT_EQ(server.accept_count(), 2);
    EXPECT_TRUE(conn.is_connected());
    EXPECT_EQ(conn.stats().disconnect_count.load(), 1u);

    ManagerResponse resp;
    EXPECT_EQ(conn.send_action(ManagerAction::ping(), resp, Millisecs(2000)), Result::kOk);
}

TEST(AmiTcpConnection, RemovedListenerIsNotCalled) {
    FakeAmiServer server(default_handler);
    AmiTcpConnection conn(make_config(server.port()), "t");
    CollectingListener kept, removed;
    conn.add_event_listener(&kept);
    conn.add_event_listener(&removed);
    conn.remove_event_listener(&removed);
    ASSERT_EQ(conn.login(), Result::kOk);

    server.push("Event: Hangup\r\nChannel: SIP/1-1\r\nUniqueid: 1.1\r\nCause: 16\r\n\r\n");
    ASSERT_TRUE(kept.wait_for_event<HangupEvent>(Millisecs(2000)));
    EXPECT_EQ(removed.count<HangupEvent>(), 0u);
}

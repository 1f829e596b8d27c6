// =============================================================================
// FILE: include/live/asterisk_manager.h
// =============================================================================
#ifndef LIVE_ASTERISK_MANAGER_H
#define LIVE_ASTERISK_MANAGER_H

#include "common/types.h"
#include "common/config.h"
#include "common/once_cell.h"
#include "live/channel_manager.h"
#include "live/originate_request.h"
#include "live/queue_manager.h"
#include "manager/manager_connection.h"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace asterisk_live {

class SlowEventLogger;

// Extra wait after the dial timeout for the Originate confirmation event
constexpr Millisecs kOriginateGracePeriod{2000};

// Live view of one Asterisk server.
//
// initialize() logs in (if needed), loads the current channels with Status
// and the queues with QueueStatus, then subscribes to the event stream. From
// then on every event is applied to the channel/queue registries on the
// connection's delivery thread. A disconnect clears the registries and the
// cached version data; the following reconnect reloads the snapshot.
//
// Originate and version queries go through the action connection (the event
// connection unless set_manager_connection() installed a pool).
class AsteriskManager : public ManagerEventListener {
public:
    AsteriskManager(const Config& config,
                    std::shared_ptr<ManagerConnection> event_connection,
                    std::shared_ptr<SlowEventLogger> slow_logger = nullptr);
    ~AsteriskManager() override;

    // Skip the QueueStatus snapshot (servers where it never completes or is slow)
    void set_skip_queues(bool skip) { skip_queues_.store(skip); }
    bool skip_queues() const { return skip_queues_.load(); }

    void set_manager_connection(std::shared_ptr<ManagerConnection> connection);

    // kAuthenticationFailed / kTimeout / kConnectionLost from login, kTimeout
    // when the Status snapshot does not complete. Safe to call again.
    Result initialize();

    // Unsubscribes from the event connection
    void shutdown();

    // channel is null when no confirmation arrived; that is still kOk
    Result originate_to_extension(const std::string& channel, const std::string& context,
                                  const std::string& exten, int priority, Millisecs timeout,
                                  std::shared_ptr<LiveChannel>& out,
                                  const std::map<std::string, std::string>& variables = {});
    Result originate_to_application(const std::string& channel, const std::string& application,
                                    const std::string& data, Millisecs timeout,
                                    std::shared_ptr<LiveChannel>& out,
                                    const std::map<std::string, std::string>& variables = {});
    Result originate(const OriginateRequest& request, std::shared_ptr<LiveChannel>& out);

    std::vector<std::shared_ptr<LiveChannel>> get_channels() const;
    std::shared_ptr<LiveChannel> get_channel_by_name(const std::string& name) const;
    std::shared_ptr<LiveChannel> get_channel_by_id(const std::string& unique_id) const;
    std::vector<AsteriskQueue> get_queues() const;

    // First line of "show version"; "" on any failure
    std::string get_version();

    // Revision of a source file from "show version files", e.g. {1, 234}
    std::optional<std::vector<int>> get_version(const std::string& file);

    void on_manager_event(const ManagerEvent& event) override;

    ChannelManager& channel_manager() { return channel_manager_; }
    QueueManager& queue_manager() { return queue_manager_; }

    struct Stats {
        std::atomic<uint64_t> events_dispatched{0};
        std::atomic<uint64_t> events_ignored{0};
        std::atomic<uint64_t> snapshots_loaded{0};
        std::atomic<uint64_t> snapshot_failures{0};
        std::atomic<uint64_t> partial_queue_snapshots{0};
        std::atomic<uint64_t> originates{0};
        std::atomic<uint64_t> originates_unconfirmed{0};
        std::atomic<uint64_t> disconnects{0};
    };
    const Stats& stats() const { return stats_; }

    AsteriskManager(const AsteriskManager&) = delete;
    AsteriskManager& operator=(const AsteriskManager&) = delete;

private:
    struct Dispatcher;

    Result initialize_channels();
    Result initialize_queues();
    void handle_connect(const ConnectEvent& event);
    void handle_disconnect(const DisconnectEvent& event);
    std::shared_ptr<ManagerConnection> action_connection() const;

    std::optional<std::string> fetch_version();
    std::optional<std::map<std::string, std::string>> fetch_version_files();

    Config config_;
    std::shared_ptr<ManagerConnection> event_connection_;
    std::shared_ptr<SlowEventLogger> slow_logger_;

    mutable std::mutex connection_mu_;
    std::shared_ptr<ManagerConnection> action_connection_;

    std::atomic<bool> skip_queues_;
    std::mutex snapshot_mu_;
    std::mutex subscribe_mu_;
    bool subscribed_ = false;

    ChannelManager channel_manager_;
    QueueManager queue_manager_;

    OnceCell<std::string> version_;
    OnceCell<std::map<std::string, std::string>> versions_;

    Stats stats_;
};

} // namespace asterisk_live
#endif // LIVE_ASTERISK_MANAGER_H

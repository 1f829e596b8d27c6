// =============================================================================
// FILE: include/live/channel_manager.h
// =============================================================================
#ifndef LIVE_CHANNEL_MANAGER_H
#define LIVE_CHANNEL_MANAGER_H

#include "common/types.h"
#include "live/live_channel.h"
#include "manager/manager_event.h"
#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace asterisk_live {

// Registry of live channels keyed by Asterisk unique id.
//
// Status snapshots upsert, so replaying the same snapshot twice leaves one
// entry per unique id. A Hangup removes the channel and hands it to the
// hangup callback (outside the registry lock).
class ChannelManager {
public:
    using HangupCallback = std::function<void(const std::shared_ptr<LiveChannel>&)>;

    ChannelManager() = default;

    void set_hangup_callback(HangupCallback cb);

    void handle_status_event(const StatusEvent& event);

    void handle_new_channel_event(const NewChannelEvent& event);
    void handle_new_exten_event(const NewExtenEvent& event);
    void handle_new_state_event(const NewStateEvent& event);
    void handle_new_caller_id_event(const NewCallerIdEvent& event);
    void handle_link_event(const LinkEvent& event);
    void handle_unlink_event(const UnlinkEvent& event);
    void handle_rename_event(const RenameEvent& event);
    void handle_hangup_event(const HangupEvent& event);

    std::shared_ptr<LiveChannel> get_channel_by_name(const std::string& name) const;
    std::shared_ptr<LiveChannel> get_channel_by_id(const std::string& unique_id) const;
    std::vector<std::shared_ptr<LiveChannel>> get_channels() const;
    size_t channel_count() const;

    void clear();

    struct Stats {
        std::atomic<uint64_t> channels_added{0};
        std::atomic<uint64_t> channels_hung_up{0};
        std::atomic<uint64_t> unknown_channel_events{0};
    };
    const Stats& stats() const { return stats_; }

    ChannelManager(const ChannelManager&) = delete;
    ChannelManager& operator=(const ChannelManager&) = delete;

private:
    std::shared_ptr<LiveChannel> find_or_add(const std::string& unique_id,
                                             const std::string& name);

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<LiveChannel>> channels_;

    std::mutex callback_mu_;
    HangupCallback hangup_callback_;
    Stats stats_;
};

} // namespace asterisk_live
#endif // LIVE_CHANNEL_MANAGER_H

// =============================================================================
// FILE: src/live/channel_manager.cpp
// =============================================================================
#include "live/channel_manager.h"
#include "common/logger.h"
#include <mutex>

namespace asterisk_live {

void ChannelManager::set_hangup_callback(HangupCallback cb) {
    std::lock_guard<std::mutex> lk(callback_mu_);
    hangup_callback_ = std::move(cb);
}

std::shared_ptr<LiveChannel> ChannelManager::find_or_add(const std::string& unique_id,
                                                         const std::string& name) {
    if (unique_id.empty()) {
        stats_.unknown_channel_events.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = channels_.find(unique_id);
    if (it != channels_.end()) return it->second;

    auto channel = std::make_shared<LiveChannel>(unique_id, name);
    channels_.emplace(unique_id, channel);
    stats_.channels_added.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("ChannelManager: added %s (%s), total=%zu",
              name.c_str(), unique_id.c_str(), channels_.size());
    return channel;
}

void ChannelManager::handle_status_event(const StatusEvent& event) {
    if (event.unique_id.empty()) {
        LOG_WARN("ChannelManager: Status for %s without unique id", event.channel.c_str());
        return;
    }

    auto channel = find_or_add(event.unique_id, event.channel);
    channel->set_name(event.channel);
    channel->set_state(parse_channel_state(event.state));
    channel->set_caller_id(event.caller_id_num, event.caller_id_name);
    if (!event.account_code.empty()) channel->set_account_code(event.account_code);

    if (!event.context.empty() || !event.extension.empty()) {
        ExtensionEntry ext;
        ext.context    = event.context;
        ext.extension  = event.extension;
        ext.priority   = event.priority;
        ext.entered_at = Clock::now();
        channel->add_extension(ext);
    }

    if (!event.link.empty()) {
        auto linked = get_channel_by_name(event.link);
        channel->set_linked(event.link, linked ? linked->unique_id() : "");
    }
}

void ChannelManager::handle_new_channel_event(const NewChannelEvent& event) {
    auto channel = find_or_add(event.unique_id, event.channel);
    if (!channel) return;
    channel->set_state(parse_channel_state(event.state));
    channel->set_caller_id(event.caller_id_num, event.caller_id_name);
    if (!event.account_code.empty()) channel->set_account_code(event.account_code);
}

// NewExten/NewState/NewCallerId may arrive for a channel created while the
// connection was down; such channels are added on first sight.
void ChannelManager::handle_new_exten_event(const NewExtenEvent& event) {
    auto channel = find_or_add(event.unique_id, event.channel);
    if (!channel) return;
    ExtensionEntry ext;
    ext.context     = event.context;
    ext.extension   = event.extension;
    ext.priority    = event.priority;
    ext.application = event.application;
    ext.app_data    = event.app_data;
    ext.entered_at  = Clock::now();
    channel->add_extension(ext);
}

void ChannelManager::handle_new_state_event(const NewStateEvent& event) {
    auto channel = find_or_add(event.unique_id, event.channel);
    if (!channel) return;
    channel->set_state(parse_channel_state(event.state));
    if (!event.caller_id_num.empty() || !event.caller_id_name.empty())
        channel->set_caller_id(event.caller_id_num, event.caller_id_name);
}

void ChannelManager::handle_new_caller_id_event(const NewCallerIdEvent& event) {
    auto channel = find_or_add(event.unique_id, event.channel);
    if (!channel) return;
    channel->set_caller_id(event.caller_id_num, event.caller_id_name);
}

void ChannelManager::handle_link_event(const LinkEvent& event) {
    auto c1 = get_channel_by_id(event.unique_id1);
    auto c2 = get_channel_by_id(event.unique_id2);
    if (!c1 || !c2) {
        stats_.unknown_channel_events.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("ChannelManager: Link with unknown channel %s/%s",
                  event.unique_id1.c_str(), event.unique_id2.c_str());
    }
    if (c1) c1->set_linked(event.channel2, event.unique_id2);
    if (c2) c2->set_linked(event.channel1, event.unique_id1);
}

void ChannelManager::handle_unlink_event(const UnlinkEvent& event) {
    auto c1 = get_channel_by_id(event.unique_id1);
    auto c2 = get_channel_by_id(event.unique_id2);
    if (!c1 || !c2) stats_.unknown_channel_events.fetch_add(1, std::memory_order_relaxed);
    if (c1) c1->clear_linked();
    if (c2) c2->clear_linked();
}

void ChannelManager::handle_rename_event(const RenameEvent& event) {
    auto channel = get_channel_by_id(event.unique_id);
    if (!channel) channel = get_channel_by_name(event.old_name);
    if (!channel) {
        stats_.unknown_channel_events.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("ChannelManager: Rename of unknown channel %s", event.old_name.c_str());
        return;
    }
    channel->set_name(event.new_name);
}

void ChannelManager::handle_hangup_event(const HangupEvent& event) {
    std::shared_ptr<LiveChannel> channel;
    {
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto it = channels_.find(event.unique_id);
        if (it == channels_.end()) {
            stats_.unknown_channel_events.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG("ChannelManager: Hangup of unknown channel %s (%s)",
                      event.channel.c_str(), event.unique_id.c_str());
            return;
        }
        channel = std::move(it->second);
        channels_.erase(it);
    }

    channel->set_hangup(event.cause, event.cause_text);
    stats_.channels_hung_up.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("ChannelManager: hangup %s cause=%d (%s)", event.channel.c_str(),
              event.cause, event.cause_text.c_str());

    HangupCallback cb;
    {
        std::lock_guard<std::mutex> lk(callback_mu_);
        cb = hangup_callback_;
    }
    if (cb) cb(channel);
}

std::shared_ptr<LiveChannel> ChannelManager::get_channel_by_name(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    for (const auto& kv : channels_)
        if (kv.second->name() == name) return kv.second;
    return nullptr;
}

std::shared_ptr<LiveChannel> ChannelManager::get_channel_by_id(const std::string& unique_id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = channels_.find(unique_id);
    return it != channels_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<LiveChannel>> ChannelManager::get_channels() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::shared_ptr<LiveChannel>> out;
    out.reserve(channels_.size());
    for (const auto& kv : channels_) out.push_back(kv.second);
    return out;
}

size_t ChannelManager::channel_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return channels_.size();
}

void ChannelManager::clear() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    LOG_INFO("ChannelManager: clearing %zu channels", channels_.size());
    channels_.clear();
}

} // namespace asterisk_live

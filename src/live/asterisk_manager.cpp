// =============================================================================
// FILE: src/live/asterisk_manager.cpp
// =============================================================================
#include "live/asterisk_manager.h"
#include "live/version_info.h"
#include "common/slow_event_logger.h"
#include "common/logger.h"
#include "manager/event_builder.h"
#include <variant>

namespace asterisk_live {

// Closed routing table for live events. Shapes without an overload fall into
// the template arm and are ignored.
struct AsteriskManager::Dispatcher {
    AsteriskManager& m;

    bool operator()(const ConnectEvent& e) const     { m.handle_connect(e); return true; }
    bool operator()(const DisconnectEvent& e) const  { m.handle_disconnect(e); return true; }

    bool operator()(const NewChannelEvent& e) const  { m.channel_manager_.handle_new_channel_event(e); return true; }
    bool operator()(const NewExtenEvent& e) const    { m.channel_manager_.handle_new_exten_event(e); return true; }
    bool operator()(const NewStateEvent& e) const    { m.channel_manager_.handle_new_state_event(e); return true; }
    bool operator()(const NewCallerIdEvent& e) const { m.channel_manager_.handle_new_caller_id_event(e); return true; }
    bool operator()(const LinkEvent& e) const        { m.channel_manager_.handle_link_event(e); return true; }
    bool operator()(const UnlinkEvent& e) const      { m.channel_manager_.handle_unlink_event(e); return true; }
    bool operator()(const RenameEvent& e) const      { m.channel_manager_.handle_rename_event(e); return true; }
    bool operator()(const HangupEvent& e) const      { m.channel_manager_.handle_hangup_event(e); return true; }

    bool operator()(const JoinEvent& e) const        { m.queue_manager_.handle_join_event(e); return true; }
    bool operator()(const LeaveEvent& e) const       { m.queue_manager_.handle_leave_event(e); return true; }

    template <typename T>
    bool operator()(const T&) const { return false; }
};

AsteriskManager::AsteriskManager(const Config& config,
                                 std::shared_ptr<ManagerConnection> event_connection,
                                 std::shared_ptr<SlowEventLogger> slow_logger)
    : config_(config)
    , event_connection_(std::move(event_connection))
    , slow_logger_(slow_logger ? std::move(slow_logger) : std::make_shared<SlowEventLogger>(config))
    , action_connection_(event_connection_)
    , skip_queues_(config.ami_skip_queues)
{}

AsteriskManager::~AsteriskManager() { shutdown(); }

void AsteriskManager::set_manager_connection(std::shared_ptr<ManagerConnection> connection) {
    std::lock_guard<std::mutex> lk(connection_mu_);
    action_connection_ = connection ? std::move(connection) : event_connection_;
}

std::shared_ptr<ManagerConnection> AsteriskManager::action_connection() const {
    std::lock_guard<std::mutex> lk(connection_mu_);
    return action_connection_;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

Result AsteriskManager::initialize() {
    if (!event_connection_) return Result::kInvalidArgument;

    if (!event_connection_->is_connected()) {
        Result r = event_connection_->login();
        if (r != Result::kOk) {
            LOG_ERROR("AsteriskManager: login failed: %s", result_to_string(r));
            return r;
        }
    }

    {
        std::lock_guard<std::mutex> lk(snapshot_mu_);
        Result r = initialize_channels();
        if (r != Result::kOk) return r;
        r = initialize_queues();
        if (r != Result::kOk) return r;
    }

    std::lock_guard<std::mutex> lk(subscribe_mu_);
    if (!subscribed_) {
        event_connection_->add_event_listener(this);
        subscribed_ = true;
    }
    LOG_INFO("AsteriskManager: initialized (%zu channels, %zu queues)",
             channel_manager_.channel_count(), queue_manager_.queue_count());
    return Result::kOk;
}

void AsteriskManager::shutdown() {
    std::lock_guard<std::mutex> lk(subscribe_mu_);
    if (!subscribed_) return;
    event_connection_->remove_event_listener(this);
    subscribed_ = false;
}

Result AsteriskManager::initialize_channels() {
    SlowEventLogger::Timer timer(*slow_logger_, TimedStage::kSnapshot, "Status");

    ResponseEvents re;
    Result r = event_connection_->send_event_generating_action(
        ManagerAction::status(), re, config_.ami_snapshot_timeout);
    if (r != Result::kOk) {
        stats_.snapshot_failures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("AsteriskManager: Status snapshot failed: %s (%zu events received)",
                  result_to_string(r), re.events.size());
        return r;
    }

    size_t applied = 0;
    for (const auto& ev : re.events) {
        if (const auto* status = ev.as<StatusEvent>()) {
            channel_manager_.handle_status_event(*status);
            applied++;
        }
    }
    stats_.snapshots_loaded.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("AsteriskManager: Status snapshot applied %zu channels", applied);
    return Result::kOk;
}

Result AsteriskManager::initialize_queues() {
    if (skip_queues_.load()) {
        LOG_DEBUG("AsteriskManager: queue snapshot skipped");
        return Result::kOk;
    }

    SlowEventLogger::Timer timer(*slow_logger_, TimedStage::kSnapshot, "QueueStatus");

    ResponseEvents re;
    Result r = event_connection_->send_event_generating_action(
        ManagerAction::queue_status(), re, config_.ami_snapshot_timeout);

    if (r == Result::kTimeout && !re.complete) {
        // Some servers never send QueueStatusComplete; keep what arrived
        stats_.partial_queue_snapshots.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("AsteriskManager: QueueStatus incomplete, using %zu events received",
                 re.events.size());
    } else if (r != Result::kOk) {
        stats_.snapshot_failures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("AsteriskManager: QueueStatus snapshot failed: %s", result_to_string(r));
        return r;
    }

    for (const auto& ev : re.events) {
        if (const auto* params = ev.as<QueueParamsEvent>()) {
            queue_manager_.handle_queue_params_event(*params);
        } else if (const auto* member = ev.as<QueueMemberEvent>()) {
            queue_manager_.handle_queue_member_event(*member);
        } else if (const auto* entry = ev.as<QueueEntryEvent>()) {
            queue_manager_.handle_queue_entry_event(*entry);
        }
    }
    stats_.snapshots_loaded.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("AsteriskManager: QueueStatus snapshot applied %zu queues",
             queue_manager_.queue_count());
    return Result::kOk;
}

void AsteriskManager::handle_connect(const ConnectEvent& event) {
    LOG_INFO("AsteriskManager: reconnected (%s), reloading state",
             event.protocol_identifier.c_str());

    std::lock_guard<std::mutex> lk(snapshot_mu_);
    Result r = initialize_channels();
    if (r != Result::kOk)
        LOG_ERROR("AsteriskManager: unable to initialize channels after reconnect: %s",
                  result_to_string(r));

    r = initialize_queues();
    if (r != Result::kOk)
        LOG_ERROR("AsteriskManager: unable to initialize queues after reconnect: %s",
                  result_to_string(r));
}

void AsteriskManager::handle_disconnect(const DisconnectEvent& event) {
    LOG_WARN("AsteriskManager: disconnected (%s), dropping cached state", event.reason.c_str());
    stats_.disconnects.fetch_add(1, std::memory_order_relaxed);

    // Version may change across a server restart
    version_.reset();
    versions_.reset();

    channel_manager_.clear();
    queue_manager_.clear();
}

void AsteriskManager::on_manager_event(const ManagerEvent& event) {
    SlowEventLogger::Timer timer(*slow_logger_, TimedStage::kDispatch, event.name);

    if (std::visit(Dispatcher{*this}, event.payload)) {
        stats_.events_dispatched.fetch_add(1, std::memory_order_relaxed);
    } else {
        stats_.events_ignored.fetch_add(1, std::memory_order_relaxed);
        LOG_TRACE("AsteriskManager: ignoring %s (%s)", event.name.c_str(),
                  event_type_name(event.payload));
    }
}

// -----------------------------------------------------------------------------
// Originate
// -----------------------------------------------------------------------------

Result AsteriskManager::originate_to_extension(const std::string& channel,
                                               const std::string& context,
                                               const std::string& exten, int priority,
                                               Millisecs timeout,
                                               std::shared_ptr<LiveChannel>& out,
                                               const std::map<std::string, std::string>& variables) {
    OriginateRequest req;
    req.channel   = channel;
    req.target    = ExtensionTarget{context, exten, priority};
    req.variables = variables;
    req.timeout   = timeout;
    return originate(req, out);
}

Result AsteriskManager::originate_to_application(const std::string& channel,
                                                 const std::string& application,
                                                 const std::string& data, Millisecs timeout,
                                                 std::shared_ptr<LiveChannel>& out,
                                                 const std::map<std::string, std::string>& variables) {
    OriginateRequest req;
    req.channel   = channel;
    req.target    = ApplicationTarget{application, data};
    req.variables = variables;
    req.timeout   = timeout;
    return originate(req, out);
}

Result AsteriskManager::originate(const OriginateRequest& request,
                                  std::shared_ptr<LiveChannel>& out) {
    out.reset();
    Result r = request.validate();
    if (r != Result::kOk) return r;

    auto conn = action_connection();
    if (!conn) return Result::kConnectionLost;

    stats_.originates.fetch_add(1, std::memory_order_relaxed);

    ResponseEvents re;
    r = conn->send_event_generating_action(request.to_action(), re,
                                           request.timeout + kOriginateGracePeriod);
    if (r == Result::kTimeout) {
        LOG_WARN("AsteriskManager: no Originate confirmation for %s within %ldms",
                 request.channel.c_str(),
                 static_cast<long>((request.timeout + kOriginateGracePeriod).count()));
    } else if (r != Result::kOk) {
        LOG_WARN("AsteriskManager: Originate %s failed: %s",
                 request.channel.c_str(), result_to_string(r));
        return r;
    }

    // Only the first event is the confirmation
    const OriginateResponseEvent* confirmation =
        re.events.empty() ? nullptr : re.events.front().as<OriginateResponseEvent>();
    if (!confirmation) {
        stats_.originates_unconfirmed.fetch_add(1, std::memory_order_relaxed);
        return Result::kOk;
    }

    out = channel_manager_.get_channel_by_id(confirmation->unique_id);
    LOG_DEBUG("AsteriskManager: Originate %s %s uniqueid=%s channel=%s",
              request.channel.c_str(), confirmation->success ? "succeeded" : "failed",
              confirmation->unique_id.c_str(), out ? "found" : "not found");
    return Result::kOk;
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------

std::vector<std::shared_ptr<LiveChannel>> AsteriskManager::get_channels() const {
    return channel_manager_.get_channels();
}

std::shared_ptr<LiveChannel> AsteriskManager::get_channel_by_name(const std::string& name) const {
    return channel_manager_.get_channel_by_name(name);
}

std::shared_ptr<LiveChannel> AsteriskManager::get_channel_by_id(const std::string& unique_id) const {
    return channel_manager_.get_channel_by_id(unique_id);
}

std::vector<AsteriskQueue> AsteriskManager::get_queues() const {
    return queue_manager_.get_queues();
}

// -----------------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------------

std::optional<std::string> AsteriskManager::fetch_version() {
    auto conn = action_connection();
    if (!conn || !conn->is_connected()) {
        LOG_WARN("AsteriskManager: unable to send '%s': not connected",
                 config_.ami_version_command.c_str());
        return std::nullopt;
    }

    ManagerResponse resp;
    SlowEventLogger::Timer timer(*slow_logger_, TimedStage::kAction, config_.ami_version_command);
    Result r = conn->send_action(ManagerAction::command(config_.ami_version_command), resp,
                                 config_.ami_response_timeout);
    timer.finish();
    if (r != Result::kOk || !resp.is_success()) {
        LOG_WARN("AsteriskManager: unable to send '%s': %s %s",
                 config_.ami_version_command.c_str(), result_to_string(r), resp.message.c_str());
        return std::nullopt;
    }
    if (resp.output.empty()) {
        LOG_WARN("AsteriskManager: '%s' returned no output", config_.ami_version_command.c_str());
        return std::nullopt;
    }
    return resp.output.front();
}

std::optional<std::map<std::string, std::string>> AsteriskManager::fetch_version_files() {
    auto conn = action_connection();
    if (!conn || !conn->is_connected()) {
        LOG_WARN("AsteriskManager: unable to send '%s': not connected",
                 config_.ami_version_files_command.c_str());
        return std::nullopt;
    }

    ManagerResponse resp;
    SlowEventLogger::Timer timer(*slow_logger_, TimedStage::kAction,
                                 config_.ami_version_files_command);
    Result r = conn->send_action(ManagerAction::command(config_.ami_version_files_command), resp,
                                 config_.ami_response_timeout);
    timer.finish();
    if (r != Result::kOk || !resp.is_success()) {
        LOG_WARN("AsteriskManager: unable to send '%s': %s %s",
                 config_.ami_version_files_command.c_str(), result_to_string(r),
                 resp.message.c_str());
        return std::nullopt;
    }

    auto files = parse_version_files(resp.output);
    LOG_DEBUG("AsteriskManager: loaded revisions for %zu files", files.size());
    return files;
}

std::string AsteriskManager::get_version() {
    auto version = version_.get_or_init([this] { return fetch_version(); });
    return version ? *version : std::string();
}

std::optional<std::vector<int>> AsteriskManager::get_version(const std::string& file) {
    auto files = versions_.get_or_init([this] { return fetch_version_files(); });
    if (!files) return std::nullopt;

    auto it = files->find(file);
    if (it == files->end()) return std::nullopt;
    return parse_revision(it->second);
}

} // namespace asterisk_live

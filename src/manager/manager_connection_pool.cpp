// =============================================================================
// FILE: src/manager/manager_connection_pool.cpp
// =============================================================================
#include "manager/manager_connection_pool.h"
#include "common/logger.h"

namespace asterisk_live {

ManagerConnectionPool::ManagerConnectionPool(
    std::vector<std::shared_ptr<ManagerConnection>> members)
    : members_(std::move(members))
{}

void ManagerConnectionPool::add(std::shared_ptr<ManagerConnection> member) {
    if (!member) return;
    std::lock_guard<std::mutex> lk(mu_);
    members_.push_back(std::move(member));
}

size_t ManagerConnectionPool::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return members_.size();
}

Result ManagerConnectionPool::login() {
    std::vector<std::shared_ptr<ManagerConnection>> members;
    {
        std::lock_guard<std::mutex> lk(mu_);
        members = members_;
    }
    if (members.empty()) return Result::kInvalidArgument;

    Result first_failure = Result::kOk;
    size_t ok = 0;
    for (size_t i = 0; i < members.size(); ++i) {
        Result r = members[i]->login();
        if (r == Result::kOk) {
            ok++;
        } else {
            LOG_WARN("ConnectionPool: member %zu login failed: %s", i, result_to_string(r));
            if (first_failure == Result::kOk) first_failure = r;
        }
    }
    LOG_INFO("ConnectionPool: %zu/%zu members logged in", ok, members.size());
    return ok > 0 ? Result::kOk : first_failure;
}

bool ManagerConnectionPool::is_connected() const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& m : members_)
        if (m->is_connected()) return true;
    return false;
}

std::shared_ptr<ManagerConnection> ManagerConnectionPool::next_connected() {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = members_.size();
    for (size_t i = 0; i < n; ++i) {
        size_t idx = (round_robin_index_ + i) % n;
        if (members_[idx]->is_connected()) {
            round_robin_index_ = (idx + 1) % n;
            return members_[idx];
        }
    }
    return nullptr;
}

Result ManagerConnectionPool::send_action(const ManagerAction& action,
                                          ManagerResponse& response,
                                          Millisecs timeout) {
    auto conn = next_connected();
    if (!conn) {
        LOG_WARN("ConnectionPool: no connected member for %s", action.name().c_str());
        return Result::kConnectionLost;
    }
    return conn->send_action(action, response, timeout);
}

Result ManagerConnectionPool::send_event_generating_action(const ManagerAction& action,
                                                           ResponseEvents& result,
                                                           Millisecs timeout) {
    auto conn = next_connected();
    if (!conn) {
        LOG_WARN("ConnectionPool: no connected member for %s", action.name().c_str());
        return Result::kConnectionLost;
    }
    return conn->send_event_generating_action(action, result, timeout);
}

void ManagerConnectionPool::add_event_listener(ManagerEventListener* listener) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!members_.empty()) members_.front()->add_event_listener(listener);
}

void ManagerConnectionPool::remove_event_listener(ManagerEventListener* listener) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!members_.empty()) members_.front()->remove_event_listener(listener);
}

} // namespace asterisk_live

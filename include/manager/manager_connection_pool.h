// =============================================================================
// FILE: include/manager/manager_connection_pool.h
// =============================================================================
#ifndef MANAGER_CONNECTION_POOL_H
#define MANAGER_CONNECTION_POOL_H

#include "manager/manager_connection.h"
#include <memory>
#include <mutex>
#include <vector>

namespace asterisk_live {

// Round-robin over several connections to the same server. Actions go to the
// next connected member; disconnected members are skipped. Listener
// registration is forwarded to the first member only, so each event is seen
// once.
class ManagerConnectionPool : public ManagerConnection {
public:
    ManagerConnectionPool() = default;
    explicit ManagerConnectionPool(std::vector<std::shared_ptr<ManagerConnection>> members);

    void add(std::shared_ptr<ManagerConnection> member);
    size_t size() const;

    // Logs in every member; kOk when at least one succeeded
    Result login() override;
    bool is_connected() const override;

    Result send_action(const ManagerAction& action, ManagerResponse& response,
                       Millisecs timeout) override;
    Result send_event_generating_action(const ManagerAction& action, ResponseEvents& result,
                                        Millisecs timeout) override;

    void add_event_listener(ManagerEventListener* listener) override;
    void remove_event_listener(ManagerEventListener* listener) override;

    ManagerConnectionPool(const ManagerConnectionPool&) = delete;
    ManagerConnectionPool& operator=(const ManagerConnectionPool&) = delete;

private:
    std::shared_ptr<ManagerConnection> next_connected();

    mutable std::mutex mu_;
    std::vector<std::shared_ptr<ManagerConnection>> members_;
    size_t round_robin_index_ = 0;
};

} // namespace asterisk_live
#endif // MANAGER_CONNECTION_POOL_H

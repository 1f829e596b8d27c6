// =============================================================================
// FILE: src/main.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include "common/slow_event_logger.h"
#include "manager/ami_tcp_connection.h"
#include "manager/manager_connection_pool.h"
#include "live/asterisk_manager.h"
#include "persistence/call_record.h"
#include "persistence/call_record_store.h"
#include "persistence/mongo_client.h"
#include <csignal>
#include <atomic>
#include <thread>

using namespace asterisk_live;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int sig) {
    LOG_INFO("Signal %d received", sig);
    g_shutdown.store(true, std::memory_order_release);
}

int main(int argc, char* argv[]) {
    Logger::instance().set_level(LogLevel::kInfo);
    LOG_INFO("Asterisk live mirror starting...");

    Config config = (argc > 1) ? Config::load_from_file(argv[1]) : Config::load_defaults();
    if (config.validate() != Result::kOk) {
        LOG_FATAL("Invalid configuration, exiting");
        return 1;
    }

    LoggerOptions log_opts;
    log_opts.directory      = config.log_directory;
    log_opts.base_name      = config.log_base_name;
    log_opts.console_level  = parse_log_level(config.log_console_level_str);
    log_opts.max_file_bytes = config.log_max_file_size_mb * 1024 * 1024;
    log_opts.max_files      = config.log_max_rotated_files;
    log_opts.ami_trace      = config.log_ami_trace;
    Logger::instance().configure(log_opts);
    Logger::instance().set_level(parse_log_level(config.log_level_str));

    struct sigaction sa{}; sa.sa_handler = signal_handler; sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr); sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    auto slow_logger = std::make_shared<SlowEventLogger>(config);

    // MongoDB
    std::shared_ptr<MongoClient> mongo;
    if (config.mongo_enable_persistence) {
        mongo = std::make_shared<MongoClient>(config);
        if (mongo->connect() != Result::kOk) {
            LOG_FATAL("MongoDB connection failed"); return 1;
        }
    }
    CallRecordStore call_store(config, mongo);
    if (call_store.start() != Result::kOk) { LOG_FATAL("Call record store failed"); return 1; }

    // AMI connections: one event connection plus optional action connections
    auto event_conn = std::make_shared<AmiTcpConnection>(config, "evt");
    std::vector<std::shared_ptr<AmiTcpConnection>> action_conns;
    std::shared_ptr<ManagerConnectionPool> action_pool;
    if (config.ami_action_connections > 0) {
        action_pool = std::make_shared<ManagerConnectionPool>();
        for (size_t i = 0; i < config.ami_action_connections; ++i) {
            auto conn = std::make_shared<AmiTcpConnection>(config, "act" + std::to_string(i));
            action_conns.push_back(conn);
            action_pool->add(conn);
        }
        if (action_pool->login() != Result::kOk) {
            LOG_WARN("No action connection could log in; using the event connection");
            action_pool.reset();
        }
    }

    AsteriskManager manager(config, event_conn, slow_logger);
    manager.set_skip_queues(config.ami_skip_queues);
    if (action_pool) manager.set_manager_connection(action_pool);

    manager.channel_manager().set_hangup_callback(
        [&call_store](const std::shared_ptr<LiveChannel>& channel) {
            call_store.queue_record(CallRecord::from_channel(*channel));
        });

    Result r = manager.initialize();
    if (r != Result::kOk) {
        LOG_FATAL("Initialization against %s:%d failed: %s",
                  config.ami_server.host.c_str(), config.ami_server.port, result_to_string(r));
        return 1;
    }

    LOG_INFO("Connected to Asterisk %s (service_id=%s, channels=%zu, queues=%zu)",
             manager.get_version().c_str(), config.service_id.c_str(),
             manager.channel_manager().channel_count(), manager.queue_manager().queue_count());

    uint64_t tick = 0;
    while (!g_shutdown.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(Seconds(1));
        if (++tick % 30 == 0) {
            const auto& ms = manager.stats();
            const auto& cs = event_conn->stats();
            LOG_INFO("Stats: events=%lu/%lu channels=%zu queues=%zu disconnects=%lu "
                     "calls_written=%lu ami=%s",
                     ms.events_dispatched.load(), cs.events_received.load(),
                     manager.channel_manager().channel_count(),
                     manager.queue_manager().queue_count(), ms.disconnects.load(),
                     call_store.stats().records_written.load(),
                     event_conn->is_connected() ? "connected" : "disconnected");
            if (mongo) {
                LOG_INFO("Stats: mongo ops=%lu errors=%lu avg=%.1fms queue=%lu",
                         mongo->stats().operations.load(), mongo->stats().errors.load(),
                         mongo->average_latency_ms(), call_store.stats().queue_depth.load());
            }
            if (auto worst = slow_logger->slowest()) {
                const auto& ss = slow_logger->stats();
                LOG_INFO("Stats: slow dispatch=%lu snapshot=%lu action=%lu, worst %s %s %ldms",
                         ss.slow_dispatches.load(), ss.slow_snapshots.load(),
                         ss.slow_actions.load(), timed_stage_name(worst->stage),
                         worst->subject.c_str(), static_cast<long>(worst->elapsed.count()));
            }
        }
    }

    LOG_INFO("Shutting down...");
    manager.shutdown();
    for (auto& conn : action_conns) conn->logoff();
    event_conn->logoff();
    call_store.stop();
    if (mongo) mongo->disconnect();

    LOG_INFO("Asterisk live mirror stopped cleanly.");
    return 0;
}

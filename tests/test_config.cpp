// =============================================================================
// FILE: tests/test_config.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/config.h"
#include <cstdlib>
#include <fstream>

using namespace asterisk_live;

TEST(Config, LoadDefaults) {
    auto c = Config::load_defaults();
    EXPECT_EQ(c.ami_server.host, "127.0.0.1");
    EXPECT_EQ(c.ami_server.port, 5038);
    EXPECT_FALSE(c.ami_skip_queues);
    EXPECT_EQ(c.ami_action_connections, 0u);
    EXPECT_FALSE(c.log_ami_trace);
    EXPECT_GT(c.ami_snapshot_timeout.count(), 0);
}

TEST(Config, LoadFromFile) {
    const char* path = "/tmp/test_asterisk_live.conf";
    std::ofstream f(path);
    f << "[general]\nservice_id = pbx-mirror\nlog_level = debug\n\n"
      << "[ami]\nserver = pbx1.example.com:5039\nusername = manager\n"
      << "secret = s3cret\nskip_queues = yes\naction_connections = 2\n"
      << "snapshot_timeout_ms = 2500\n\n"
      << "[mongodb]\nenable_persistence = false\nbatch_size = 50\n\n"
      << "[logging]\nami_trace = true\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.service_id, "pbx-mirror");
    EXPECT_EQ(c.log_level_str, "debug");
    EXPECT_EQ(c.ami_server.host, "pbx1.example.com");
    EXPECT_EQ(c.ami_server.port, 5039);
    EXPECT_EQ(c.ami_username, "manager");
    EXPECT_EQ(c.ami_secret, "s3cret");
    EXPECT_TRUE(c.ami_skip_queues);
    EXPECT_EQ(c.ami_action_connections, 2u);
    EXPECT_EQ(c.ami_snapshot_timeout.count(), 2500);
    EXPECT_FALSE(c.mongo_enable_persistence);
    EXPECT_EQ(c.mongo_batch_size, 50u);
    EXPECT_TRUE(c.log_ami_trace);

    remove(path);
}

TEST(Config, ServerWithoutPortUsesDefault) {
    const char* path = "/tmp/test_asterisk_server.conf";
    std::ofstream f(path);
    f << "[ami]\nserver = pbx2\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.ami_server.host, "pbx2");
    EXPECT_EQ(c.ami_server.port, 5038);

    remove(path);
}

TEST(Config, SecretFromEnvironment) {
    setenv("ASTERISK_LIVE_TEST_SECRET", "from-env", 1);
    const char* path = "/tmp/test_asterisk_env.conf";
    std::ofstream f(path);
    f << "[ami]\nsecret = ${ASTERISK_LIVE_TEST_SECRET}\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.ami_secret, "from-env");

    remove(path);
    unsetenv("ASTERISK_LIVE_TEST_SECRET");
}

TEST(Config, MissingFileFallsBackToDefaults) {
    auto c = Config::load_from_file("/tmp/does-not-exist-asterisk-live.conf");
    EXPECT_EQ(c.ami_server.port, 5038);
}

TEST(Config, DefaultsAreValid) {
    EXPECT_EQ(Config::load_defaults().validate(), Result::kOk);
}

TEST(Config, ValidateRejectsBadSettings) {
    Config c;
    c.ami_snapshot_timeout = Millisecs(0);
    EXPECT_EQ(c.validate(), Result::kInvalidArgument);

    c = Config{};
    c.ami_action_connections = Config::kMaxActionConnections + 1;
    EXPECT_EQ(c.validate(), Result::kInvalidArgument);

    c = Config{};
    c.slow_event_warn_threshold = Millisecs(500);
    c.slow_event_error_threshold = Millisecs(100);
    EXPECT_EQ(c.validate(), Result::kInvalidArgument);

    c = Config{};
    c.mongo_batch_size = 0;
    EXPECT_EQ(c.validate(), Result::kInvalidArgument);
    c.mongo_enable_persistence = false;
    EXPECT_EQ(c.validate(), Result::kOk);
}

TEST(Config, AsteriskStyleBooleans) {
    const char* path = "/tmp/test_asterisk_bools.conf";
    std::ofstream f(path);
    f << "[ami]\nskip_queues = On\n\n"
      << "[mongodb]\nenable_persistence = off\n\n"
      << "[logging]\nami_trace = maybe\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_TRUE(c.ami_skip_queues);
    EXPECT_FALSE(c.mongo_enable_persistence);
    EXPECT_FALSE(c.log_ami_trace);  // unparseable keeps the default

    remove(path);
}

TEST(Config, AsteriskConfSyntax) {
    const char* path = "/tmp/test_asterisk_syntax.conf";
    std::ofstream f(path);
    f << "; generated by provisioning\n"
      << "[ami](+)\n"
      << "server => pbx3.example.com:5040 ; primary\n"
      << "username = mirror\n"
      << "secret = a\\;b\n"
      << "# legacy comment\n"
      << "not a setting\n";
    f.close();

    auto c = Config::load_from_file(path);
    EXPECT_EQ(c.ami_server.host, "pbx3.example.com");
    EXPECT_EQ(c.ami_server.port, 5040);
    EXPECT_EQ(c.ami_username, "mirror");
    EXPECT_EQ(c.ami_secret, "a;b");

    remove(path);
}
